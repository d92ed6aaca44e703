#include "store/chunker.hpp"
#include "store/store_error.hpp"
#include "utilities/blockio.hpp"

#include <algorithm>
#include <string>
#include <utility>

namespace chunkvault {

Chunker::Chunker(size_t chunkSize) : chunkSize_(chunkSize) {
  if (chunkSize_ == 0) {
    throw StoreError(StoreError::Kind::Config, "chunk size must be positive");
  }
}

std::vector<Chunk> Chunker::split(std::span<const std::byte> data) const {
  std::vector<Chunk> chunks;
  chunks.reserve((data.size() + chunkSize_ - 1) / chunkSize_);

  uint64_t offset = 0;
  uint32_t index = 0;
  while (offset < data.size()) {
    size_t len = std::min<uint64_t>(chunkSize_, data.size() - offset);
    auto slice = data.subspan(offset, len);

    Chunk c;
    c.data.assign(slice.begin(), slice.end());
    c.hash = BlockIO::hash_hex(slice);
    c.index = index++;
    c.offset = offset;
    c.size = len;
    chunks.push_back(std::move(c));

    offset += len;
  }
  return chunks;
}

uint64_t Chunker::forEachChunk(std::istream &in,
                               const std::function<void(Chunk &&)> &visit) const {
  uint64_t offset = 0;
  uint32_t index = 0;
  bool atEnd = false;

  while (!atEnd) {
    std::vector<std::byte> buffer(chunkSize_);
    size_t filled = 0;
    while (filled < chunkSize_) {
      in.read(reinterpret_cast<char *>(buffer.data() + filled),
              static_cast<std::streamsize>(chunkSize_ - filled));
      filled += static_cast<size_t>(in.gcount());
      if (in.bad()) {
        throw StoreError(StoreError::Kind::Io,
                         "input stream failed after " +
                             std::to_string(offset + filled) + " bytes");
      }
      if (in.eof()) {
        atEnd = true;
        break;
      }
      if (in.fail()) {
        throw StoreError(StoreError::Kind::Io,
                         "input stream failed after " +
                             std::to_string(offset + filled) + " bytes");
      }
    }
    if (filled == 0) {
      break;
    }
    buffer.resize(filled);

    Chunk c;
    c.hash = BlockIO::hash_hex(buffer);
    c.data = std::move(buffer);
    c.index = index++;
    c.offset = offset;
    c.size = filled;
    offset += filled;
    visit(std::move(c));
  }
  return offset;
}

std::vector<Chunk> Chunker::splitStream(std::istream &in) const {
  std::vector<Chunk> chunks;
  forEachChunk(in, [&chunks](Chunk &&c) { chunks.push_back(std::move(c)); });
  return chunks;
}

std::string Chunker::fileHash(const std::vector<std::string> &chunkHashes) {
  BlockIO bio;
  for (const auto &h : chunkHashes) {
    bio.ingest(std::as_bytes(std::span<const char>(h.data(), h.size())));
  }
  return bio.finalize_hashed().hex;
}

std::string Chunker::fileHash(const std::vector<Chunk> &chunks) {
  std::vector<std::string> hashes;
  hashes.reserve(chunks.size());
  for (const auto &c : chunks) {
    hashes.push_back(c.hash);
  }
  return fileHash(hashes);
}

} // namespace chunkvault
