#include "store/chunk_store.hpp"
#include "store/store_error.hpp"
#include "utilities/blockio.hpp"
#include "utilities/digest.hpp"
#include "utilities/logger.h"
#include "utilities/metrics.h"
#include "utilities/var_dir.hpp"

#include <fstream>
#include <istream>
#include <ostream>
#include <sodium.h>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace chunkvault {

namespace {

constexpr const char *TEMP_MARKER = ".tmp.";
constexpr const char *TOMBSTONE_SUFFIX = ".del";

void logMessage(LogLevel level, const std::string &message) {
  Logger::getInstance().log(level, message);
}

void countMetric(const std::string &name, double value = 1.0) {
  MetricsRegistry::instance().incrementCounter(name, value);
}

[[noreturn]] void integrityFailure(const std::string &message) {
  logMessage(LogLevel::ERROR, message);
  countMetric("chunkvault_integrity_failures_total");
  throw StoreError(StoreError::Kind::Integrity, message);
}

void removeQuietly(const fs::path &path) {
  std::error_code ec;
  fs::remove(path, ec);
  if (ec) {
    logMessage(LogLevel::WARN,
               "Could not remove " + path.string() + ": " + ec.message());
  }
}

bool isStrayName(const std::string &name) {
  return name.find(TEMP_MARKER) != std::string::npos ||
         name.ends_with(TOMBSTONE_SUFFIX);
}

StoreOptions normalizeOptions(StoreOptions options) {
  if (options.storageRoot.empty()) {
    options.storageRoot = defaultStorageRoot();
  }
  if (options.connectionPoolSize == 0) {
    throw StoreError(StoreError::Kind::Config,
                     "connection pool size must be positive");
  }
  if (options.busyTimeoutMs < 0) {
    throw StoreError(StoreError::Kind::Config,
                     "busy timeout must not be negative");
  }
  return options;
}

StorageCodec makeCodec(const StoreOptions &options) {
  try {
    return StorageCodec(options.compressionEnabled, options.compressionLevel);
  } catch (const std::invalid_argument &e) {
    throw StoreError(StoreError::Kind::Config, e.what());
  }
}

// Deletes a payload that has no row. The write lock keeps a concurrent
// store from inserting the row and placing the same path meanwhile.
bool removeOrphan(Database &db, const std::string &hash, const fs::path &path) {
  Transaction tx(db);
  if (ChunkRepository(db).exists(hash)) {
    tx.rollback();
    return false;
  }
  std::error_code ec;
  bool removed = fs::remove(path, ec);
  tx.commit();
  if (ec) {
    logMessage(LogLevel::WARN, "Could not remove orphaned chunk " +
                                   path.string() + ": " + ec.message());
    return false;
  }
  return removed;
}

} // namespace

const char *ChunkIssue::problemName(Problem problem) {
  switch (problem) {
  case Problem::MissingRow:
    return "missing metadata";
  case Problem::MissingPayload:
    return "missing payload";
  case Problem::Undecodable:
    return "undecodable payload";
  case Problem::SizeMismatch:
    return "size mismatch";
  case Problem::HashMismatch:
    return "hash mismatch";
  }
  return "unknown";
}

ChunkStore::ChunkStore(StoreOptions options)
    : options_(normalizeOptions(std::move(options))),
      chunker_(options_.chunkSize), codec_(makeCodec(options_)),
      chunksDir_(chunksDir(options_.storageRoot)),
      pool_(metadataDbPath(options_.storageRoot), options_.connectionPoolSize,
            options_.busyTimeoutMs) {
  initialize();
}

void ChunkStore::initialize() {
  std::error_code ec;
  fs::create_directories(chunksDir_, ec);
  if (ec) {
    throw StoreError(StoreError::Kind::Io, "cannot create " +
                                               chunksDir_.string() + ": " +
                                               ec.message());
  }

  auto db = pool_.acquire();
  Transaction tx(*db);
  ChunkRepository::createSchema(*db);
  FileMappingRepository::createSchema(*db);
  pinChunkSize(*db);
  tx.commit();

  logMessage(LogLevel::INFO,
             "Chunk store opened at " + options_.storageRoot +
                 " (chunk size " + std::to_string(options_.chunkSize) +
                 ", compression " +
                 (codec_.enabled() ? "level " +
                                         std::to_string(codec_.compressionLevel())
                                   : std::string("off")) +
                 ")");
}

void ChunkStore::pinChunkSize(Database &db) {
  db.exec("CREATE TABLE IF NOT EXISTS store_settings ("
          "key TEXT PRIMARY KEY, value TEXT NOT NULL)");

  const std::string configured = std::to_string(options_.chunkSize);
  {
    Statement sel(db,
                  "SELECT value FROM store_settings WHERE key = 'chunk_size'");
    if (sel.step()) {
      std::string pinned = sel.columnText(0);
      if (pinned != configured) {
        throw StoreError(StoreError::Kind::Config,
                         "store at " + options_.storageRoot +
                             " was created with chunk size " + pinned +
                             ", refusing to open it with " + configured);
      }
      return;
    }
  }
  Statement ins(db, "INSERT INTO store_settings (key, value) "
                    "VALUES ('chunk_size', ?)");
  ins.bind(1, configured);
  ins.run();
}

fs::path ChunkStore::chunkPath(const std::string &hash) const {
  return chunksDir_ / hash.substr(0, 2) / hash;
}

// ---- chunk level -----------------------------------------------------------

StoreChunkResult ChunkStore::storeChunk(std::span<const std::byte> data,
                                        const std::string &hash) {
  if (!utils::is_valid_hex_digest(hash) || BlockIO::hash_hex(data) != hash) {
    throw StoreError(StoreError::Kind::InvalidArgument,
                     "hash " + hash + " does not match the chunk data");
  }
  auto db = pool_.acquire();
  return placeChunk(*db, data, hash);
}

StoreChunkResult ChunkStore::placeChunk(Database &db,
                                        std::span<const std::byte> data,
                                        const std::string &hash) {
  ChunkRepository chunks(db);
  const fs::path finalPath = chunkPath(hash);

  if (chunks.incrementRef(hash)) {
    countMetric("chunkvault_dedup_hits_total");
    return {false, finalPath.string()};
  }

  std::vector<std::byte> payload = codec_.compressForStorage(data);
  const fs::path tempPath = writeTempPayload(finalPath, payload);
  try {
    Transaction tx(db);
    bool placed = false;
    try {
      ChunkRecord record;
      record.hash = hash;
      record.size = data.size();
      record.compressedSize = payload.size();
      record.storagePath = finalPath.string();
      chunks.insert(record);
    } catch (const SqliteError &e) {
      if (!e.isUniqueViolation()) {
        throw;
      }
      // Another writer created the row after our fast path missed.
      removeQuietly(tempPath);
      if (!chunks.incrementRef(hash)) {
        throw StoreError(StoreError::Kind::Metadata,
                         "chunk " + hash + " vanished during race recovery");
      }
      tx.commit();
      logMessage(LogLevel::WARN, "Recovered concurrent store of chunk " + hash);
      countMetric("chunkvault_store_races_total");
      countMetric("chunkvault_dedup_hits_total");
      return {false, finalPath.string()};
    }

    // The placed payload must go while the write lock is still held.
    try {
      std::error_code ec;
      fs::rename(tempPath, finalPath, ec);
      if (ec) {
        throw StoreError(StoreError::Kind::Io, "cannot place chunk payload " +
                                                   finalPath.string() + ": " +
                                                   ec.message());
      }
      placed = true;
      tx.commit();
    } catch (const std::exception &) {
      if (placed) {
        removeQuietly(finalPath);
      }
      throw;
    }
  } catch (const std::exception &e) {
    removeQuietly(tempPath);
    logMessage(LogLevel::ERROR,
               "Storing chunk " + hash + " failed: " + std::string(e.what()));
    throw;
  }

  countMetric("chunkvault_chunks_written_total");
  countMetric("chunkvault_raw_bytes_written_total",
              static_cast<double>(data.size()));
  countMetric("chunkvault_persisted_bytes_written_total",
              static_cast<double>(payload.size()));
  return {true, finalPath.string()};
}

fs::path ChunkStore::writeTempPayload(const fs::path &finalPath,
                                      std::span<const std::byte> payload) {
  std::error_code ec;
  fs::create_directories(finalPath.parent_path(), ec);
  if (ec) {
    throw StoreError(StoreError::Kind::Io,
                     "cannot create " + finalPath.parent_path().string() +
                         ": " + ec.message());
  }

  BlockIO::ensure_sodium();
  fs::path tempPath = finalPath;
  tempPath += TEMP_MARKER + std::to_string(randombytes_random());

  std::ofstream out(tempPath, std::ios::binary | std::ios::trunc);
  if (!out) {
    throw StoreError(StoreError::Kind::Io,
                     "cannot create temporary payload " + tempPath.string());
  }
  out.write(reinterpret_cast<const char *>(payload.data()),
            static_cast<std::streamsize>(payload.size()));
  out.flush();
  out.close();
  if (out.fail()) {
    removeQuietly(tempPath);
    throw StoreError(StoreError::Kind::Io,
                     "short write to temporary payload " + tempPath.string());
  }
  return tempPath;
}

std::optional<std::vector<std::byte>>
ChunkStore::readChunk(const std::string &hash) {
  std::optional<ChunkRecord> record;
  {
    auto db = pool_.acquire();
    record = ChunkRepository(*db).find(hash);
  }
  if (!record) {
    return std::nullopt;
  }
  auto payload = readPayload(*record);
  if (!payload) {
    return std::nullopt;
  }
  return decodePayload(*record, *payload);
}

bool ChunkStore::releaseChunk(const std::string &hash) {
  auto db = pool_.acquire();
  ChunkRepository chunks(*db);
  Transaction tx(*db);
  std::vector<Tombstone> graves;
  DeleteResult result = decrementChunks(chunks, {hash}, graves);
  commitRetirement(tx, graves);
  if (result.deletedChunks > 0) {
    countMetric("chunkvault_chunks_deleted_total");
  }
  return result.deletedChunks > 0;
}

int64_t ChunkStore::getRefCount(const std::string &hash) {
  auto db = pool_.acquire();
  return ChunkRepository(*db).getRefCount(hash);
}

bool ChunkStore::chunkExists(const std::string &hash) {
  auto db = pool_.acquire();
  return ChunkRepository(*db).exists(hash);
}

// ---- file level ------------------------------------------------------------

void ChunkStore::addToPending(Database &db, PendingFile &pending,
                              Chunk &&chunk) {
  StoreChunkResult placed = placeChunk(db, chunk.data, chunk.hash);
  pending.chunkHashes.push_back(chunk.hash);
  if (placed.isNew) {
    ++pending.newChunks;
  }
  pending.totalSize += chunk.size;

  MappingEntry entry;
  entry.chunkHash = std::move(chunk.hash);
  entry.chunkIndex = chunk.index;
  entry.chunkOffset = chunk.offset;
  entry.chunkSize = chunk.size;
  pending.manifest.push_back(std::move(entry));
}

StoreResult ChunkStore::commitFile(Database &db, PendingFile &pending) {
  StoreResult result;
  result.fileHash = Chunker::fileHash(pending.chunkHashes);
  result.totalSize = pending.totalSize;
  result.chunkCount = pending.manifest.size();
  result.newChunks = pending.newChunks;

  FileMappingRepository files(db);
  Transaction tx(db);
  if (!files.findFileRef(result.fileHash)) {
    files.replaceMapping(result.fileHash, pending.manifest);
  }
  int64_t holders =
      files.addHolder(result.fileHash, result.totalSize, result.chunkCount);
  tx.commit();

  countMetric("chunkvault_files_stored_total");
  logMessage(LogLevel::DEBUG,
             "Stored file " + result.fileHash + " (" +
                 std::to_string(result.totalSize) + " bytes, " +
                 std::to_string(result.chunkCount) + " chunks, " +
                 std::to_string(result.newChunks) + " new, " +
                 std::to_string(holders) + " holders)");
  return result;
}

void ChunkStore::releaseAcquired(Database &db,
                                 const std::vector<std::string> &hashes) {
  if (hashes.empty()) {
    return;
  }
  try {
    ChunkRepository chunks(db);
    Transaction tx(db);
    std::vector<Tombstone> graves;
    decrementChunks(chunks, hashes, graves);
    commitRetirement(tx, graves);
    logMessage(LogLevel::WARN, "Released " + std::to_string(hashes.size()) +
                                   " chunk references after a failed store");
  } catch (const StoreError &e) {
    logMessage(LogLevel::ERROR,
               "Could not release chunk references after a failed store: " +
                   std::string(e.what()));
  }
}

StoreResult ChunkStore::storeFile(std::span<const std::byte> data) {
  auto db = pool_.acquire();
  PendingFile pending;
  try {
    for (Chunk &chunk : chunker_.split(data)) {
      addToPending(*db, pending, std::move(chunk));
    }
    return commitFile(*db, pending);
  } catch (const std::exception &) {
    releaseAcquired(*db, pending.chunkHashes);
    throw;
  }
}

StoreResult ChunkStore::storeFile(const std::string &data) {
  return storeFile(std::as_bytes(std::span<const char>(data.data(), data.size())));
}

StoreResult ChunkStore::storeFileStream(std::istream &in) {
  auto db = pool_.acquire();
  PendingFile pending;
  try {
    chunker_.forEachChunk(in, [this, &db, &pending](Chunk &&chunk) {
      addToPending(*db, pending, std::move(chunk));
    });
    return commitFile(*db, pending);
  } catch (const std::exception &) {
    releaseAcquired(*db, pending.chunkHashes);
    throw;
  }
}

std::optional<ChunkStore::FilePlan>
ChunkStore::loadFilePlan(const std::string &fileHash) {
  auto db = pool_.acquire();
  ChunkRepository chunks(*db);
  FileMappingRepository files(*db);
  Transaction tx(*db, Transaction::Mode::Deferred);

  auto ref = files.findFileRef(fileHash);
  if (!ref) {
    tx.commit();
    return std::nullopt;
  }
  FilePlan plan;
  plan.ref = *ref;
  for (auto &entry : files.getFileChunks(fileHash)) {
    PlannedChunk planned;
    planned.record = chunks.find(entry.chunkHash);
    planned.entry = std::move(entry);
    plan.chunks.push_back(std::move(planned));
  }
  tx.commit();
  return plan;
}

bool ChunkStore::forEachFileChunk(
    const std::string &fileHash,
    const std::function<void(std::span<const std::byte>)> &sink) {
  auto plan = loadFilePlan(fileHash);
  if (!plan) {
    return false;
  }
  if (plan->chunks.size() != plan->ref.chunkCount) {
    integrityFailure("file " + fileHash + " should have " +
                     std::to_string(plan->ref.chunkCount) +
                     " chunks but its manifest lists " +
                     std::to_string(plan->chunks.size()));
  }

  for (const auto &chunk : plan->chunks) {
    const std::string where = "chunk " + std::to_string(chunk.entry.chunkIndex) +
                              " (" + chunk.entry.chunkHash + ") of file " +
                              fileHash;
    if (!chunk.record) {
      integrityFailure(where + " has no metadata row");
    }
    auto payload = readPayload(*chunk.record);
    if (!payload) {
      integrityFailure(where + " has no payload at " +
                       chunkPath(chunk.record->hash).string());
    }
    std::vector<std::byte> bytes = decodePayload(*chunk.record, *payload);
    if (bytes.size() != chunk.entry.chunkSize) {
      integrityFailure(where + " decoded to " + std::to_string(bytes.size()) +
                       " bytes, expected " +
                       std::to_string(chunk.entry.chunkSize));
    }
    sink(bytes);
  }
  return true;
}

std::optional<std::vector<std::byte>>
ChunkStore::readFile(const std::string &fileHash) {
  std::vector<std::byte> out;
  bool found = forEachFileChunk(fileHash, [&out](std::span<const std::byte> b) {
    out.insert(out.end(), b.begin(), b.end());
  });
  if (!found) {
    return std::nullopt;
  }
  return out;
}

bool ChunkStore::readFileTo(const std::string &fileHash, std::ostream &out) {
  return forEachFileChunk(
      fileHash, [&out, &fileHash](std::span<const std::byte> b) {
        out.write(reinterpret_cast<const char *>(b.data()),
                  static_cast<std::streamsize>(b.size()));
        if (!out) {
          throw StoreError(StoreError::Kind::Io,
                           "writing file " + fileHash + " to output failed");
        }
      });
}

std::optional<std::vector<std::byte>>
ChunkStore::readPayload(const ChunkRecord &record) {
  const fs::path path = chunkPath(record.hash);
  std::error_code ec;
  auto length = fs::file_size(path, ec);
  if (ec) {
    if (ec == std::errc::no_such_file_or_directory) {
      return std::nullopt;
    }
    throw StoreError(StoreError::Kind::Io,
                     "cannot stat " + path.string() + ": " + ec.message());
  }

  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw StoreError(StoreError::Kind::Io, "cannot open " + path.string());
  }
  std::vector<std::byte> payload(static_cast<size_t>(length));
  in.read(reinterpret_cast<char *>(payload.data()),
          static_cast<std::streamsize>(payload.size()));
  if (static_cast<uintmax_t>(in.gcount()) != length) {
    throw StoreError(StoreError::Kind::Io, "short read from " + path.string());
  }
  return payload;
}

std::optional<std::vector<std::byte>>
ChunkStore::tryDecode(const ChunkRecord &record,
                      std::span<const std::byte> payload, std::string &error) {
  if (payload.size() != record.compressedSize) {
    error = "payload of chunk " + record.hash + " is " +
            std::to_string(payload.size()) + " bytes, expected " +
            std::to_string(record.compressedSize);
    return std::nullopt;
  }
  if (!record.isCompressed()) {
    return std::vector<std::byte>(payload.begin(), payload.end());
  }
  try {
    return StorageCodec::decompressExact(payload, record.size);
  } catch (const std::runtime_error &e) {
    error = "chunk " + record.hash + " does not decode: " + e.what();
    return std::nullopt;
  }
}

std::vector<std::byte>
ChunkStore::decodePayload(const ChunkRecord &record,
                          std::span<const std::byte> payload) {
  std::string error;
  auto bytes = tryDecode(record, payload, error);
  if (!bytes) {
    integrityFailure(error);
  }
  return std::move(*bytes);
}

// ---- reference management --------------------------------------------------

DeleteResult
ChunkStore::decrementChunks(ChunkRepository &chunks,
                            const std::vector<std::string> &hashes,
                            std::vector<Tombstone> &graves) {
  DeleteResult result;
  try {
    for (const auto &hash : hashes) {
      auto dec = chunks.decrementRef(hash);
      if (!dec.found) {
        logMessage(LogLevel::WARN,
                   "Skipping reference to unknown chunk " + hash);
        continue;
      }
      if (!dec.removed) {
        ++result.remainingChunks;
        continue;
      }
      ++result.deletedChunks;

      Tombstone grave;
      grave.live = chunkPath(hash);
      grave.grave = grave.live;
      grave.grave += TOMBSTONE_SUFFIX;
      std::error_code ec;
      fs::rename(grave.live, grave.grave, ec);
      if (ec == std::errc::no_such_file_or_directory) {
        logMessage(LogLevel::WARN,
                   "Payload of chunk " + hash + " was already missing");
        continue;
      }
      if (ec) {
        throw StoreError(StoreError::Kind::Io, "cannot retire payload " +
                                                   grave.live.string() + ": " +
                                                   ec.message());
      }
      graves.push_back(std::move(grave));
    }
  } catch (const std::exception &) {
    restoreTombstones(graves);
    throw;
  }
  return result;
}

void ChunkStore::restoreTombstones(std::vector<Tombstone> &graves) {
  for (const auto &grave : graves) {
    std::error_code ec;
    fs::rename(grave.grave, grave.live, ec);
    if (ec) {
      logMessage(LogLevel::ERROR, "Could not restore payload " +
                                      grave.live.string() + ": " +
                                      ec.message());
    }
  }
  graves.clear();
}

void ChunkStore::commitRetirement(Transaction &tx,
                                  std::vector<Tombstone> &graves) {
  try {
    tx.commit();
  } catch (const StoreError &) {
    restoreTombstones(graves);
    throw;
  }
  for (const auto &grave : graves) {
    removeQuietly(grave.grave);
  }
  graves.clear();
}

DeleteResult ChunkStore::deleteFile(const std::string &fileHash) {
  auto db = pool_.acquire();
  ChunkRepository chunks(*db);
  FileMappingRepository files(*db);
  Transaction tx(*db);

  auto remaining = files.releaseHolder(fileHash);
  if (!remaining) {
    tx.rollback();
    return {};
  }

  std::vector<std::string> hashes;
  if (*remaining == 0) {
    hashes = files.deleteMapping(fileHash);
  } else {
    for (const auto &entry : files.getFileChunks(fileHash)) {
      hashes.push_back(entry.chunkHash);
    }
  }

  std::vector<Tombstone> graves;
  DeleteResult result = decrementChunks(chunks, hashes, graves);
  commitRetirement(tx, graves);

  countMetric("chunkvault_chunks_deleted_total",
              static_cast<double>(result.deletedChunks));
  logMessage(LogLevel::DEBUG,
             "Released file " + fileHash + " (" +
                 std::to_string(*remaining) + " holders left, " +
                 std::to_string(result.deletedChunks) + " chunks deleted, " +
                 std::to_string(result.remainingChunks) + " kept)");
  return result;
}

int64_t ChunkStore::incRef(const std::string &fileHash) {
  auto db = pool_.acquire();
  ChunkRepository chunks(*db);
  FileMappingRepository files(*db);
  Transaction tx(*db);

  auto ref = files.findFileRef(fileHash);
  if (!ref) {
    tx.rollback();
    return 0;
  }
  for (const auto &entry : files.getFileChunks(fileHash)) {
    if (!chunks.incrementRef(entry.chunkHash)) {
      integrityFailure("file " + fileHash + " references missing chunk " +
                       entry.chunkHash);
    }
  }
  int64_t holders = files.addHolder(fileHash, ref->totalSize, ref->chunkCount);
  tx.commit();
  return holders;
}

bool ChunkStore::fileExists(const std::string &fileHash) {
  auto db = pool_.acquire();
  return FileMappingRepository(*db).findFileRef(fileHash).has_value();
}

std::optional<FileInfo> ChunkStore::getFileInfo(const std::string &fileHash) {
  auto plan = loadFilePlan(fileHash);
  if (!plan) {
    return std::nullopt;
  }
  FileInfo info;
  info.fileHash = fileHash;
  info.totalSize = plan->ref.totalSize;
  info.chunkCount = plan->ref.chunkCount;
  info.holders = plan->ref.refCount;
  for (const auto &chunk : plan->chunks) {
    ChunkDescriptor d;
    d.hash = chunk.entry.chunkHash;
    d.index = chunk.entry.chunkIndex;
    d.offset = chunk.entry.chunkOffset;
    d.size = chunk.entry.chunkSize;
    d.storedSize = chunk.record ? chunk.record->compressedSize : 0;
    info.chunks.push_back(std::move(d));
  }
  return info;
}

std::vector<std::string>
ChunkStore::getChunkFiles(const std::string &chunkHash) {
  auto db = pool_.acquire();
  return FileMappingRepository(*db).getChunkFiles(chunkHash);
}

std::optional<VerifyReport>
ChunkStore::verifyFile(const std::string &fileHash) {
  auto plan = loadFilePlan(fileHash);
  if (!plan) {
    return std::nullopt;
  }

  VerifyReport report;
  report.fileHash = fileHash;
  for (const auto &chunk : plan->chunks) {
    ++report.chunksChecked;
    auto flag = [&](ChunkIssue::Problem problem, std::string detail) {
      ChunkIssue issue;
      issue.index = chunk.entry.chunkIndex;
      issue.hash = chunk.entry.chunkHash;
      issue.problem = problem;
      issue.detail = std::move(detail);
      report.issues.push_back(std::move(issue));
    };

    if (!chunk.record) {
      flag(ChunkIssue::Problem::MissingRow, "no metadata row");
      continue;
    }
    std::optional<std::vector<std::byte>> payload;
    try {
      payload = readPayload(*chunk.record);
    } catch (const StoreError &e) {
      flag(ChunkIssue::Problem::MissingPayload, e.what());
      continue;
    }
    if (!payload) {
      flag(ChunkIssue::Problem::MissingPayload,
           "no file at " + chunkPath(chunk.record->hash).string());
      continue;
    }
    std::string error;
    auto bytes = tryDecode(*chunk.record, *payload, error);
    if (!bytes) {
      flag(ChunkIssue::Problem::Undecodable, error);
      continue;
    }
    if (bytes->size() != chunk.entry.chunkSize) {
      flag(ChunkIssue::Problem::SizeMismatch,
           "decoded " + std::to_string(bytes->size()) + " bytes, expected " +
               std::to_string(chunk.entry.chunkSize));
      continue;
    }
    report.bytesChecked += bytes->size();
    std::string actual = BlockIO::hash_hex(*bytes);
    if (actual != chunk.entry.chunkHash) {
      flag(ChunkIssue::Problem::HashMismatch, "content hashes to " + actual);
    }
  }

  if (!report.ok()) {
    countMetric("chunkvault_integrity_failures_total",
                static_cast<double>(report.issues.size()));
    logMessage(LogLevel::WARN, "Verification of file " + fileHash + " found " +
                                   std::to_string(report.issues.size()) +
                                   " damaged chunks");
  }
  return report;
}

// ---- maintenance -----------------------------------------------------------

StorageStats ChunkStore::getStorageStats() {
  auto db = pool_.acquire();
  Transaction tx(*db, Transaction::Mode::Deferred);
  ChunkTotals totals = ChunkRepository(*db).totals();
  uint64_t files = FileMappingRepository(*db).fileCount();
  tx.commit();

  StorageStats stats;
  stats.totalChunks = totals.totalChunks;
  stats.totalRefs = totals.totalRefs;
  stats.totalSize = totals.totalSize;
  stats.totalCompressedSize = totals.totalCompressedSize;
  stats.totalFiles = files;
  if (stats.totalSize > 0) {
    stats.compressionRatio = static_cast<double>(stats.totalCompressedSize) /
                             static_cast<double>(stats.totalSize);
  }
  if (stats.totalFiles > 0) {
    stats.avgChunksPerFile = static_cast<double>(stats.totalRefs) /
                             static_cast<double>(stats.totalFiles);
  }
  return stats;
}

size_t ChunkStore::cleanupOrphanedChunks() {
  return static_cast<size_t>(scanOrphanedChunks(false).removedChunks);
}

GCStats ChunkStore::scanOrphanedChunks(bool dryRun) {
  GCStats stats;
  std::error_code ec;
  if (!fs::is_directory(chunksDir_, ec)) {
    return stats;
  }

  const auto now = fs::file_time_type::clock::now();
  auto db = pool_.acquire();
  ChunkRepository chunks(*db);

  fs::directory_iterator shards(chunksDir_, ec);
  if (ec) {
    throw StoreError(StoreError::Kind::Io, "cannot list " +
                                               chunksDir_.string() + ": " +
                                               ec.message());
  }
  for (const auto &shard : shards) {
    if (!shard.is_directory(ec)) {
      continue;
    }
    fs::directory_iterator entries(shard.path(), ec);
    if (ec) {
      throw StoreError(StoreError::Kind::Io, "cannot list " +
                                                 shard.path().string() + ": " +
                                                 ec.message());
    }
    for (const auto &entry : entries) {
      if (!entry.is_regular_file(ec)) {
        continue;
      }
      ++stats.scannedFiles;
      const std::string name = entry.path().filename().string();

      if (isStrayName(name)) {
        auto modified = entry.last_write_time(ec);
        if (ec || now - modified < STRAY_GRACE_PERIOD) {
          continue;
        }
        ++stats.strayFiles;
        if (!dryRun) {
          removeQuietly(entry.path());
        }
        continue;
      }
      if (!utils::is_valid_hex_digest(name) || chunks.exists(name)) {
        continue;
      }

      uint64_t size = entry.file_size(ec);
      if (ec) {
        size = 0;
      }
      ++stats.orphanedChunks;
      stats.orphanedBytes += size;
      if (!dryRun && removeOrphan(*db, name, entry.path())) {
        ++stats.removedChunks;
        stats.removedBytes += size;
      }
    }
  }

  if (stats.removedChunks > 0) {
    countMetric("chunkvault_orphans_removed_total",
                static_cast<double>(stats.removedChunks));
  }
  logMessage(LogLevel::INFO,
             std::string(dryRun ? "Orphan scan (dry run): " : "Orphan scan: ") +
                 std::to_string(stats.scannedFiles) + " files scanned, " +
                 std::to_string(stats.orphanedChunks) + " orphaned, " +
                 std::to_string(stats.removedChunks) + " removed, " +
                 std::to_string(stats.strayFiles) + " stray");
  return stats;
}

} // namespace chunkvault
