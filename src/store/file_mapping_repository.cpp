#include "store/file_mapping_repository.hpp"

#include <ctime>

namespace chunkvault {

void FileMappingRepository::createSchema(Database &db) {
  db.exec(R"SQL(
    CREATE TABLE IF NOT EXISTS file_chunk_mappings (
      file_hash TEXT NOT NULL,
      chunk_index INTEGER NOT NULL CHECK (chunk_index >= 0),
      chunk_hash TEXT NOT NULL,
      chunk_offset INTEGER NOT NULL CHECK (chunk_offset >= 0),
      chunk_size INTEGER NOT NULL CHECK (chunk_size > 0),
      PRIMARY KEY (file_hash, chunk_index)
    );
    CREATE INDEX IF NOT EXISTS idx_chunk_file
      ON file_chunk_mappings (chunk_hash, file_hash);

    CREATE TABLE IF NOT EXISTS file_refs (
      file_hash TEXT PRIMARY KEY,
      ref_count INTEGER NOT NULL CHECK (ref_count >= 0),
      total_size INTEGER NOT NULL,
      chunk_count INTEGER NOT NULL,
      created_at INTEGER NOT NULL
    );
  )SQL");
}

std::vector<std::string>
FileMappingRepository::replaceMapping(const std::string &fileHash,
                                      const std::vector<MappingEntry> &entries) {
  std::vector<std::string> replaced = deleteMapping(fileHash);

  Statement ins(db_, "INSERT INTO file_chunk_mappings (file_hash, chunk_index, "
                     "chunk_hash, chunk_offset, chunk_size) "
                     "VALUES (?, ?, ?, ?, ?)");
  for (const auto &e : entries) {
    ins.reset();
    ins.bind(1, fileHash)
        .bind(2, static_cast<int64_t>(e.chunkIndex))
        .bind(3, e.chunkHash)
        .bind(4, static_cast<int64_t>(e.chunkOffset))
        .bind(5, static_cast<int64_t>(e.chunkSize));
    ins.run();
  }
  return replaced;
}

std::vector<MappingEntry>
FileMappingRepository::getFileChunks(const std::string &fileHash) {
  Statement st(db_, "SELECT chunk_hash, chunk_index, chunk_offset, chunk_size "
                    "FROM file_chunk_mappings WHERE file_hash = ? "
                    "ORDER BY chunk_index");
  st.bind(1, fileHash);
  std::vector<MappingEntry> out;
  while (st.step()) {
    MappingEntry e;
    e.chunkHash = st.columnText(0);
    e.chunkIndex = static_cast<uint32_t>(st.columnInt64(1));
    e.chunkOffset = static_cast<uint64_t>(st.columnInt64(2));
    e.chunkSize = static_cast<uint64_t>(st.columnInt64(3));
    out.push_back(std::move(e));
  }
  return out;
}

std::vector<std::string>
FileMappingRepository::deleteMapping(const std::string &fileHash) {
  std::vector<std::string> hashes;
  {
    Statement sel(db_, "SELECT chunk_hash FROM file_chunk_mappings "
                       "WHERE file_hash = ? ORDER BY chunk_index");
    sel.bind(1, fileHash);
    while (sel.step()) {
      hashes.push_back(sel.columnText(0));
    }
  }
  if (!hashes.empty()) {
    Statement del(db_, "DELETE FROM file_chunk_mappings WHERE file_hash = ?");
    del.bind(1, fileHash);
    del.run();
  }
  return hashes;
}

std::vector<std::string>
FileMappingRepository::getChunkFiles(const std::string &chunkHash) {
  Statement st(db_, "SELECT DISTINCT file_hash FROM file_chunk_mappings "
                    "WHERE chunk_hash = ? ORDER BY file_hash");
  st.bind(1, chunkHash);
  std::vector<std::string> out;
  while (st.step()) {
    out.push_back(st.columnText(0));
  }
  return out;
}

std::optional<FileRefRecord>
FileMappingRepository::findFileRef(const std::string &fileHash) {
  Statement st(db_, "SELECT file_hash, ref_count, total_size, chunk_count "
                    "FROM file_refs WHERE file_hash = ?");
  st.bind(1, fileHash);
  if (!st.step()) {
    return std::nullopt;
  }
  FileRefRecord r;
  r.fileHash = st.columnText(0);
  r.refCount = st.columnInt64(1);
  r.totalSize = static_cast<uint64_t>(st.columnInt64(2));
  r.chunkCount = static_cast<uint64_t>(st.columnInt64(3));
  return r;
}

int64_t FileMappingRepository::addHolder(const std::string &fileHash,
                                         uint64_t totalSize,
                                         uint64_t chunkCount) {
  {
    Statement up(db_, "INSERT INTO file_refs (file_hash, ref_count, "
                      "total_size, chunk_count, created_at) "
                      "VALUES (?, 1, ?, ?, ?) "
                      "ON CONFLICT(file_hash) DO UPDATE SET "
                      "ref_count = ref_count + 1");
    up.bind(1, fileHash)
        .bind(2, static_cast<int64_t>(totalSize))
        .bind(3, static_cast<int64_t>(chunkCount))
        .bind(4, static_cast<int64_t>(std::time(nullptr)));
    up.run();
  }
  Statement sel(db_, "SELECT ref_count FROM file_refs WHERE file_hash = ?");
  sel.bind(1, fileHash);
  return sel.step() ? sel.columnInt64(0) : 0;
}

std::optional<int64_t>
FileMappingRepository::releaseHolder(const std::string &fileHash) {
  {
    Statement up(db_, "UPDATE file_refs SET ref_count = MAX(ref_count - 1, 0) "
                      "WHERE file_hash = ?");
    up.bind(1, fileHash);
    up.run();
    if (db_.changes() == 0) {
      return std::nullopt;
    }
  }
  int64_t remaining = 0;
  {
    Statement sel(db_, "SELECT ref_count FROM file_refs WHERE file_hash = ?");
    sel.bind(1, fileHash);
    if (sel.step())
      remaining = sel.columnInt64(0);
  }
  if (remaining == 0) {
    Statement del(db_, "DELETE FROM file_refs WHERE file_hash = ?");
    del.bind(1, fileHash);
    del.run();
  }
  return remaining;
}

uint64_t FileMappingRepository::fileCount() {
  Statement st(db_, "SELECT COUNT(*) FROM file_refs");
  return st.step() ? static_cast<uint64_t>(st.columnInt64(0)) : 0;
}

} // namespace chunkvault
