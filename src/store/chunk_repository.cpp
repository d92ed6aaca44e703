#include "store/chunk_repository.hpp"

#include <ctime>

namespace chunkvault {

void ChunkRepository::createSchema(Database &db) {
  db.exec(R"SQL(
    CREATE TABLE IF NOT EXISTS chunks (
      id INTEGER PRIMARY KEY AUTOINCREMENT,
      hash TEXT NOT NULL UNIQUE,
      size INTEGER NOT NULL CHECK (size >= 0),
      compressed_size INTEGER NOT NULL CHECK (compressed_size >= 0),
      ref_count INTEGER NOT NULL DEFAULT 1 CHECK (ref_count >= 0),
      storage_path TEXT NOT NULL,
      created_at INTEGER NOT NULL
    );
  )SQL");
}

std::optional<ChunkRecord> ChunkRepository::find(const std::string &hash) {
  Statement st(db_, "SELECT hash, size, compressed_size, ref_count, "
                    "storage_path FROM chunks WHERE hash = ?");
  st.bind(1, hash);
  if (!st.step()) {
    return std::nullopt;
  }
  ChunkRecord r;
  r.hash = st.columnText(0);
  r.size = static_cast<uint64_t>(st.columnInt64(1));
  r.compressedSize = static_cast<uint64_t>(st.columnInt64(2));
  r.refCount = st.columnInt64(3);
  r.storagePath = st.columnText(4);
  return r;
}

bool ChunkRepository::exists(const std::string &hash) {
  Statement st(db_, "SELECT 1 FROM chunks WHERE hash = ? LIMIT 1");
  st.bind(1, hash);
  return st.step();
}

int64_t ChunkRepository::getRefCount(const std::string &hash) {
  Statement st(db_, "SELECT ref_count FROM chunks WHERE hash = ?");
  st.bind(1, hash);
  return st.step() ? st.columnInt64(0) : 0;
}

bool ChunkRepository::incrementRef(const std::string &hash) {
  Statement st(db_,
               "UPDATE chunks SET ref_count = ref_count + 1 WHERE hash = ?");
  st.bind(1, hash);
  st.run();
  return db_.changes() > 0;
}

void ChunkRepository::insert(const ChunkRecord &record) {
  Statement st(db_, "INSERT INTO chunks (hash, size, compressed_size, "
                    "ref_count, storage_path, created_at) "
                    "VALUES (?, ?, ?, 1, ?, ?)");
  st.bind(1, record.hash)
      .bind(2, static_cast<int64_t>(record.size))
      .bind(3, static_cast<int64_t>(record.compressedSize))
      .bind(4, record.storagePath)
      .bind(5, static_cast<int64_t>(std::time(nullptr)));
  st.run();
}

ChunkRepository::DecrementResult
ChunkRepository::decrementRef(const std::string &hash) {
  DecrementResult result;
  {
    Statement st(db_, "UPDATE chunks SET ref_count = MAX(ref_count - 1, 0) "
                      "WHERE hash = ?");
    st.bind(1, hash);
    st.run();
    if (db_.changes() == 0) {
      return result;
    }
  }
  result.found = true;

  Statement sel(db_, "SELECT ref_count FROM chunks WHERE hash = ?");
  sel.bind(1, hash);
  if (!sel.step()) {
    // Updated a moment ago inside the same transaction.
    db_.raise(SQLITE_INTERNAL, "chunk row vanished during decrement: " + hash);
  }
  result.refCount = sel.columnInt64(0);

  if (result.refCount <= 0) {
    Statement del(db_, "DELETE FROM chunks WHERE hash = ?");
    del.bind(1, hash);
    del.run();
    result.refCount = 0;
    result.removed = true;
  }
  return result;
}

ChunkTotals ChunkRepository::totals() {
  Statement st(db_, "SELECT COUNT(*), COALESCE(SUM(ref_count), 0), "
                    "COALESCE(SUM(size), 0), COALESCE(SUM(compressed_size), 0) "
                    "FROM chunks");
  ChunkTotals t;
  if (st.step()) {
    t.totalChunks = static_cast<uint64_t>(st.columnInt64(0));
    t.totalRefs = static_cast<uint64_t>(st.columnInt64(1));
    t.totalSize = static_cast<uint64_t>(st.columnInt64(2));
    t.totalCompressedSize = static_cast<uint64_t>(st.columnInt64(3));
  }
  return t;
}

} // namespace chunkvault
