#include "utilities/sqlite_db.hpp"
#include "utilities/logger.h"

#include <utility>

namespace chunkvault {

SqliteError::SqliteError(int code, const std::string &message)
    : StoreError(StoreError::Kind::Metadata, message), code_(code) {}

bool SqliteError::isUniqueViolation() const noexcept {
  return code_ == SQLITE_CONSTRAINT_UNIQUE ||
         code_ == SQLITE_CONSTRAINT_PRIMARYKEY;
}

// ---------------------------------------------------------------------------
// Database

Database::Database(const std::string &path, int busyTimeoutMs) : path_(path) {
  const int flags =
      SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX;
  int rc = sqlite3_open_v2(path.c_str(), &db_, flags, nullptr);
  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
    sqlite3_close(db_);
    db_ = nullptr;
    throw SqliteError(rc, "cannot open " + path + ": " + msg);
  }
  sqlite3_extended_result_codes(db_, 1);
  sqlite3_busy_timeout(db_, busyTimeoutMs);
  try {
    exec("PRAGMA journal_mode = WAL");
    exec("PRAGMA synchronous = NORMAL");
    exec("PRAGMA foreign_keys = ON");
  } catch (const SqliteError &) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

Database::~Database() {
  if (db_) {
    sqlite3_close(db_);
  }
}

void Database::exec(const std::string &sql) {
  char *err_msg = nullptr;
  int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err_msg);
  if (rc != SQLITE_OK) {
    std::string msg = err_msg ? err_msg : sqlite3_errstr(rc);
    sqlite3_free(err_msg);
    throw SqliteError(sqlite3_extended_errcode(db_),
                      "exec failed (" + msg + ") for: " + sql);
  }
}

int Database::changes() const { return sqlite3_changes(db_); }

void Database::raise(int rc, const std::string &context) const {
  int code = sqlite3_extended_errcode(db_);
  if (code == SQLITE_OK)
    code = rc;
  throw SqliteError(code, context + ": " + sqlite3_errmsg(db_));
}

// ---------------------------------------------------------------------------
// Statement

Statement::Statement(Database &db, const char *sql) : db_(db), sql_(sql) {
  int rc = sqlite3_prepare_v2(db_.handle(), sql, -1, &stmt_, nullptr);
  if (rc != SQLITE_OK) {
    db_.raise(rc, "prepare failed for: " + sql_);
  }
}

Statement::~Statement() { sqlite3_finalize(stmt_); }

Statement &Statement::bind(int index, const std::string &value) {
  int rc = sqlite3_bind_text(stmt_, index, value.data(),
                             static_cast<int>(value.size()), SQLITE_TRANSIENT);
  if (rc != SQLITE_OK)
    db_.raise(rc, "bind failed for: " + sql_);
  return *this;
}

Statement &Statement::bind(int index, int64_t value) {
  int rc = sqlite3_bind_int64(stmt_, index, value);
  if (rc != SQLITE_OK)
    db_.raise(rc, "bind failed for: " + sql_);
  return *this;
}

bool Statement::step() {
  int rc = sqlite3_step(stmt_);
  if (rc == SQLITE_ROW)
    return true;
  if (rc == SQLITE_DONE)
    return false;
  db_.raise(rc, "step failed for: " + sql_);
}

void Statement::run() {
  while (step()) {
  }
}

void Statement::reset() {
  sqlite3_reset(stmt_);
  sqlite3_clear_bindings(stmt_);
}

std::string Statement::columnText(int col) const {
  const unsigned char *text = sqlite3_column_text(stmt_, col);
  if (!text)
    return {};
  return std::string(reinterpret_cast<const char *>(text),
                     static_cast<size_t>(sqlite3_column_bytes(stmt_, col)));
}

int64_t Statement::columnInt64(int col) const {
  return sqlite3_column_int64(stmt_, col);
}

// ---------------------------------------------------------------------------
// Transaction

Transaction::Transaction(Database &db, Mode mode) : db_(db) {
  db_.exec(mode == Mode::Immediate ? "BEGIN IMMEDIATE" : "BEGIN");
  active_ = true;
}

Transaction::~Transaction() {
  if (!active_)
    return;
  try {
    rollback();
  } catch (const std::exception &e) {
    Logger::getInstance().log(LogLevel::ERROR,
                              std::string("Rollback failed on ") + db_.path() +
                                  ": " + e.what());
  }
}

void Transaction::commit() {
  db_.exec("COMMIT");
  active_ = false;
}

void Transaction::rollback() {
  active_ = false;
  db_.exec("ROLLBACK");
}

// ---------------------------------------------------------------------------
// ConnectionPool

ConnectionPool::Lease::Lease(ConnectionPool &pool, std::unique_ptr<Database> db)
    : pool_(&pool), db_(std::move(db)) {}

ConnectionPool::Lease::Lease(Lease &&other) noexcept
    : pool_(other.pool_), db_(std::move(other.db_)) {}

ConnectionPool::Lease::~Lease() {
  if (db_) {
    pool_->release(std::move(db_));
  }
}

ConnectionPool::ConnectionPool(std::string path, size_t size, int busyTimeoutMs)
    : path_(std::move(path)), size_(size == 0 ? 1 : size),
      busyTimeoutMs_(busyTimeoutMs) {}

ConnectionPool::Lease ConnectionPool::acquire() {
  std::unique_lock<std::mutex> lock(mutex_);
  available_.wait(lock, [this] { return !idle_.empty() || opened_ < size_; });
  if (!idle_.empty()) {
    auto db = std::move(idle_.back());
    idle_.pop_back();
    return Lease(*this, std::move(db));
  }
  ++opened_;
  lock.unlock();
  try {
    return Lease(*this, std::make_unique<Database>(path_, busyTimeoutMs_));
  } catch (const StoreError &) {
    lock.lock();
    --opened_;
    available_.notify_one();
    throw;
  }
}

void ConnectionPool::release(std::unique_ptr<Database> db) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    idle_.push_back(std::move(db));
  }
  available_.notify_one();
}

} // namespace chunkvault
