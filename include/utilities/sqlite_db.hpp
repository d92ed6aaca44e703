#ifndef CHUNKVAULT_SQLITE_DB_HPP
#define CHUNKVAULT_SQLITE_DB_HPP

#include "store/store_error.hpp"

#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <sqlite3.h>
#include <string>
#include <vector>

namespace chunkvault {

/**
 * @brief Metadata failure carrying the SQLite extended result code.
 */
class SqliteError : public StoreError {
public:
  SqliteError(int code, const std::string &message);

  int code() const noexcept { return code_; }
  bool isUniqueViolation() const noexcept;

private:
  int code_;
};

/**
 * @brief Owning handle for one SQLite connection.
 *
 * A connection must only be used by one thread at a time; ConnectionPool
 * hands connections out accordingly.
 */
class Database {
public:
  Database(const std::string &path, int busyTimeoutMs);
  ~Database();

  Database(const Database &) = delete;
  Database &operator=(const Database &) = delete;

  void exec(const std::string &sql);
  sqlite3 *handle() const { return db_; }
  int changes() const;
  const std::string &path() const { return path_; }

  /// Throw a SqliteError for @p rc using this connection's message.
  [[noreturn]] void raise(int rc, const std::string &context) const;

private:
  sqlite3 *db_ = nullptr;
  std::string path_;
};

/**
 * @brief Prepared statement bound to a Database, finalized on destruction.
 */
class Statement {
public:
  Statement(Database &db, const char *sql);
  ~Statement();

  Statement(const Statement &) = delete;
  Statement &operator=(const Statement &) = delete;

  // Parameter indices are 1-based, as in sqlite3_bind_*.
  Statement &bind(int index, const std::string &value);
  Statement &bind(int index, int64_t value);

  /// Advance; returns true while a row is available.
  bool step();
  /// Run a statement that returns no rows.
  void run();
  void reset();

  std::string columnText(int col) const;
  int64_t columnInt64(int col) const;

private:
  Database &db_;
  sqlite3_stmt *stmt_ = nullptr;
  std::string sql_;
};

/**
 * @brief Scoped transaction; rolls back unless commit() was reached.
 */
class Transaction {
public:
  enum class Mode { Deferred, Immediate };

  explicit Transaction(Database &db, Mode mode = Mode::Immediate);
  ~Transaction();

  Transaction(const Transaction &) = delete;
  Transaction &operator=(const Transaction &) = delete;

  void commit();
  void rollback();
  bool active() const { return active_; }

private:
  Database &db_;
  bool active_ = false;
};

/**
 * @brief Fixed-size pool of connections to one database file.
 *
 * Connections are opened lazily. acquire() blocks while every connection is
 * leased; the pool mutex is held only while handing connections out and
 * taking them back.
 */
class ConnectionPool {
public:
  class Lease {
  public:
    Lease(ConnectionPool &pool, std::unique_ptr<Database> db);
    ~Lease();
    Lease(Lease &&other) noexcept;
    Lease(const Lease &) = delete;
    Lease &operator=(const Lease &) = delete;
    Lease &operator=(Lease &&) = delete;

    Database &operator*() const { return *db_; }
    Database *operator->() const { return db_.get(); }

  private:
    ConnectionPool *pool_;
    std::unique_ptr<Database> db_;
  };

  ConnectionPool(std::string path, size_t size, int busyTimeoutMs);

  Lease acquire();
  const std::string &path() const { return path_; }

private:
  void release(std::unique_ptr<Database> db);

  std::string path_;
  size_t size_;
  int busyTimeoutMs_;
  size_t opened_ = 0;
  std::vector<std::unique_ptr<Database>> idle_;
  std::mutex mutex_;
  std::condition_variable available_;
};

} // namespace chunkvault

#endif // CHUNKVAULT_SQLITE_DB_HPP
