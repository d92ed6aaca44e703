#include "gtest/gtest.h"
#include "test_helpers.hpp"
#include "utilities/sqlite_db.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>

using namespace chunkvault;

namespace {

std::string dbPath(const test_helpers::TempDir &dir) {
  return (dir.path() / "test.db").string();
}

int64_t countRows(Database &db) {
  Statement st(db, "SELECT COUNT(*) FROM kv");
  return st.step() ? st.columnInt64(0) : -1;
}

} // namespace

class SqliteDbTest : public ::testing::Test {
protected:
  void SetUp() override {
    db_ = std::make_unique<Database>(dbPath(dir_), 1000);
    db_->exec("CREATE TABLE kv (k TEXT PRIMARY KEY, v INTEGER)");
  }

  test_helpers::TempDir dir_;
  std::unique_ptr<Database> db_;
};

TEST_F(SqliteDbTest, OpensInWalMode) {
  Statement st(*db_, "PRAGMA journal_mode");
  ASSERT_TRUE(st.step());
  EXPECT_EQ(st.columnText(0), "wal");
}

TEST_F(SqliteDbTest, BindStepAndColumns) {
  {
    Statement ins(*db_, "INSERT INTO kv (k, v) VALUES (?, ?)");
    ins.bind(1, std::string("alpha")).bind(2, int64_t{42});
    ins.run();
  }
  EXPECT_EQ(db_->changes(), 1);

  Statement sel(*db_, "SELECT k, v FROM kv WHERE k = ?");
  sel.bind(1, std::string("alpha"));
  ASSERT_TRUE(sel.step());
  EXPECT_EQ(sel.columnText(0), "alpha");
  EXPECT_EQ(sel.columnInt64(1), 42);
  EXPECT_FALSE(sel.step());

  sel.reset();
  sel.bind(1, std::string("missing"));
  EXPECT_FALSE(sel.step());
}

TEST_F(SqliteDbTest, UniqueViolationIsReported) {
  db_->exec("INSERT INTO kv (k, v) VALUES ('dup', 1)");
  Statement ins(*db_, "INSERT INTO kv (k, v) VALUES ('dup', 2)");
  try {
    ins.run();
    FAIL() << "expected a constraint violation";
  } catch (const SqliteError &e) {
    EXPECT_TRUE(e.isUniqueViolation());
    EXPECT_EQ(e.kind(), StoreError::Kind::Metadata);
  }
}

TEST_F(SqliteDbTest, BadSqlThrows) {
  EXPECT_THROW({ Statement st(*db_, "SELEC nonsense"); }, SqliteError);
  EXPECT_THROW(db_->exec("DROP TABLE nope"), SqliteError);
}

TEST_F(SqliteDbTest, TransactionCommitAndRollback) {
  {
    Transaction tx(*db_);
    db_->exec("INSERT INTO kv (k, v) VALUES ('kept', 1)");
    tx.commit();
    EXPECT_FALSE(tx.active());
  }
  {
    Transaction tx(*db_);
    db_->exec("INSERT INTO kv (k, v) VALUES ('dropped', 1)");
    tx.rollback();
  }
  {
    // Destructor rolls back an unfinished transaction.
    Transaction tx(*db_, Transaction::Mode::Deferred);
    db_->exec("INSERT INTO kv (k, v) VALUES ('abandoned', 1)");
  }
  EXPECT_EQ(countRows(*db_), 1);
}

TEST_F(SqliteDbTest, ImmediateTransactionBlocksOtherWriters) {
  Database other(dbPath(dir_), 50);
  Transaction tx(*db_);
  try {
    Transaction second(other);
    FAIL() << "second writer should time out";
  } catch (const SqliteError &e) {
    EXPECT_EQ(e.code() & 0xff, SQLITE_BUSY);
    EXPECT_FALSE(e.isUniqueViolation());
  }
  tx.commit();
  EXPECT_NO_THROW(Transaction(other).commit());
}

TEST(ConnectionPoolTest, LeasesAreReused) {
  test_helpers::TempDir dir;
  ConnectionPool pool(dbPath(dir), 2, 1000);
  Database *first = nullptr;
  {
    auto lease = pool.acquire();
    first = &*lease;
    lease->exec("CREATE TABLE t (x INTEGER)");
  }
  auto again = pool.acquire();
  EXPECT_EQ(&*again, first);
  EXPECT_EQ(pool.path(), dbPath(dir));
}

TEST(ConnectionPoolTest, AcquireWaitsForRelease) {
  test_helpers::TempDir dir;
  ConnectionPool pool(dbPath(dir), 1, 1000);
  std::atomic<bool> acquired{false};

  std::thread waiter;
  {
    auto lease = pool.acquire();
    waiter = std::thread([&] {
      auto second = pool.acquire();
      acquired = true;
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    EXPECT_FALSE(acquired.load());
  }
  waiter.join();
  EXPECT_TRUE(acquired.load());
}

TEST(ConnectionPoolTest, MovedLeaseReturnsOnce) {
  test_helpers::TempDir dir;
  ConnectionPool pool(dbPath(dir), 1, 1000);
  {
    auto lease = pool.acquire();
    auto moved = std::move(lease);
    moved->exec("CREATE TABLE t (x INTEGER)");
  }
  // A double return would leave two idle handles; one acquire must still
  // succeed and the pool must remain usable.
  auto lease = pool.acquire();
  EXPECT_NO_THROW(lease->exec("INSERT INTO t VALUES (1)"));
}
