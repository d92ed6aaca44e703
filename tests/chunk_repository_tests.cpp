#include "gtest/gtest.h"
#include "test_helpers.hpp"
#include "store/chunk_repository.hpp"
#include "utilities/blockio.hpp"
#include <memory>
#include <string>

using namespace chunkvault;

class ChunkRepositoryTest : public ::testing::Test {
protected:
  void SetUp() override {
    db_ = std::make_unique<Database>((dir_.path() / "meta.db").string(), 1000);
    ChunkRepository::createSchema(*db_);
    repo_ = std::make_unique<ChunkRepository>(*db_);
  }

  ChunkRecord record(const std::string &content, uint64_t stored) {
    ChunkRecord r;
    r.hash = BlockIO::hash_hex(content);
    r.size = content.size();
    r.compressedSize = stored;
    r.storagePath = "/tmp/" + r.hash;
    return r;
  }

  test_helpers::TempDir dir_;
  std::unique_ptr<Database> db_;
  std::unique_ptr<ChunkRepository> repo_;
};

TEST_F(ChunkRepositoryTest, InsertAndFind) {
  ChunkRecord r = record("hello chunk", 8);
  repo_->insert(r);

  auto found = repo_->find(r.hash);
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(found->hash, r.hash);
  EXPECT_EQ(found->size, 11u);
  EXPECT_EQ(found->compressedSize, 8u);
  EXPECT_EQ(found->refCount, 1);
  EXPECT_EQ(found->storagePath, r.storagePath);
  EXPECT_TRUE(found->isCompressed());
  EXPECT_TRUE(repo_->exists(r.hash));
}

TEST_F(ChunkRepositoryTest, UnknownHashIsNotAnError) {
  std::string missing = BlockIO::hash_hex(std::string("missing"));
  EXPECT_FALSE(repo_->find(missing).has_value());
  EXPECT_FALSE(repo_->exists(missing));
  EXPECT_EQ(repo_->getRefCount(missing), 0);
  EXPECT_FALSE(repo_->incrementRef(missing));

  auto dec = repo_->decrementRef(missing);
  EXPECT_FALSE(dec.found);
  EXPECT_FALSE(dec.removed);
}

TEST_F(ChunkRepositoryTest, DuplicateInsertIsUniqueViolation) {
  ChunkRecord r = record("dup", 3);
  repo_->insert(r);
  try {
    repo_->insert(r);
    FAIL() << "expected SqliteError";
  } catch (const SqliteError &e) {
    EXPECT_TRUE(e.isUniqueViolation());
  }
  EXPECT_EQ(repo_->getRefCount(r.hash), 1);
}

TEST_F(ChunkRepositoryTest, DecrementDeletesRowAtZero) {
  ChunkRecord r = record("counted", 7);
  repo_->insert(r);
  EXPECT_TRUE(repo_->incrementRef(r.hash));
  EXPECT_EQ(repo_->getRefCount(r.hash), 2);

  auto first = repo_->decrementRef(r.hash);
  EXPECT_TRUE(first.found);
  EXPECT_FALSE(first.removed);
  EXPECT_EQ(first.refCount, 1);

  auto second = repo_->decrementRef(r.hash);
  EXPECT_TRUE(second.found);
  EXPECT_TRUE(second.removed);
  EXPECT_EQ(second.refCount, 0);
  EXPECT_FALSE(repo_->exists(r.hash));

  EXPECT_FALSE(repo_->decrementRef(r.hash).found);
}

TEST_F(ChunkRepositoryTest, TotalsSumOverRows) {
  EXPECT_EQ(repo_->totals().totalChunks, 0u);

  ChunkRecord a = record("aaaa", 4);
  ChunkRecord b = record("bbbbbbbb", 3);
  repo_->insert(a);
  repo_->insert(b);
  repo_->incrementRef(b.hash);

  ChunkTotals t = repo_->totals();
  EXPECT_EQ(t.totalChunks, 2u);
  EXPECT_EQ(t.totalRefs, 3u);
  EXPECT_EQ(t.totalSize, 12u);
  EXPECT_EQ(t.totalCompressedSize, 7u);
}
