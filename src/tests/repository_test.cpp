#include <gtest/gtest.h>
#include <set>
#include "repository/repository.hpp"
#include "test_utils.hpp"

using namespace feedstore::repository;
using feedstore::test::chunks;

namespace {

// Overrides everything, running the shared pre-check first
class ImplementedRepository : public Repository {
public:
  using Repository::read;
  using Repository::write;
  using Repository::exists;
  using Repository::list;

  ByteIteratorPtr read(const Key& key) const override {
    validate_key(key, KeyUse::Entry);
    return std::make_unique<MemoryByteIterator>(Bytes());
  }

  void write(const Key& key, const ChunkProducer& producer) override {
    validate_key(key, KeyUse::Entry);
    Bytes chunk;
    while (producer(chunk)) {
      ++chunks_written;
    }
  }

  bool exists(const Key& key) const override {
    validate_key(key, KeyUse::Any);
    return true;
  }

  Names list(const Key& key) const override {
    validate_key(key, KeyUse::Any);
    return Names();
  }

  int chunks_written = 0;
};

} // namespace

class RepositoryContractTest : public ::testing::Test {
protected:
  void SetUp() override {
    feedstore::test::quiet_logging();
  }
};

TEST_F(RepositoryContractTest, DefaultsAreNotImplemented) {
  Repository repository;
  EXPECT_THROW(repository.read(Key{"key"}), NotImplementedError);
  EXPECT_THROW(repository.write(Key{"key"}, chunks({""})), NotImplementedError);
  EXPECT_THROW(repository.exists(Key{"key"}), NotImplementedError);
  EXPECT_THROW(repository.list(Key{"key"}), NotImplementedError);
  EXPECT_THROW(repository.to_url("file"), NotImplementedError);
}

TEST_F(RepositoryContractTest, DefaultsValidateBeforeFailing) {
  Repository repository;
  EXPECT_THROW(repository.read(Key{}), EmptyKeyError);
  EXPECT_THROW(repository.write(Key{}, chunks({"x"})), EmptyKeyError);
  EXPECT_THROW(repository.read(std::set<std::string>{"key"}), InvalidKeyTypeError);
  EXPECT_THROW(repository.exists(std::set<std::string>{"key"}), InvalidKeyTypeError);
}

TEST_F(RepositoryContractTest, OverridesReplaceDefaults) {
  ImplementedRepository repository;
  EXPECT_TRUE(read_all(*repository.read(Key{"key"})).empty());
  repository.write(Key{"key"}, chunks({"a", "b"}));
  EXPECT_EQ(repository.chunks_written, 2);
  EXPECT_TRUE(repository.exists(Key{"key"}));
  EXPECT_TRUE(repository.list(Key{"key"}).empty());
  EXPECT_THROW(repository.to_url("file"), NotImplementedError);
}

TEST_F(RepositoryContractTest, RangeOverloadsReachOverrides) {
  ImplementedRepository repository;
  EXPECT_TRUE(repository.exists(std::vector<std::string>{"a", "b"}));
  EXPECT_NO_THROW(repository.write(std::vector<std::string>{"a"}, chunks({"x"})));
  EXPECT_THROW(repository.list(std::set<std::string>{"a"}), InvalidKeyTypeError);
  EXPECT_THROW(repository.read(std::vector<std::string>{}), EmptyKeyError);
}

TEST_F(RepositoryContractTest, ByteStreamHelpers) {
  auto producer = produce_from(chunks({"cont", "ents"}));
  Bytes chunk;
  std::string joined;
  while (producer(chunk)) {
    joined += to_string(chunk);
  }
  EXPECT_EQ(joined, "contents");

  MemoryByteIterator single(to_bytes("payload"));
  EXPECT_TRUE(single.next(chunk));
  EXPECT_EQ(to_string(chunk), "payload");
  EXPECT_FALSE(single.next(chunk));

  MemoryByteIterator empty{Bytes()};
  EXPECT_FALSE(empty.next(chunk));
}
