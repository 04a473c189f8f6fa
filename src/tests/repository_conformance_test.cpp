#include <gtest/gtest.h>
#include <functional>
#include <set>
#include <unordered_set>
#include "repository/buffering_repository.hpp"
#include "repository/filesystem_repository.hpp"
#include "test_utils.hpp"

using namespace feedstore::repository;
using feedstore::test::TempDir;
using feedstore::test::chunks;
using feedstore::test::read_string;

namespace {

struct Backend {
  std::string name;
  std::function<std::unique_ptr<Repository>(const std::string& root)> make;
};

std::vector<Backend> backends() {
  return {
    {"Filesystem", [](const std::string& root) -> std::unique_ptr<Repository> {
      return std::make_unique<FilesystemRepository>(root);
    }},
    {"AtomicFilesystem", [](const std::string& root) -> std::unique_ptr<Repository> {
      FilesystemOptions options;
      options.atomic = true;
      return std::make_unique<FilesystemRepository>(root, options);
    }},
    {"Buffered", [](const std::string& root) -> std::unique_ptr<Repository> {
      return std::make_unique<BufferingLockedRepository>(std::make_unique<FilesystemRepository>(root));
    }}
  };
}

} // namespace

// Behaviour every backend, decorated or not, must share
class RepositoryConformanceTest : public ::testing::TestWithParam<Backend> {
protected:
  TempDir dir;
  std::unique_ptr<Repository> repository;

  void SetUp() override {
    feedstore::test::quiet_logging();
    repository = GetParam().make(dir.str());
  }
};

TEST_P(RepositoryConformanceTest, KeyMustBeSequence) {
  const std::set<std::string> set_key{"key ", "must ", "be ", "sequence"};
  const std::unordered_set<std::string> unordered_key{"key"};

  EXPECT_THROW(repository->read(set_key), InvalidKeyTypeError);
  EXPECT_THROW(repository->write(set_key, std::vector<Bytes>{}), InvalidKeyTypeError);
  EXPECT_THROW(repository->list(set_key), InvalidKeyTypeError);
  EXPECT_THROW(repository->exists(set_key), InvalidKeyTypeError);
  EXPECT_THROW(repository->exists(unordered_key), InvalidKeyTypeError);
}

TEST_P(RepositoryConformanceTest, KeyCannotBeEmpty) {
  EXPECT_THROW(repository->read(Key{}), EmptyKeyError);
  EXPECT_THROW(repository->write(Key{}, chunks({"key ", "cannot ", "be ", "empty"})), EmptyKeyError);
  EXPECT_FALSE(repository->exists(Key{}));
  EXPECT_TRUE(repository->list(Key{}).empty());
}

TEST_P(RepositoryConformanceTest, Lifecycle) {
  EXPECT_TRUE(repository->list(Key{}).empty());
  EXPECT_FALSE(repository->exists(Key{"key"}));
  EXPECT_THROW(repository->read(Key{"key"}), RepositoryKeyError);

  repository->write(Key{"key"}, chunks({"cont", "ents"}));
  EXPECT_EQ(repository->list(Key{}), (Names{"key"}));
  EXPECT_TRUE(repository->exists(Key{"key"}));
  EXPECT_EQ(read_string(*repository, Key{"key"}), "contents");

  EXPECT_FALSE(repository->exists(Key{"dir", "key"}));
  EXPECT_THROW(repository->read(Key{"dir", "key"}), RepositoryKeyError);

  repository->write(Key{"dir", "key"}, chunks({"cont", "ents"}));
  EXPECT_EQ(repository->list(Key{}), (Names{"dir", "key"}));
  EXPECT_TRUE(repository->exists(Key{"dir", "key"}));
  EXPECT_FALSE(repository->exists(Key{"dir", "key2"}));
  EXPECT_EQ(read_string(*repository, Key{"dir", "key"}), "contents");

  EXPECT_THROW(repository->write(Key{"key", "key"}, chunks({"directory test"})), PathConflictError);
  EXPECT_EQ(read_string(*repository, Key{"key"}), "contents");
  EXPECT_THROW(repository->list(Key{"key"}), KeyNotADirectoryError);
}

TEST_P(RepositoryConformanceTest, VectorKeysMatchKeys) {
  const std::vector<std::string> key{"feeds", "entry"};
  repository->write(key, chunks({"payload"}));
  EXPECT_TRUE(repository->exists(key));
  EXPECT_EQ(read_string(*repository, Key::from_range(key)), "payload");
  EXPECT_EQ(repository->list(std::vector<std::string>{"feeds"}), (Names{"entry"}));
}

TEST_P(RepositoryConformanceTest, WriteThenReadRoundTrips) {
  const std::vector<std::vector<std::string>> payloads = {
    {},
    {""},
    {"single"},
    {"a", "b", "c"},
    {std::string(10000, 'x'), std::string(3, 'y')}
  };

  int index = 0;
  for (const auto& parts : payloads) {
    const Key key{"payload", std::to_string(index++)};
    std::vector<Bytes> input;
    std::string expected;
    for (const auto& part : parts) {
      input.push_back(feedstore::test::bytes(part));
      expected += part;
    }

    EXPECT_FALSE(repository->exists(key));
    repository->write(key, input);
    EXPECT_TRUE(repository->exists(key));
    EXPECT_EQ(read_string(*repository, key), expected);
  }
}

INSTANTIATE_TEST_SUITE_P(
  Backends,
  RepositoryConformanceTest,
  ::testing::ValuesIn(backends()),
  [](const ::testing::TestParamInfo<Backend>& info) { return info.param.name; });
