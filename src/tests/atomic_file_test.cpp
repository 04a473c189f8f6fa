#include <gtest/gtest.h>
#include "repository/atomic_file.hpp"
#include "repository/repository_error.hpp"
#include "test_utils.hpp"

using namespace feedstore::repository;
using feedstore::test::TempDir;
using feedstore::test::bytes;
using feedstore::test::read_file;
using feedstore::test::write_file;

class AtomicFileTest : public ::testing::Test {
protected:
  TempDir dir;

  void SetUp() override {
    feedstore::test::quiet_logging();
  }

  std::size_t entry_count() const {
    std::size_t count = 0;
    for (const auto& entry : std::filesystem::directory_iterator(dir.path())) {
      (void)entry;
      ++count;
    }
    return count;
  }
};

TEST_F(AtomicFileTest, CommitPublishesContent) {
  const auto target = dir / "key";
  std::filesystem::path temp;
  {
    AtomicFile file(target);
    temp = file.temporary_path();
    EXPECT_EQ(temp.parent_path(), target.parent_path());
    EXPECT_TRUE(std::filesystem::exists(temp));
    EXPECT_FALSE(std::filesystem::exists(target));

    file.append(bytes("first "));
    file.append(bytes("revision"));
    file.commit();
    EXPECT_TRUE(file.committed());
  }

  EXPECT_EQ(read_file(target), "first revision");
  EXPECT_FALSE(std::filesystem::exists(temp));
  EXPECT_EQ(entry_count(), 1u);
}

TEST_F(AtomicFileTest, TargetUntouchedUntilCommit) {
  const auto target = dir / "key";
  write_file(target, "old content");

  AtomicFile file(target);
  file.append(bytes("new content that is longer"));
  EXPECT_EQ(read_file(target), "old content");

  file.commit();
  EXPECT_EQ(read_file(target), "new content that is longer");
}

TEST_F(AtomicFileTest, AbandonedWriteIsDiscarded) {
  const auto target = dir / "key";
  write_file(target, "old content");

  std::filesystem::path temp;
  {
    AtomicFile file(target);
    temp = file.temporary_path();
    file.append(bytes("partial"));
  }

  EXPECT_EQ(read_file(target), "old content");
  EXPECT_FALSE(std::filesystem::exists(temp));
  EXPECT_EQ(entry_count(), 1u);
}

TEST_F(AtomicFileTest, TemporaryNames) {
  AtomicFile first(dir / "key");
  AtomicFile second(dir / "key");
  EXPECT_NE(first.temporary_path(), second.temporary_path());
  EXPECT_EQ(first.temporary_path().parent_path(), dir.path());

  const std::string name = first.temporary_path().filename().string();
  EXPECT_EQ(name.rfind(".tmp-", 0), 0u);
  EXPECT_EQ(name.size(), 21u);
  EXPECT_TRUE(AtomicFile::is_temporary_name(name));

  EXPECT_FALSE(AtomicFile::is_temporary_name("key"));
  EXPECT_FALSE(AtomicFile::is_temporary_name(".hidden"));
  EXPECT_FALSE(AtomicFile::is_temporary_name(".tmp-xyz"));
  EXPECT_FALSE(AtomicFile::is_temporary_name(".tmp-0123456789abcdeg"));
  EXPECT_FALSE(AtomicFile::is_temporary_name(".tmp-0123456789abcdef0"));
  EXPECT_FALSE(AtomicFile::is_temporary_name("tmp-0123456789abcdef"));
  EXPECT_FALSE(AtomicFile::is_temporary_name(".key.tmp-0123456789abcdef"));
  EXPECT_TRUE(AtomicFile::is_temporary_name(".tmp-0123456789abcdef"));
}

TEST_F(AtomicFileTest, TemporaryNameIgnoresTargetLength) {
  const std::string long_name(250, 'k');
  {
    AtomicFile file(dir / long_name);
    EXPECT_EQ(file.temporary_path().filename().string().size(), 21u);
    file.append(bytes("contents"));
    file.commit();
  }
  EXPECT_EQ(read_file(dir / long_name), "contents");
}

TEST_F(AtomicFileTest, MissingDirectoryFails) {
  EXPECT_THROW(AtomicFile(dir / "missing" / "key"), IOError);
}
