#include <gtest/gtest.h>
#include <deque>
#include <list>
#include <set>
#include <unordered_set>
#include "repository/key.hpp"
#include "repository/repository.hpp"
#include "test_utils.hpp"

using namespace feedstore::repository;

class KeyTest : public ::testing::Test {
protected:
  void SetUp() override {
    feedstore::test::quiet_logging();
  }
};

TEST_F(KeyTest, Construction) {
  Key empty;
  EXPECT_TRUE(empty.empty());
  EXPECT_EQ(empty.size(), 0u);

  Key key{"dir", "sub", "file"};
  ASSERT_EQ(key.size(), 3u);
  EXPECT_EQ(key[0], "dir");
  EXPECT_EQ(key.back(), "file");
  EXPECT_EQ(key.to_string(), "dir/sub/file");

  Key from_vector(std::vector<std::string>{"a", "b"});
  EXPECT_EQ(from_vector, (Key{"a", "b"}));
}

TEST_F(KeyTest, ParseDropsEmptySegments) {
  EXPECT_EQ(Key::parse("a/b/c"), (Key{"a", "b", "c"}));
  EXPECT_EQ(Key::parse("/a//b/"), (Key{"a", "b"}));
  EXPECT_TRUE(Key::parse("").empty());
  EXPECT_TRUE(Key::parse("/").empty());
}

TEST_F(KeyTest, PrefixNavigation) {
  Key key{"a", "b", "c"};
  EXPECT_TRUE(key.starts_with(Key{}));
  EXPECT_TRUE(key.starts_with(Key{"a"}));
  EXPECT_TRUE(key.starts_with(key));
  EXPECT_FALSE(key.starts_with(Key{"a", "c"}));
  EXPECT_FALSE(Key{"a"}.starts_with(key));

  EXPECT_EQ(key.prefix(2), (Key{"a", "b"}));
  EXPECT_EQ(key.prefix(10), key);
  EXPECT_EQ(key.parent(), (Key{"a", "b"}));
  EXPECT_TRUE(Key{}.parent().empty());
  EXPECT_EQ(Key{"a"}.child("b"), (Key{"a", "b"}));
}

TEST_F(KeyTest, OrderingKeepsDescendantsTogether) {
  std::set<Key> keys{Key{"b"}, Key{"a", "z"}, Key{"a"}, Key{"ab"}, Key{"a", "b"}};
  std::vector<Key> ordered(keys.begin(), keys.end());

  ASSERT_EQ(ordered.size(), 5u);
  EXPECT_EQ(ordered[0], (Key{"a"}));
  EXPECT_EQ(ordered[1], (Key{"a", "b"}));
  EXPECT_EQ(ordered[2], (Key{"a", "z"}));
  EXPECT_EQ(ordered[3], (Key{"ab"}));
  EXPECT_EQ(ordered[4], (Key{"b"}));
}

TEST_F(KeyTest, FromRangeAcceptsSequences) {
  EXPECT_EQ(Key::from_range(std::vector<std::string>{"a", "b"}), (Key{"a", "b"}));
  EXPECT_EQ(Key::from_range(std::list<std::string>{"a", "b"}), (Key{"a", "b"}));
  EXPECT_EQ(Key::from_range(std::deque<const char*>{"a", "b"}), (Key{"a", "b"}));
  EXPECT_TRUE(Key::from_range(std::vector<std::string>{}).empty());
}

TEST_F(KeyTest, FromRangeRejectsSets) {
  EXPECT_THROW(Key::from_range(std::set<std::string>{"key ", "must ", "be ", "sequence"}),
               InvalidKeyTypeError);
  EXPECT_THROW(Key::from_range(std::unordered_set<std::string>{"key"}), InvalidKeyTypeError);
  EXPECT_THROW(Key::from_range(std::multiset<std::string>{"key"}), InvalidKeyTypeError);
}

TEST_F(KeyTest, Validation) {
  EXPECT_THROW(validate_key(Key{}, KeyUse::Entry), EmptyKeyError);
  EXPECT_NO_THROW(validate_key(Key{}, KeyUse::Any));
  EXPECT_NO_THROW(validate_key(Key{"a", "b"}, KeyUse::Entry));
  EXPECT_THROW(validate_key(Key{"a", ""}, KeyUse::Any), RepositoryKeyError);
}

TEST_F(KeyTest, ErrorsCarryKey) {
  try {
    throw KeyNotFoundError(Key{"dir", "key"});
  } catch (const RepositoryKeyError& e) {
    EXPECT_EQ(e.key(), (Key{"dir", "key"}));
    EXPECT_NE(std::string(e.what()).find("dir/key"), std::string::npos);
  }
}
