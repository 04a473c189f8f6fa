#ifndef FEEDSTORE_KEY_HPP
#define FEEDSTORE_KEY_HPP

#include <cstddef>
#include <initializer_list>
#include <ostream>
#include <set>
#include <string>
#include <type_traits>
#include <unordered_set>
#include <vector>

namespace feedstore::repository {

// Collections without a caller-defined order cannot name a key
template <typename T>
struct is_unordered_collection : std::false_type {};

template <typename... Args>
struct is_unordered_collection<std::set<Args...>> : std::true_type {};

template <typename... Args>
struct is_unordered_collection<std::multiset<Args...>> : std::true_type {};

template <typename... Args>
struct is_unordered_collection<std::unordered_set<Args...>> : std::true_type {};

template <typename... Args>
struct is_unordered_collection<std::unordered_multiset<Args...>> : std::true_type {};

// Throws InvalidKeyTypeError, kept out of line so this header does not
// depend on the error hierarchy
[[noreturn]] void reject_unordered_key();

class Key {
public:
  using const_iterator = std::vector<std::string>::const_iterator;

  // ---- CONSTRUCTORS ----
  Key() = default;
  Key(std::initializer_list<std::string> segments) : segments_(segments) {}
  explicit Key(std::vector<std::string> segments) : segments_(std::move(segments)) {}

  // Builds a key from any container of strings, rejecting unordered ones
  template <typename Range>
  static Key from_range(const Range& range) {
    if constexpr (is_unordered_collection<Range>::value) {
      reject_unordered_key();
    } else {
      std::vector<std::string> segments;
      for (const auto& segment : range) {
        segments.emplace_back(segment);
      }
      return Key(std::move(segments));
    }
  }

  // Splits "a/b/c" into segments, dropping empty ones
  static Key parse(const std::string& path);


  // ---- QUERY METHODS ----
  bool empty() const { return segments_.empty(); }
  std::size_t size() const { return segments_.size(); }
  const std::string& operator[](std::size_t index) const { return segments_[index]; }
  const std::string& back() const { return segments_.back(); }
  const std::vector<std::string>& segments() const { return segments_; }

  const_iterator begin() const { return segments_.begin(); }
  const_iterator end() const { return segments_.end(); }

  // True if every segment of prefix leads this key (a key starts with itself)
  bool starts_with(const Key& prefix) const;
  // First `count` segments
  Key prefix(std::size_t count) const;
  Key parent() const;
  Key child(const std::string& segment) const;

  // Slash-joined form used in logs and messages
  std::string to_string() const;

  friend bool operator==(const Key& lhs, const Key& rhs) { return lhs.segments_ == rhs.segments_; }
  friend bool operator!=(const Key& lhs, const Key& rhs) { return lhs.segments_ != rhs.segments_; }
  friend bool operator<(const Key& lhs, const Key& rhs) { return lhs.segments_ < rhs.segments_; }

private:
  std::vector<std::string> segments_;
};

std::ostream& operator<<(std::ostream& os, const Key& key);

} // namespace feedstore::repository

#endif // FEEDSTORE_KEY_HPP
