#include "repository/key.hpp"
#include "repository/repository_error.hpp"
#include <algorithm>
#include <sstream>

namespace feedstore::repository {

void reject_unordered_key() {
  throw InvalidKeyTypeError("key must be an ordered sequence of segments, not a set");
}

Key Key::parse(const std::string& path) {
  std::vector<std::string> segments;
  std::istringstream iss(path);
  std::string segment;

  while (std::getline(iss, segment, '/')) {
    if (!segment.empty()) {
      segments.push_back(segment);
    }
  }
  return Key(std::move(segments));
}

bool Key::starts_with(const Key& prefix) const {
  if (prefix.size() > size()) {
    return false;
  }
  return std::equal(prefix.begin(), prefix.end(), begin());
}

Key Key::prefix(std::size_t count) const {
  count = std::min(count, size());
  return Key(std::vector<std::string>(begin(), begin() + count));
}

Key Key::parent() const {
  return empty() ? Key() : prefix(size() - 1);
}

Key Key::child(const std::string& segment) const {
  std::vector<std::string> segments = segments_;
  segments.push_back(segment);
  return Key(std::move(segments));
}

std::string Key::to_string() const {
  std::string result;
  for (std::size_t i = 0; i < segments_.size(); ++i) {
    if (i > 0) {
      result += '/';
    }
    result += segments_[i];
  }
  return result;
}

std::ostream& operator<<(std::ostream& os, const Key& key) {
  return os << key.to_string();
}

} // namespace feedstore::repository
