#include "repository/buffering_repository.hpp"
#include "logger/logger.hpp"
#include <stdexcept>

namespace feedstore::repository {

//==============================================
// CONSTRUCTOR
//==============================================

BufferingLockedRepository::BufferingLockedRepository(std::unique_ptr<Repository> repository,
                                                     std::shared_ptr<std::mutex> lock)
  : repository_(std::move(repository))
  , lock_(std::move(lock))
  , next_generation_(1) {
  if (!repository_) {
    throw std::invalid_argument("BufferingLockedRepository: wrapped repository is null");
  }
  if (!lock_) {
    throw std::invalid_argument("BufferingLockedRepository: lock is null");
  }
  FEEDSTORE_LOG_DEBUG << "BufferingLockedRepository: Initialized";
}


//==============================================
// CORE OPERATIONS
//==============================================

ByteIteratorPtr BufferingLockedRepository::read(const Key& key) const {
  validate_key(key, KeyUse::Entry);

  {
    std::lock_guard<std::mutex> guard(*lock_);

    auto it = buffer_.find(key);
    if (it != buffer_.end()) {
      FEEDSTORE_LOG_DEBUG << "BufferingLockedRepository: Serving " << key << " from buffer";
      return std::make_unique<MemoryByteIterator>(it->second.content);
    }

    // Buffered directory or buffered plain entry on the way down
    if (has_buffered_children(key)) {
      throw KeyNotFoundError(key);
    }
    for (std::size_t i = 1; i < key.size(); ++i) {
      if (buffer_.count(key.prefix(i)) > 0) {
        throw KeyNotFoundError(key);
      }
    }
  }

  return repository_->read(key);
}

void BufferingLockedRepository::write(const Key& key, const ChunkProducer& producer) {
  validate_key(key, KeyUse::Entry);
  check_persisted_conflicts(key);

  Bytes content;
  Bytes chunk;
  while (producer(chunk)) {
    content.insert(content.end(), chunk.begin(), chunk.end());
  }

  std::lock_guard<std::mutex> guard(*lock_);
  check_buffered_conflicts(key);
  buffer_[key] = Entry{std::move(content), next_generation_++};
  FEEDSTORE_LOG_DEBUG << "BufferingLockedRepository: Buffered " << buffer_[key].content.size()
                      << " bytes at key: " << key << " (" << buffer_.size() << " pending)";
}

bool BufferingLockedRepository::exists(const Key& key) const {
  validate_key(key, KeyUse::Any);
  if (key.empty()) {
    return false;
  }

  {
    std::lock_guard<std::mutex> guard(*lock_);
    if (buffer_.count(key) > 0 || has_buffered_children(key)) {
      return true;
    }
  }
  return repository_->exists(key);
}

Names BufferingLockedRepository::list(const Key& key) const {
  validate_key(key, KeyUse::Any);

  Names names;
  bool buffered_directory = false;
  {
    std::lock_guard<std::mutex> guard(*lock_);
    if (!key.empty() && buffer_.count(key) > 0) {
      throw KeyNotADirectoryError(key);
    }

    // Keys under `key` are contiguous and sort right after it
    for (auto it = buffer_.upper_bound(key); it != buffer_.end() && it->first.starts_with(key); ++it) {
      names.insert(it->first[key.size()]);
      buffered_directory = true;
    }
  }

  try {
    Names persisted = repository_->list(key);
    names.insert(persisted.begin(), persisted.end());
  }
  catch (const KeyNotADirectoryError&) {
    throw;
  }
  catch (const KeyNotFoundError&) {
    if (!buffered_directory) {
      throw;
    }
  }
  return names;
}


//==============================================
// LOCATOR
//==============================================

std::string BufferingLockedRepository::to_url(const std::string& scheme) const {
  return repository_->to_url(scheme);
}


//==============================================
// BUFFER CONTROL
//==============================================

void BufferingLockedRepository::flush() {
  Buffer snapshot;
  {
    std::lock_guard<std::mutex> guard(*lock_);
    snapshot = buffer_;
  }

  if (snapshot.empty()) {
    FEEDSTORE_LOG_DEBUG << "BufferingLockedRepository: Nothing to flush";
    return;
  }
  FEEDSTORE_LOG_INFO << "BufferingLockedRepository: Flushing " << snapshot.size() << " entries";

  std::vector<std::pair<Key, std::uint64_t>> persisted;
  try {
    for (const auto& [key, entry] : snapshot) {
      repository_->write(key, produce_from(std::vector<Bytes>{entry.content}));
      persisted.emplace_back(key, entry.generation);
    }
  }
  catch (const std::exception& e) {
    FEEDSTORE_LOG_ERROR << "BufferingLockedRepository: Flush failed after " << persisted.size()
                        << " of " << snapshot.size() << " entries: " << e.what();
    forget_persisted(persisted);
    throw;
  }

  forget_persisted(persisted);
  FEEDSTORE_LOG_INFO << "BufferingLockedRepository: Flushed " << persisted.size() << " entries";
}

std::size_t BufferingLockedRepository::buffered_count() const {
  std::lock_guard<std::mutex> guard(*lock_);
  return buffer_.size();
}

bool BufferingLockedRepository::empty() const {
  std::lock_guard<std::mutex> guard(*lock_);
  return buffer_.empty();
}


//==============================================
// BUFFER QUERIES
//==============================================

bool BufferingLockedRepository::has_buffered_children(const Key& key) const {
  auto it = buffer_.upper_bound(key);
  return it != buffer_.end() && it->first.starts_with(key);
}

void BufferingLockedRepository::check_buffered_conflicts(const Key& key) const {
  for (std::size_t i = 1; i < key.size(); ++i) {
    if (buffer_.count(key.prefix(i)) > 0) {
      throw PathConflictError(key, key.prefix(i).to_string() + " is a buffered entry");
    }
  }
  if (has_buffered_children(key)) {
    throw PathConflictError(key, "key is a buffered directory");
  }
}


//==============================================
// WRAPPED REPOSITORY QUERIES
//==============================================

void BufferingLockedRepository::check_persisted_conflicts(const Key& key) const {
  for (std::size_t i = 1; i < key.size(); ++i) {
    const Key prefix = key.prefix(i);
    if (!repository_->exists(prefix)) {
      // Nothing deeper can exist either
      return;
    }
    if (!is_persisted_directory(prefix)) {
      throw PathConflictError(key, prefix.to_string() + " is not a directory");
    }
  }

  if (repository_->exists(key) && is_persisted_directory(key)) {
    throw PathConflictError(key, "key is a directory");
  }
}

bool BufferingLockedRepository::is_persisted_directory(const Key& key) const {
  try {
    repository_->list(key);
    return true;
  }
  catch (const KeyNotFoundError&) {
    return false;
  }
}


//==============================================
// FLUSH SUPPORT
//==============================================

void BufferingLockedRepository::forget_persisted(const std::vector<std::pair<Key, std::uint64_t>>& persisted) {
  std::lock_guard<std::mutex> guard(*lock_);
  for (const auto& [key, generation] : persisted) {
    auto it = buffer_.find(key);
    if (it != buffer_.end() && it->second.generation == generation) {
      buffer_.erase(it);
    }
  }
}

} // namespace feedstore::repository
