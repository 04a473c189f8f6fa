#ifndef FEEDSTORE_BUFFERING_REPOSITORY_HPP
#define FEEDSTORE_BUFFERING_REPOSITORY_HPP

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>
#include "repository/repository.hpp"

namespace feedstore::repository {

// Write-behind decorator around another repository.
//
// write() keeps the latest content per key in memory; read(), exists()
// and list() see buffered entries before persisted ones. flush() writes
// the buffer through to the wrapped repository.
//
// The lock guards the buffer only and is never held across I/O on the
// wrapped repository. It may be shared with other components that must be
// serialized against the buffer.
class BufferingLockedRepository : public Repository {
public:
  // ---- CONSTRUCTOR ----
  explicit BufferingLockedRepository(std::unique_ptr<Repository> repository,
                                     std::shared_ptr<std::mutex> lock = std::make_shared<std::mutex>());


  // ---- CORE OPERATIONS ----
  using Repository::read;
  using Repository::write;
  using Repository::exists;
  using Repository::list;

  ByteIteratorPtr read(const Key& key) const override;
  // Materializes the producer, then buffers its content. The producer runs
  // without the lock held and may call back into this repository.
  void write(const Key& key, const ChunkProducer& producer) override;
  bool exists(const Key& key) const override;
  // Merges buffered children with the wrapped repository's listing
  Names list(const Key& key) const override;


  // ---- LOCATOR ----
  std::string to_url(const std::string& scheme) const override;


  // ---- BUFFER CONTROL ----
  // Persists every buffered entry. Entries stay readable from the buffer
  // until written; an entry rewritten during the flush stays buffered.
  // On failure the unpersisted entries remain buffered and the error propagates.
  void flush();

  std::size_t buffered_count() const;
  bool empty() const;


  // ---- GETTERS ----
  Repository& wrapped() { return *repository_; }
  const Repository& wrapped() const { return *repository_; }
  const std::shared_ptr<std::mutex>& lock() const { return lock_; }

private:
  struct Entry {
    Bytes content;
    std::uint64_t generation;
  };

  // Ordered so that every key under a prefix is contiguous
  using Buffer = std::map<Key, Entry>;

  // ---- PARAMETERS ----
  std::unique_ptr<Repository> repository_;
  std::shared_ptr<std::mutex> lock_;
  Buffer buffer_;
  std::uint64_t next_generation_;


  // ---- BUFFER QUERIES (lock held) ----
  // True if some buffered key lies strictly under key
  bool has_buffered_children(const Key& key) const;
  // Throws PathConflictError if key cannot be buffered as a plain entry
  void check_buffered_conflicts(const Key& key) const;


  // ---- WRAPPED REPOSITORY QUERIES (lock not held) ----
  void check_persisted_conflicts(const Key& key) const;
  // True if key is a directory-like node in the wrapped repository
  bool is_persisted_directory(const Key& key) const;


  // ---- FLUSH SUPPORT ----
  // Drops entries whose generation still matches the persisted one
  void forget_persisted(const std::vector<std::pair<Key, std::uint64_t>>& persisted);
};

} // namespace feedstore::repository

#endif // FEEDSTORE_BUFFERING_REPOSITORY_HPP
