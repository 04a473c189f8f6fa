#ifndef FEEDSTORE_REPOSITORY_HPP
#define FEEDSTORE_REPOSITORY_HPP

#include <set>
#include <string>
#include <vector>
#include "repository/byte_stream.hpp"
#include "repository/key.hpp"
#include "repository/repository_error.hpp"

namespace feedstore::repository {

// Child segment names of a directory-like node
using Names = std::set<std::string>;

enum class KeyUse {
  Entry,  // read, write: must address a concrete entry
  Any     // exists, list: the empty key means the root
};

// Shared pre-check every backend runs before its own logic.
// Throws EmptyKeyError for an empty Entry key and RepositoryKeyError for
// an empty segment.
void validate_key(const Key& key, KeyUse use);


// Key-addressed storage of opaque byte streams.
//
// The default implementations only validate the key and then throw
// NotImplementedError; every backend overrides all four operations.
// Backends must bring the convenience overloads back into scope with
// `using Repository::read;` and so on.
class Repository {
public:
  virtual ~Repository() = default;


  // ---- CORE OPERATIONS ----
  // Lazy chunked content of the entry at key.
  // Throws KeyNotFoundError if there is no entry.
  virtual ByteIteratorPtr read(const Key& key) const;
  // Creates or replaces the entry at key with the produced chunks.
  // Throws PathConflictError when a prefix of key is a plain entry.
  virtual void write(const Key& key, const ChunkProducer& producer);
  // True if an entry or directory-like node exists at key; false for the empty key
  virtual bool exists(const Key& key) const;
  // Immediate child names of the node at key; the empty key lists the top level.
  // Throws KeyNotFoundError (KeyNotADirectoryError for plain entries).
  virtual Names list(const Key& key) const;


  // ---- LOCATOR ----
  // Locator string for this repository under the given scheme
  virtual std::string to_url(const std::string& scheme) const;


  // ---- CONVENIENCE OVERLOADS ----
  // Keys from arbitrary containers go through Key::from_range, which
  // throws InvalidKeyTypeError for sets
  void write(const Key& key, std::vector<Bytes> chunks) {
    write(key, produce_from(std::move(chunks)));
  }

  template <typename Range>
  ByteIteratorPtr read(const Range& key) const {
    return read(Key::from_range(key));
  }

  template <typename Range>
  void write(const Range& key, const ChunkProducer& producer) {
    write(Key::from_range(key), producer);
  }

  template <typename Range>
  void write(const Range& key, std::vector<Bytes> chunks) {
    write(Key::from_range(key), produce_from(std::move(chunks)));
  }

  template <typename Range>
  bool exists(const Range& key) const {
    return exists(Key::from_range(key));
  }

  template <typename Range>
  Names list(const Range& key) const {
    return list(Key::from_range(key));
  }
};

} // namespace feedstore::repository

#endif // FEEDSTORE_REPOSITORY_HPP
