#ifndef FEEDSTORE_FILESYSTEM_REPOSITORY_HPP
#define FEEDSTORE_FILESYSTEM_REPOSITORY_HPP

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include "repository/file_byte_iterator.hpp"
#include "repository/repository.hpp"

namespace feedstore::repository {

struct FilesystemOptions {
  // Create the root (and its parents) when missing
  bool auto_create_root = true;
  // Publish writes through AtomicFile instead of writing in place
  bool atomic = false;
  // Chunk size of the iterators returned by read()
  std::size_t chunk_size = kDefaultChunkSize;
};

// Repository storing each key as a file under a root directory:
// ["a", "b", "c"] lives at <root>/a/b/c. Directories are created on demand.
//
// In-place writes are not safe against concurrent readers of the same key;
// atomic mode closes that gap at the cost of a temporary file per write.
// Segments of the form ".tmp-<16 hex chars>" are reserved for those temporaries.
class FilesystemRepository : public Repository {
public:
  // ---- CONSTRUCTOR ----
  // Throws NotFoundError if the root is missing and auto_create_root is off,
  // NotADirectoryError if the root is a plain file
  explicit FilesystemRepository(const std::string& path,
                                FilesystemOptions options = FilesystemOptions());

  // Builds a repository from "<scheme>://<path>"
  static std::unique_ptr<FilesystemRepository> from_url(const std::string& url,
                                                        FilesystemOptions options = FilesystemOptions());


  // ---- CORE OPERATIONS ----
  using Repository::read;
  using Repository::write;
  using Repository::exists;
  using Repository::list;

  ByteIteratorPtr read(const Key& key) const override;
  void write(const Key& key, const ChunkProducer& producer) override;
  bool exists(const Key& key) const override;
  Names list(const Key& key) const override;


  // ---- LOCATOR ----
  std::string to_url(const std::string& scheme) const override;


  // ---- GETTERS ----
  const std::string& path() const { return path_; }
  const FilesystemOptions& options() const { return options_; }

private:
  // ---- PARAMETERS ----
  std::string path_;
  std::filesystem::path root_;
  FilesystemOptions options_;


  // ---- PATH SUPPORT ----
  // Joins the root with every segment of key. Throws RepositoryKeyError
  // for segments shaped like an AtomicFile temporary
  std::filesystem::path resolve(const Key& key) const;
  // Creates the directories leading to key and returns the ones it made,
  // outermost first. Throws PathConflictError if one of them is a plain file
  std::vector<std::filesystem::path> prepare_parents(const Key& key) const;
  // Removes directories made for a write that failed, as long as they are empty
  void remove_created(const std::vector<std::filesystem::path>& created) const;


  // ---- WRITE SUPPORT ----
  void write_in_place(const Key& key, const std::filesystem::path& target,
                      const ChunkProducer& producer) const;
  void write_atomic(const Key& key, const std::filesystem::path& target,
                    const ChunkProducer& producer) const;
};

} // namespace feedstore::repository

#endif // FEEDSTORE_FILESYSTEM_REPOSITORY_HPP
