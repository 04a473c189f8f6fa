#ifndef FEEDSTORE_FILE_BYTE_ITERATOR_HPP
#define FEEDSTORE_FILE_BYTE_ITERATOR_HPP

#include <cstddef>
#include <filesystem>
#include <fstream>
#include "repository/byte_stream.hpp"

namespace feedstore::repository {

constexpr std::size_t kDefaultChunkSize = 4096;

// Reads a file in fixed-size chunks. The file is opened on the first call
// to next() and closed on exhaustion, on error, on close() and on
// destruction. Not restartable: read again through a new instance.
class FileByteIterator : public ByteIterator {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit FileByteIterator(const std::filesystem::path& path,
                            std::size_t chunk_size = kDefaultChunkSize);
  ~FileByteIterator() override;

  FileByteIterator(const FileByteIterator&) = delete;
  FileByteIterator& operator=(const FileByteIterator&) = delete;


  // ---- ITERATION ----
  // Every chunk holds chunk_size bytes except possibly the last one.
  // Throws NotFoundError on first call if the path is a directory or missing.
  bool next(Bytes& chunk) override;
  // Releases the handle early; later calls to next() return false
  void close();


  // ---- GETTERS ----
  bool is_open() const { return file_.is_open(); }
  const std::filesystem::path& path() const { return path_; }
  std::size_t chunk_size() const { return chunk_size_; }

private:
  // ---- PARAMETERS ----
  std::filesystem::path path_;
  std::size_t chunk_size_;
  std::ifstream file_;
  bool opened_;
  bool finished_;

  void open();
};

} // namespace feedstore::repository

#endif // FEEDSTORE_FILE_BYTE_ITERATOR_HPP
