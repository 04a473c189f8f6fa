#include "repository/file_byte_iterator.hpp"
#include "repository/repository_error.hpp"
#include "logger/logger.hpp"
#include <stdexcept>

namespace feedstore::repository {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

FileByteIterator::FileByteIterator(const std::filesystem::path& path, std::size_t chunk_size)
  : path_(path)
  , chunk_size_(chunk_size)
  , opened_(false)
  , finished_(false) {
  if (chunk_size_ == 0) {
    throw std::invalid_argument("FileByteIterator: chunk size must be positive");
  }
}

FileByteIterator::~FileByteIterator() {
  if (file_.is_open()) {
    FEEDSTORE_LOG_TRACE << "FileByteIterator: Releasing abandoned handle for " << path_.string();
  }
}


//==============================================
// ITERATION
//==============================================

bool FileByteIterator::next(Bytes& chunk) {
  if (finished_) {
    return false;
  }
  if (!opened_) {
    open();
  }

  chunk.resize(chunk_size_);
  file_.read(reinterpret_cast<char*>(chunk.data()), static_cast<std::streamsize>(chunk_size_));
  const std::streamsize count = file_.gcount();

  if (count == 0) {
    const bool failed = file_.bad();
    close();
    chunk.clear();
    if (failed) {
      FEEDSTORE_LOG_ERROR << "FileByteIterator: Read failed on " << path_.string();
      throw IOError(path_.string(), "read failed");
    }
    return false;
  }

  chunk.resize(static_cast<std::size_t>(count));
  return true;
}

void FileByteIterator::close() {
  finished_ = true;
  if (file_.is_open()) {
    file_.close();
    FEEDSTORE_LOG_TRACE << "FileByteIterator: Closed " << path_.string();
  }
}

void FileByteIterator::open() {
  opened_ = true;

  std::error_code ec;
  if (std::filesystem::is_directory(path_, ec)) {
    finished_ = true;
    throw NotFoundError(path_.string() + " (is a directory)");
  }

  file_.open(path_, std::ios::in | std::ios::binary);
  if (!file_.is_open()) {
    finished_ = true;
    throw NotFoundError(path_.string());
  }
  FEEDSTORE_LOG_TRACE << "FileByteIterator: Opened " << path_.string()
                      << " with chunk size " << chunk_size_;
}

} // namespace feedstore::repository
