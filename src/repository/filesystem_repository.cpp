#include "repository/filesystem_repository.hpp"
#include "repository/atomic_file.hpp"
#include "logger/logger.hpp"
#include <fstream>

namespace feedstore::repository {

namespace fs = std::filesystem;

//==============================================
// CONSTRUCTOR
//==============================================

FilesystemRepository::FilesystemRepository(const std::string& path, FilesystemOptions options)
  : path_(path)
  , root_(path)
  , options_(options) {
  FEEDSTORE_LOG_INFO << "FilesystemRepository: Initializing repository at: " << path_
                     << (options_.atomic ? " (atomic writes)" : "");

  std::error_code ec;
  const fs::file_status status = fs::status(root_, ec);

  if (!fs::exists(status)) {
    if (!options_.auto_create_root) {
      FEEDSTORE_LOG_ERROR << "FilesystemRepository: Root does not exist: " << path_;
      throw NotFoundError(path_);
    }
    fs::create_directories(root_, ec);
    if (ec) {
      FEEDSTORE_LOG_ERROR << "FilesystemRepository: Failed to create root " << path_ << ": " << ec.message();
      throw IOError(path_, ec.message());
    }
    FEEDSTORE_LOG_DEBUG << "FilesystemRepository: Created root directory: " << path_;
  } else if (!fs::is_directory(status)) {
    FEEDSTORE_LOG_ERROR << "FilesystemRepository: Root is not a directory: " << path_;
    throw NotADirectoryError(path_);
  }
}

std::unique_ptr<FilesystemRepository> FilesystemRepository::from_url(const std::string& url,
                                                                     FilesystemOptions options) {
  const std::size_t separator = url.find("://");
  if (separator == std::string::npos || separator == 0 || separator + 3 >= url.size()) {
    throw InvalidUrlError(url);
  }
  return std::make_unique<FilesystemRepository>(url.substr(separator + 3), options);
}


//==============================================
// CORE OPERATIONS
//==============================================

ByteIteratorPtr FilesystemRepository::read(const Key& key) const {
  validate_key(key, KeyUse::Entry);
  FEEDSTORE_LOG_DEBUG << "FilesystemRepository: Reading key: " << key;

  const fs::path file_path = resolve(key);
  std::error_code ec;
  if (!fs::exists(file_path, ec)) {
    FEEDSTORE_LOG_DEBUG << "FilesystemRepository: No entry at key: " << key;
    throw KeyNotFoundError(key);
  }

  // A directory surfaces as NotFoundError on the first next()
  return std::make_unique<FileByteIterator>(file_path, options_.chunk_size);
}

void FilesystemRepository::write(const Key& key, const ChunkProducer& producer) {
  validate_key(key, KeyUse::Entry);
  const fs::path target = resolve(key);
  FEEDSTORE_LOG_INFO << "FilesystemRepository: Writing key: " << key;

  const std::vector<fs::path> created = prepare_parents(key);

  try {
    std::error_code ec;
    if (fs::is_directory(target, ec)) {
      FEEDSTORE_LOG_ERROR << "FilesystemRepository: Key is a directory: " << key;
      throw PathConflictError(key, "key is a directory");
    }

    if (options_.atomic) {
      write_atomic(key, target, producer);
    } else {
      write_in_place(key, target, producer);
    }
  }
  catch (const std::exception& e) {
    FEEDSTORE_LOG_ERROR << "FilesystemRepository: Write to " << key << " failed: " << e.what();
    remove_created(created);
    throw;
  }
}

bool FilesystemRepository::exists(const Key& key) const {
  validate_key(key, KeyUse::Any);
  if (key.empty()) {
    return false;
  }

  // A plain file in the middle of the path resolves to "not found", not an error
  std::error_code ec;
  const bool found = fs::exists(resolve(key), ec);
  if (ec) {
    throw IOError(resolve(key).string(), ec.message());
  }

  FEEDSTORE_LOG_DEBUG << "FilesystemRepository: Key " << key << (found ? " exists" : " not found");
  return found;
}

Names FilesystemRepository::list(const Key& key) const {
  validate_key(key, KeyUse::Any);
  FEEDSTORE_LOG_DEBUG << "FilesystemRepository: Listing key: " << key;

  const fs::path dir_path = resolve(key);
  std::error_code ec;
  const fs::file_status status = fs::status(dir_path, ec);

  if (!fs::exists(status)) {
    throw KeyNotFoundError(key);
  }
  if (!fs::is_directory(status)) {
    throw KeyNotADirectoryError(key);
  }

  Names names;
  for (fs::directory_iterator it(dir_path, ec), end; !ec && it != end; it.increment(ec)) {
    std::string name = it->path().filename().string();
    // In-flight atomic writes are not entries yet
    if (!AtomicFile::is_temporary_name(name)) {
      names.insert(std::move(name));
    }
  }
  if (ec) {
    FEEDSTORE_LOG_ERROR << "FilesystemRepository: Failed to list " << dir_path.string() << ": " << ec.message();
    throw IOError(dir_path.string(), ec.message());
  }
  return names;
}


//==============================================
// LOCATOR
//==============================================

std::string FilesystemRepository::to_url(const std::string& scheme) const {
  return scheme + "://" + path_;
}


//==============================================
// PATH SUPPORT
//==============================================

fs::path FilesystemRepository::resolve(const Key& key) const {
  fs::path path = root_;
  for (const auto& segment : key) {
    if (AtomicFile::is_temporary_name(segment)) {
      throw RepositoryKeyError(key, "Key segment " + segment + " is reserved for in-flight writes");
    }
    path /= segment;
  }
  return path;
}

std::vector<fs::path> FilesystemRepository::prepare_parents(const Key& key) const {
  std::vector<fs::path> created;
  fs::path current = root_;

  for (std::size_t i = 0; i + 1 < key.size(); ++i) {
    current /= key[i];

    std::error_code ec;
    const fs::file_status status = fs::status(current, ec);
    if (fs::exists(status)) {
      if (!fs::is_directory(status)) {
        FEEDSTORE_LOG_ERROR << "FilesystemRepository: Cannot write " << key
                            << " through plain entry " << key.prefix(i + 1);
        throw PathConflictError(key, key.prefix(i + 1).to_string() + " is not a directory");
      }
      continue;
    }

    fs::create_directory(current, ec);
    if (ec) {
      remove_created(created);
      throw IOError(current.string(), ec.message());
    }
    created.push_back(current);
  }
  return created;
}

void FilesystemRepository::remove_created(const std::vector<fs::path>& created) const {
  // Deepest first; a directory another writer has filled since is kept
  for (auto it = created.rbegin(); it != created.rend(); ++it) {
    std::error_code ec;
    if (!fs::remove(*it, ec)) {
      FEEDSTORE_LOG_DEBUG << "FilesystemRepository: Keeping directory " << it->string()
                          << (ec ? ": " + ec.message() : std::string());
      return;
    }
  }
}


//==============================================
// WRITE SUPPORT
//==============================================

void FilesystemRepository::write_in_place(const Key& key, const fs::path& target,
                                          const ChunkProducer& producer) const {
  std::ofstream file(target, std::ios::out | std::ios::binary | std::ios::trunc);
  if (!file) {
    throw IOError(target.string(), "failed to open for writing");
  }

  std::size_t bytes_written = 0;
  Bytes chunk;
  while (producer(chunk)) {
    file.write(reinterpret_cast<const char*>(chunk.data()), static_cast<std::streamsize>(chunk.size()));
    if (!file) {
      throw IOError(target.string(), "write failed");
    }
    bytes_written += chunk.size();
  }

  file.close();
  if (file.fail()) {
    throw IOError(target.string(), "failed to close");
  }
  FEEDSTORE_LOG_INFO << "FilesystemRepository: Stored " << bytes_written << " bytes at key: " << key;
}

void FilesystemRepository::write_atomic(const Key& key, const fs::path& target,
                                        const ChunkProducer& producer) const {
  AtomicFile file(target);

  std::size_t bytes_written = 0;
  Bytes chunk;
  while (producer(chunk)) {
    file.append(chunk);
    bytes_written += chunk.size();
  }

  file.commit();
  FEEDSTORE_LOG_INFO << "FilesystemRepository: Atomically stored " << bytes_written << " bytes at key: " << key;
}

} // namespace feedstore::repository
