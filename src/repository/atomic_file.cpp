#include "repository/atomic_file.hpp"
#include "repository/repository_error.hpp"
#include "logger/logger.hpp"
#include <openssl/rand.h>
#include <array>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace feedstore::repository {

namespace {

constexpr const char* kTempPrefix = ".tmp-";
constexpr std::size_t kSuffixBytes = 8;
constexpr std::size_t kSuffixLength = kSuffixBytes * 2;

std::string random_suffix() {
  std::array<unsigned char, kSuffixBytes> bytes{};
  if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
    throw IOError("<random>", "failed to generate temporary file suffix");
  }

  std::stringstream ss;
  for (unsigned char byte : bytes) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
  }
  return ss.str();
}

} // namespace


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

AtomicFile::AtomicFile(const std::filesystem::path& target)
  : target_(target)
  , temp_path_(temporary_path_for(target))
  , committed_(false) {
  file_.open(temp_path_, std::ios::out | std::ios::binary | std::ios::trunc);
  if (!file_.is_open()) {
    FEEDSTORE_LOG_ERROR << "AtomicFile: Failed to create temporary file: " << temp_path_.string();
    throw IOError(temp_path_.string(), "cannot create temporary file");
  }
  FEEDSTORE_LOG_TRACE << "AtomicFile: Staging " << target_.string() << " in " << temp_path_.string();
}

AtomicFile::~AtomicFile() {
  if (!committed_) {
    discard();
  }
}


//==============================================
// WRITE OPERATIONS
//==============================================

void AtomicFile::append(const Bytes& chunk) {
  if (committed_) {
    throw IOError(target_.string(), "append after commit");
  }
  file_.write(reinterpret_cast<const char*>(chunk.data()), static_cast<std::streamsize>(chunk.size()));
  if (!file_) {
    FEEDSTORE_LOG_ERROR << "AtomicFile: Write failed on " << temp_path_.string();
    throw IOError(temp_path_.string(), "write failed");
  }
}

void AtomicFile::commit() {
  if (committed_) {
    return;
  }

  file_.flush();
  file_.close();
  if (file_.fail()) {
    FEEDSTORE_LOG_ERROR << "AtomicFile: Failed to finish " << temp_path_.string();
    throw IOError(temp_path_.string(), "failed to flush temporary file");
  }

  // rename() replaces an existing target atomically
  std::error_code ec;
  std::filesystem::rename(temp_path_, target_, ec);
  if (ec) {
    FEEDSTORE_LOG_ERROR << "AtomicFile: Failed to publish " << target_.string() << ": " << ec.message();
    throw IOError(target_.string(), ec.message());
  }

  committed_ = true;
  FEEDSTORE_LOG_TRACE << "AtomicFile: Published " << target_.string();
}

void AtomicFile::discard() {
  if (file_.is_open()) {
    file_.close();
  }

  std::error_code ec;
  std::filesystem::remove(temp_path_, ec);
  if (ec) {
    FEEDSTORE_LOG_WARN << "AtomicFile: Could not remove " << temp_path_.string() << ": " << ec.message();
  } else {
    FEEDSTORE_LOG_DEBUG << "AtomicFile: Discarded unpublished write to " << target_.string();
  }
}


//==============================================
// QUERY OPERATIONS
//==============================================

bool AtomicFile::is_temporary_name(const std::string& name) {
  const std::string prefix(kTempPrefix);
  if (name.size() != prefix.size() + kSuffixLength || name.compare(0, prefix.size(), prefix) != 0) {
    return false;
  }

  for (std::size_t i = prefix.size(); i < name.size(); ++i) {
    if (!std::isxdigit(static_cast<unsigned char>(name[i]))) {
      return false;
    }
  }
  return true;
}

// The name has a fixed length so any target name that fits the directory
// also has room for its temporary
std::filesystem::path AtomicFile::temporary_path_for(const std::filesystem::path& target) {
  return target.parent_path() / (kTempPrefix + random_suffix());
}

} // namespace feedstore::repository
