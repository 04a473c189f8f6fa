#include "repository/repository.hpp"
#include "logger/logger.hpp"

namespace feedstore::repository {

void validate_key(const Key& key, KeyUse use) {
  if (key.empty()) {
    if (use == KeyUse::Entry) {
      throw EmptyKeyError();
    }
    return;
  }

  for (const auto& segment : key) {
    if (segment.empty()) {
      throw RepositoryKeyError(key, "Key segments cannot be empty");
    }
  }
}


//==============================================
// CORE OPERATIONS
//==============================================

ByteIteratorPtr Repository::read(const Key& key) const {
  validate_key(key, KeyUse::Entry);
  throw NotImplementedError("Repository::read");
}

void Repository::write(const Key& key, const ChunkProducer& /*producer*/) {
  validate_key(key, KeyUse::Entry);
  throw NotImplementedError("Repository::write");
}

bool Repository::exists(const Key& key) const {
  validate_key(key, KeyUse::Any);
  throw NotImplementedError("Repository::exists");
}

Names Repository::list(const Key& key) const {
  validate_key(key, KeyUse::Any);
  throw NotImplementedError("Repository::list");
}


//==============================================
// LOCATOR
//==============================================

std::string Repository::to_url(const std::string& scheme) const {
  FEEDSTORE_LOG_DEBUG << "Repository: No locator for scheme " << scheme;
  throw NotImplementedError("Repository::to_url");
}

} // namespace feedstore::repository
