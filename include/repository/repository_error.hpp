#ifndef FEEDSTORE_REPOSITORY_ERROR_HPP
#define FEEDSTORE_REPOSITORY_ERROR_HPP

#include <stdexcept>
#include <string>
#include "repository/key.hpp"

namespace feedstore::repository {

class RepositoryError : public std::runtime_error {
public:
    explicit RepositoryError(const std::string& message)
        : std::runtime_error(message) {}
};

// Key argument is not an ordered sequence of segments
class InvalidKeyTypeError : public RepositoryError {
public:
    explicit InvalidKeyTypeError(const std::string& message)
        : RepositoryError("Invalid key type: " + message) {}
};

class InvalidUrlError : public RepositoryError {
public:
    explicit InvalidUrlError(const std::string& url)
        : RepositoryError("Invalid repository url: " + url) {}
};

class NotFoundError : public RepositoryError {
public:
    explicit NotFoundError(const std::string& path)
        : RepositoryError("No such file or directory: " + path) {}
};

class NotADirectoryError : public RepositoryError {
public:
    explicit NotADirectoryError(const std::string& path)
        : RepositoryError("Not a directory: " + path) {}
};

class IOError : public RepositoryError {
public:
    IOError(const std::string& path, const std::string& reason)
        : RepositoryError("I/O error on " + path + ": " + reason), path_(path) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

// Base for failures tied to a particular key
class RepositoryKeyError : public RepositoryError {
public:
    RepositoryKeyError(const Key& key, const std::string& message)
        : RepositoryError(message + ": " + key.to_string()), key_(key) {}

    const Key& key() const { return key_; }

private:
    Key key_;
};

class EmptyKeyError : public RepositoryKeyError {
public:
    EmptyKeyError()
        : RepositoryKeyError(Key(), "Key cannot be empty") {}
};

class KeyNotFoundError : public RepositoryKeyError {
public:
    explicit KeyNotFoundError(const Key& key)
        : RepositoryKeyError(key, "No entry at key") {}

protected:
    KeyNotFoundError(const Key& key, const std::string& message)
        : RepositoryKeyError(key, message) {}
};

// Key refers to a plain entry where a directory-like node was expected
class KeyNotADirectoryError : public KeyNotFoundError {
public:
    explicit KeyNotADirectoryError(const Key& key)
        : KeyNotFoundError(key, "Key is not a directory") {}
};

class PathConflictError : public RepositoryKeyError {
public:
    PathConflictError(const Key& key, const std::string& reason)
        : RepositoryKeyError(key, "Path conflict (" + reason + ")") {}
};

// Contract method invoked without a backend override
class NotImplementedError : public std::logic_error {
public:
    explicit NotImplementedError(const std::string& operation)
        : std::logic_error("Not implemented: " + operation) {}
};

} // namespace feedstore::repository

#endif // FEEDSTORE_REPOSITORY_ERROR_HPP
