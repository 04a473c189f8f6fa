#ifndef FEEDSTORE_CONFIG_HPP
#define FEEDSTORE_CONFIG_HPP

#include <cstddef>
#include <memory>
#include <string>
#include <vector>
#include "logger/logger.hpp"
#include "repository/file_byte_iterator.hpp"
#include "repository/repository.hpp"

namespace feedstore::config {

struct RepositoryConfig {
  // Root directory, or a "<scheme>://<path>" locator
  std::string root;
  bool auto_create_root = true;
  bool atomic = false;
  // Wrap the backend in a BufferingLockedRepository
  bool buffered = false;
  std::size_t chunk_size = repository::kDefaultChunkSize;
  // Empty means log to the console
  std::string log_file;
  logging::severity_level log_level = logging::severity_level::warning;
};

struct ProgramOptions {
  RepositoryConfig config;
  bool help{false};
  bool valid{false};
  std::string error;
};

// ---- COMMAND LINE ----
// args excludes the program name
ProgramOptions parse_arguments(const std::vector<std::string>& args);
ProgramOptions parse_command_line(int argc, char* argv[]);
std::string usage(const std::string& program_name);


// ---- REPOSITORY FACTORY ----
// Filesystem repository for config.root, buffered if requested
std::unique_ptr<repository::Repository> open_repository(const RepositoryConfig& config);

} // namespace feedstore::config

#endif // FEEDSTORE_CONFIG_HPP
