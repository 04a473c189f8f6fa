#include "config/config.hpp"
#include "repository/buffering_repository.hpp"
#include "repository/filesystem_repository.hpp"
#include <sstream>
#include <unordered_map>

namespace feedstore::config {

namespace {

enum class Flag {
  Root,
  Atomic,
  NoMkdir,
  Buffered,
  ChunkSize,
  LogFile,
  LogLevel,
  Help
};

const std::unordered_map<std::string, Flag>& flag_map() {
  static const std::unordered_map<std::string, Flag> flags = {
    {"-r", Flag::Root},
    {"--root", Flag::Root},
    {"--atomic", Flag::Atomic},
    {"--no-mkdir", Flag::NoMkdir},
    {"--buffered", Flag::Buffered},
    {"--chunk-size", Flag::ChunkSize},
    {"--log-file", Flag::LogFile},
    {"--log-level", Flag::LogLevel},
    {"-h", Flag::Help},
    {"--help", Flag::Help}
  };
  return flags;
}

bool takes_value(Flag flag) {
  return flag == Flag::Root || flag == Flag::ChunkSize ||
         flag == Flag::LogFile || flag == Flag::LogLevel;
}

ProgramOptions fail(ProgramOptions options, const std::string& error) {
  options.valid = false;
  options.error = error;
  return options;
}

} // namespace


//==============================================
// COMMAND LINE
//==============================================

ProgramOptions parse_arguments(const std::vector<std::string>& args) {
  ProgramOptions options;

  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string& arg = args[i];
    auto found = flag_map().find(arg);
    if (found == flag_map().end()) {
      return fail(options, "Unknown argument: " + arg);
    }

    const Flag flag = found->second;
    std::string value;
    if (takes_value(flag)) {
      if (i + 1 >= args.size()) {
        return fail(options, "Missing value for " + arg);
      }
      value = args[++i];
    }

    switch (flag) {
      case Flag::Root:
        options.config.root = value;
        break;
      case Flag::Atomic:
        options.config.atomic = true;
        break;
      case Flag::NoMkdir:
        options.config.auto_create_root = false;
        break;
      case Flag::Buffered:
        options.config.buffered = true;
        break;
      case Flag::ChunkSize:
        try {
          std::size_t consumed = 0;
          const unsigned long long size = std::stoull(value, &consumed);
          if (consumed != value.size() || size == 0) {
            return fail(options, "Invalid chunk size: " + value);
          }
          options.config.chunk_size = static_cast<std::size_t>(size);
        } catch (const std::exception&) {
          return fail(options, "Invalid chunk size: " + value);
        }
        break;
      case Flag::LogFile:
        options.config.log_file = value;
        break;
      case Flag::LogLevel:
        if (!logging::parse_severity(value, options.config.log_level)) {
          return fail(options, "Invalid log level: " + value);
        }
        break;
      case Flag::Help:
        options.help = true;
        break;
    }
  }

  if (options.help) {
    options.valid = true;
    return options;
  }
  if (options.config.root.empty()) {
    return fail(options, "A repository root is required");
  }

  options.valid = true;
  return options;
}

ProgramOptions parse_command_line(int argc, char* argv[]) {
  std::vector<std::string> args;
  for (int i = 1; i < argc; ++i) {
    args.emplace_back(argv[i]);
  }
  return parse_arguments(args);
}

std::string usage(const std::string& program_name) {
  std::ostringstream oss;
  oss << "Usage: " << program_name << " -r <root> [options]\n"
      << "Required arguments:\n"
      << "  -r, --root <path|url>  Repository root directory or file://<path>\n"
      << "Options:\n"
      << "  --atomic               Publish writes atomically\n"
      << "  --no-mkdir             Fail if the root does not exist\n"
      << "  --buffered             Buffer writes until 'flush'\n"
      << "  --chunk-size <bytes>   Read chunk size (default "
      << repository::kDefaultChunkSize << ")\n"
      << "  --log-file <file>      Log to <file> instead of the console\n"
      << "  --log-level <level>    trace, debug, info, warning, error or fatal\n"
      << "  -h, --help             Show this message\n"
      << "Example: " << program_name << " -r /tmp/feeds --atomic\n";
  return oss.str();
}


//==============================================
// REPOSITORY FACTORY
//==============================================

std::unique_ptr<repository::Repository> open_repository(const RepositoryConfig& config) {
  repository::FilesystemOptions options;
  options.auto_create_root = config.auto_create_root;
  options.atomic = config.atomic;
  options.chunk_size = config.chunk_size;

  std::unique_ptr<repository::Repository> backend;
  if (config.root.find("://") != std::string::npos) {
    backend = repository::FilesystemRepository::from_url(config.root, options);
  } else {
    backend = std::make_unique<repository::FilesystemRepository>(config.root, options);
  }

  if (config.buffered) {
    return std::make_unique<repository::BufferingLockedRepository>(std::move(backend));
  }
  return backend;
}

} // namespace feedstore::config
