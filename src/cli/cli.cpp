#include "cli/cli.hpp"
#include "repository/buffering_repository.hpp"
#include "repository/file_byte_iterator.hpp"
#include "logger/logger.hpp"
#include <filesystem>
#include <sstream>

namespace feedstore::cli {

using repository::Key;

namespace {

std::string trim_leading(const std::string& text) {
  const std::size_t start = text.find_first_not_of(" \t");
  return start == std::string::npos ? std::string() : text.substr(start);
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CLI::CLI(repository::Repository& repository, std::istream& input, std::ostream& output)
  : running_(false)
  , repository_(repository)
  , input_(input)
  , output_(output) {
  FEEDSTORE_LOG_INFO << "CLI initialized";
}


//==============================================
// STARTUP
//==============================================

void CLI::run() {
  running_ = true;
  std::string line;

  FEEDSTORE_LOG_INFO << "Starting CLI loop";
  output_ << "feedstore> " << std::flush;

  while (running_ && std::getline(input_, line)) {
    running_ = execute(line);
    if (running_) {
      output_ << "feedstore> " << std::flush;
    }
  }

  FEEDSTORE_LOG_INFO << "CLI loop ended";
}

bool CLI::execute(const std::string& line) {
  std::istringstream iss(line);
  std::string command, argument;
  iss >> command;

  if (command.empty()) {
    return true;
  }
  if (command == "quit") {
    return false;
  }

  iss >> argument;
  std::string rest;
  std::getline(iss, rest);
  process_command(command, argument, trim_leading(rest));
  return true;
}


//==============================================
// COMMAND PROCESSING
//==============================================

void CLI::process_command(const std::string& command, const std::string& argument,
                          const std::string& rest) {
  FEEDSTORE_LOG_DEBUG << "Processing command: " << command << " with argument: " << argument;

  if (command == "help") {
    handle_help_command();
  }
  else if (command == "ls") {
    handle_list_command(argument);
  }
  else if (command == "flush") {
    handle_flush_command();
  }
  else if (argument.empty()) {
    output_ << "Invalid input. Usage: <command> <key> (type 'help' for commands)" << std::endl;
  }
  else if (command == "read") {
    handle_read_command(argument);
  }
  else if (command == "write") {
    handle_write_command(argument, rest);
  }
  else if (command == "import" && !rest.empty()) {
    handle_import_command(argument, rest);
  }
  else if (command == "exists") {
    handle_exists_command(argument);
  }
  else if (command == "url") {
    handle_url_command(argument);
  }
  else {
    output_ << "Unknown command or invalid arguments" << std::endl;
  }
}

void CLI::handle_read_command(const std::string& key) {
  try {
    auto content = repository_.read(Key::parse(key));
    repository::Bytes chunk;
    while (content->next(chunk)) {
      output_.write(reinterpret_cast<const char*>(chunk.data()), static_cast<std::streamsize>(chunk.size()));
    }
    output_ << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error reading key", e.what());
  }
}

void CLI::handle_write_command(const std::string& key, const std::string& text) {
  try {
    repository_.write(Key::parse(key), std::vector<repository::Bytes>{repository::to_bytes(text)});
    output_ << "Stored " << text.size() << " bytes at " << key << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error writing key", e.what());
  }
}

void CLI::handle_import_command(const std::string& key, const std::string& filename) {
  try {
    if (!std::filesystem::is_regular_file(filename)) {
      output_ << "Error opening file: " << filename << std::endl;
      return;
    }
    repository::FileByteIterator source(filename);
    repository_.write(Key::parse(key), repository::produce_from(source));
    output_ << "Imported " << filename << " to " << key << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error importing file", e.what());
  }
}

void CLI::handle_exists_command(const std::string& key) {
  try {
    output_ << (repository_.exists(Key::parse(key)) ? "yes" : "no") << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error checking key", e.what());
  }
}

void CLI::handle_list_command(const std::string& key) {
  try {
    for (const auto& name : repository_.list(Key::parse(key))) {
      output_ << "  " << name << std::endl;
    }
  } catch (const std::exception& e) {
    log_and_display_error("Error listing key", e.what());
  }
}

void CLI::handle_flush_command() {
  auto* buffered = dynamic_cast<repository::BufferingLockedRepository*>(&repository_);
  if (buffered == nullptr) {
    output_ << "Repository is not buffered, nothing to flush" << std::endl;
    return;
  }

  try {
    const std::size_t pending = buffered->buffered_count();
    buffered->flush();
    output_ << "Flushed " << pending << " entries" << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error flushing buffer", e.what());
  }
}

void CLI::handle_url_command(const std::string& scheme) {
  try {
    output_ << repository_.to_url(scheme) << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error building url", e.what());
  }
}

void CLI::handle_help_command() {
  output_ << "Available commands:" << std::endl;
  output_ << "  help                 Display this help message" << std::endl;
  output_ << "  read <key>           Print the content stored at <key>" << std::endl;
  output_ << "  write <key> <text>   Store <text> at <key>" << std::endl;
  output_ << "  import <key> <file>  Store local <file> at <key>" << std::endl;
  output_ << "  exists <key>         Check whether <key> exists" << std::endl;
  output_ << "  ls [key]             List children of <key> (top level by default)" << std::endl;
  output_ << "  flush                Persist buffered writes" << std::endl;
  output_ << "  url <scheme>         Print the repository locator" << std::endl;
  output_ << "  quit                 Exit the shell" << std::endl << std::endl;
}

void CLI::log_and_display_error(const std::string& message, const std::string& error) {
  FEEDSTORE_LOG_ERROR << message << ": " << error;
  output_ << message << ": " << error << std::endl;
}

} // namespace feedstore::cli
