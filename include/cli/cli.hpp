#ifndef FEEDSTORE_CLI_HPP
#define FEEDSTORE_CLI_HPP

#include <istream>
#include <ostream>
#include <string>
#include "repository/repository.hpp"

namespace feedstore::cli {

// Line-oriented shell over a repository. Keys are written as a/b/c.
class CLI {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  CLI(repository::Repository& repository, std::istream& input, std::ostream& output);


  // ---- STARTUP ----
  // Reads commands until "quit" or end of input
  void run();
  // Executes one command line, returns false once the shell should stop
  bool execute(const std::string& line);

private:
  // ---- PARAMETERS ----
  bool running_;
  repository::Repository& repository_;
  std::istream& input_;
  std::ostream& output_;


  // ---- COMMAND PROCESSING ----
  void process_command(const std::string& command, const std::string& argument,
                       const std::string& rest);
  void handle_read_command(const std::string& key);
  void handle_write_command(const std::string& key, const std::string& text);
  void handle_import_command(const std::string& key, const std::string& filename);
  void handle_exists_command(const std::string& key);
  void handle_list_command(const std::string& key);
  void handle_flush_command();
  void handle_url_command(const std::string& scheme);
  void handle_help_command();
  void log_and_display_error(const std::string& message, const std::string& error);
};

} // namespace feedstore::cli

#endif // FEEDSTORE_CLI_HPP
