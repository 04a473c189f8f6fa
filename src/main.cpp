#include "cli/cli.hpp"
#include "config/config.hpp"
#include "logger/logger.hpp"
#include <iostream>

namespace {

void init_logging(const feedstore::config::RepositoryConfig& config) {
  if (config.log_file.empty()) {
    feedstore::logging::init_console_logging(config.log_level);
  } else {
    feedstore::logging::init_logging(config.log_file, config.log_level);
  }
}

bool run_shell(const feedstore::config::RepositoryConfig& config) {
  try {
    auto repository = feedstore::config::open_repository(config);
    feedstore::cli::CLI cli(*repository, std::cin, std::cout);
    cli.run();
    return true;
  } catch (const std::exception& e) {
    std::cerr << "Error: Failed to open repository: " << e.what() << '\n';
    return false;
  }
}

} // namespace

int main(int argc, char* argv[]) {
  const auto options = feedstore::config::parse_command_line(argc, argv);
  if (!options.valid) {
    std::cerr << "Error: " << options.error << '\n'
              << feedstore::config::usage(argv[0]);
    return 1;
  }
  if (options.help) {
    std::cout << feedstore::config::usage(argv[0]);
    return 0;
  }

  init_logging(options.config);
  return run_shell(options.config) ? 0 : 1;
}
