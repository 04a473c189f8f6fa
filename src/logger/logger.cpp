#include "logger/logger.hpp"
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/attributes/clock.hpp>
#include <boost/log/attributes/current_thread_id.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/make_shared.hpp>
#include <filesystem>
#include <iostream>

namespace feedstore::logging {

namespace {

namespace expr = boost::log::expressions;

// Shared by both sinks: "2026-10-18 10:00:00.000000 [info] message"
auto make_formatter() {
  return expr::stream
      << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
      << " [" << expr::attr<severity_level>("Severity") << "] "
      << expr::smessage;
}

} // namespace

BOOST_LOG_GLOBAL_LOGGER_INIT(global_logger, ::feedstore::logging::logger_type) {
  logger_type logger;
  logger.add_attribute("TimeStamp", boost::log::attributes::local_clock());
  logger.add_attribute("ThreadID", boost::log::attributes::current_thread_id());
  return logger;
}

void init_logging(const std::string& log_file, severity_level min_level) {
  try {
    // Clear any existing sinks
    boost::log::core::get()->remove_all_sinks();

    auto backend = boost::make_shared<boost::log::sinks::text_file_backend>();
    std::filesystem::path log_path = std::filesystem::absolute(log_file);
    backend->set_file_name_pattern(log_path.string());
    backend->set_open_mode(std::ios::out | std::ios::app);
    backend->auto_flush(true);

    using text_sink = boost::log::sinks::synchronous_sink<boost::log::sinks::text_file_backend>;
    auto sink = boost::make_shared<text_sink>(backend);
    sink->set_formatter(make_formatter());

    boost::log::core::get()->add_sink(sink);
    boost::log::add_common_attributes();
    set_log_level(min_level);
    enable_logging();
  }
  catch (const std::exception& e) {
    std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
    throw;
  }
}

void init_console_logging(severity_level min_level) {
  boost::log::core::get()->remove_all_sinks();

  auto sink = boost::log::add_console_log(std::clog);
  sink->set_formatter(make_formatter());
  sink->locked_backend()->auto_flush(true);

  boost::log::add_common_attributes();
  set_log_level(min_level);
  enable_logging();
}

void set_log_level(severity_level level) {
  boost::log::core::get()->set_filter(boost::log::trivial::severity >= level);
}

void enable_logging() {
  boost::log::core::get()->set_logging_enabled(true);
}

void disable_logging() {
  boost::log::core::get()->set_logging_enabled(false);
}

bool parse_severity(const std::string& name, severity_level& level) {
  static const std::pair<const char*, severity_level> levels[] = {
    {"trace", severity_level::trace},
    {"debug", severity_level::debug},
    {"info", severity_level::info},
    {"warning", severity_level::warning},
    {"error", severity_level::error},
    {"fatal", severity_level::fatal}
  };

  for (const auto& [label, value] : levels) {
    if (name == label) {
      level = value;
      return true;
    }
  }
  return false;
}

} // namespace feedstore::logging
