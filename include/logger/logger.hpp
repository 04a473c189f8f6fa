#ifndef FEEDSTORE_LOGGER_HPP
#define FEEDSTORE_LOGGER_HPP

#include <boost/log/trivial.hpp>
#include <boost/log/sources/global_logger_storage.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <string>

namespace feedstore::logging {

using severity_level = boost::log::trivial::severity_level;

// Thread-safe logger shared by every component
using logger_type = boost::log::sources::severity_logger_mt<severity_level>;

BOOST_LOG_GLOBAL_LOGGER(global_logger, ::feedstore::logging::logger_type)

// Replaces all sinks with a text file sink
void init_logging(const std::string& log_file = "feedstore.log",
                  severity_level min_level = severity_level::info);
// Replaces all sinks with a console (stderr) sink
void init_console_logging(severity_level min_level = severity_level::warning);

void set_log_level(severity_level level);
void enable_logging();
void disable_logging();

// Maps "trace", "debug", "info", "warning", "error", "fatal" to a level
bool parse_severity(const std::string& name, severity_level& level);

} // namespace feedstore::logging

// Convenience macros for logging
#define FEEDSTORE_LOG_TRACE BOOST_LOG_SEV(feedstore::logging::global_logger::get(), boost::log::trivial::trace)
#define FEEDSTORE_LOG_DEBUG BOOST_LOG_SEV(feedstore::logging::global_logger::get(), boost::log::trivial::debug)
#define FEEDSTORE_LOG_INFO BOOST_LOG_SEV(feedstore::logging::global_logger::get(), boost::log::trivial::info)
#define FEEDSTORE_LOG_WARN BOOST_LOG_SEV(feedstore::logging::global_logger::get(), boost::log::trivial::warning)
#define FEEDSTORE_LOG_ERROR BOOST_LOG_SEV(feedstore::logging::global_logger::get(), boost::log::trivial::error)
#define FEEDSTORE_LOG_FATAL BOOST_LOG_SEV(feedstore::logging::global_logger::get(), boost::log::trivial::fatal)

#endif // FEEDSTORE_LOGGER_HPP
