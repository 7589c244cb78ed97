#ifndef SHARDROOT_LOGGER_HPP
#define SHARDROOT_LOGGER_HPP

#include <boost/log/trivial.hpp>
#include <boost/log/sources/global_logger_storage.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <string>

namespace shardroot::logging {

using severity_level = boost::log::trivial::severity_level;

// Declare the logger type
using severity_logger_type = boost::log::sources::severity_logger_mt<severity_level>;

// Declare the global logger storage
BOOST_LOG_GLOBAL_LOGGER(global_logger, severity_logger_type)

// Routes both the global logger and BOOST_LOG_TRIVIAL records to a file sink,
// and to stderr as well when console is set
void init_logging(const std::string& log_file = "shardroot.log",
                  severity_level min_level = severity_level::info,
                  bool console = false);

// Parses trace|debug|info|warning|error|fatal, throws std::invalid_argument otherwise
severity_level parse_log_level(const std::string& level);

void set_log_level(severity_level min_level);
void enable_logging();
void disable_logging();

} // namespace shardroot::logging

// Convenience macros for logging
#define LOG_TRACE BOOST_LOG_SEV(shardroot::logging::global_logger::get(), boost::log::trivial::trace)
#define LOG_DEBUG BOOST_LOG_SEV(shardroot::logging::global_logger::get(), boost::log::trivial::debug)
#define LOG_INFO BOOST_LOG_SEV(shardroot::logging::global_logger::get(), boost::log::trivial::info)
#define LOG_WARN BOOST_LOG_SEV(shardroot::logging::global_logger::get(), boost::log::trivial::warning)
#define LOG_ERROR BOOST_LOG_SEV(shardroot::logging::global_logger::get(), boost::log::trivial::error)
#define LOG_FATAL BOOST_LOG_SEV(shardroot::logging::global_logger::get(), boost::log::trivial::fatal)

#endif // SHARDROOT_LOGGER_HPP
