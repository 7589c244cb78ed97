#include "logger/logger.hpp"
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/attributes/clock.hpp>
#include <boost/core/null_deleter.hpp>
#include <boost/shared_ptr.hpp>
#include <boost/make_shared.hpp>
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace shardroot::logging {

namespace expr = boost::log::expressions;

// Define the global logger
BOOST_LOG_GLOBAL_LOGGER_INIT(global_logger, severity_logger_type) {
    severity_logger_type logger;
    logger.add_attribute("TimeStamp", boost::log::attributes::local_clock());
    return logger;
}

void init_logging(const std::string& log_file, severity_level min_level, bool console) {
    try {
        // Clear any existing sinks
        boost::log::core::get()->remove_all_sinks();

        // Create and configure text file sink backend
        auto backend = boost::make_shared<boost::log::sinks::text_file_backend>();

        // Convert to absolute path
        std::filesystem::path log_path = std::filesystem::absolute(log_file);
        if (log_path.has_parent_path()) {
            std::filesystem::create_directories(log_path.parent_path());
        }
        backend->set_file_name_pattern(log_path.string());
        backend->set_open_mode(std::ios::out | std::ios::app);
        backend->auto_flush(true);

        using file_sink = boost::log::sinks::synchronous_sink<boost::log::sinks::text_file_backend>;
        auto sink = boost::make_shared<file_sink>(backend);

        auto formatter = expr::stream
            << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
            << " [" << boost::log::trivial::severity << "] "
            << expr::smessage;
        sink->set_formatter(formatter);
        boost::log::core::get()->add_sink(sink);

        if (console) {
            using console_sink = boost::log::sinks::synchronous_sink<boost::log::sinks::text_ostream_backend>;
            auto console_backend = boost::make_shared<boost::log::sinks::text_ostream_backend>();
            console_backend->add_stream(boost::shared_ptr<std::ostream>(&std::clog, boost::null_deleter()));
            console_backend->auto_flush(true);
            auto stream_sink = boost::make_shared<console_sink>(console_backend);
            stream_sink->set_formatter(formatter);
            boost::log::core::get()->add_sink(stream_sink);
        }

        boost::log::add_common_attributes();
        set_log_level(min_level);
        enable_logging();

        LOG_DEBUG << "Logging system initialized with file: " << log_path.string();
    }
    catch (const std::exception& e) {
        std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
        throw;
    }
}

severity_level parse_log_level(const std::string& level) {
    if (level == "trace")   return severity_level::trace;
    if (level == "debug")   return severity_level::debug;
    if (level == "info")    return severity_level::info;
    if (level == "warning") return severity_level::warning;
    if (level == "error")   return severity_level::error;
    if (level == "fatal")   return severity_level::fatal;
    throw std::invalid_argument("Unknown log level: " + level);
}

void set_log_level(severity_level min_level) {
    boost::log::core::get()->set_filter(boost::log::trivial::severity >= min_level);
}

void enable_logging() {
    boost::log::core::get()->set_logging_enabled(true);
}

void disable_logging() {
    boost::log::core::get()->set_logging_enabled(false);
}

} // namespace shardroot::logging
