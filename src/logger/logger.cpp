#include "logger/logger.hpp"
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/make_shared.hpp>
#include <boost/shared_ptr.hpp>
#include <filesystem>
#include <iostream>

namespace csu::logger {

const char* to_string(severity_level level) {
  switch (level) {
    case severity_level::trace:   return "TRACE";
    case severity_level::debug:   return "DEBUG";
    case severity_level::info:    return "INFO";
    case severity_level::warning: return "WARNING";
    case severity_level::error:   return "ERROR";
    case severity_level::fatal:   return "FATAL";
    default:                      return "UNKNOWN";
  }
}

bool parse_severity(const std::string& text, severity_level& level) {
  if (text == "trace") {
    level = severity_level::trace;
  } else if (text == "debug") {
    level = severity_level::debug;
  } else if (text == "info") {
    level = severity_level::info;
  } else if (text == "warning") {
    level = severity_level::warning;
  } else if (text == "error") {
    level = severity_level::error;
  } else if (text == "fatal") {
    level = severity_level::fatal;
  } else {
    return false;
  }
  return true;
}

void init_logging(const std::string& log_file, severity_level min_level) {
  try {
    // Clear any existing sinks
    boost::log::core::get()->remove_all_sinks();

    // Create and configure text file sink backend
    auto backend = boost::make_shared<boost::log::sinks::text_file_backend>();

    std::filesystem::path log_path = std::filesystem::absolute(log_file);
    backend->set_file_name_pattern(log_path.string());
    backend->set_open_mode(std::ios::out | std::ios::app);
    backend->auto_flush(true);

    using text_sink = boost::log::sinks::synchronous_sink<boost::log::sinks::text_file_backend>;
    auto sink = boost::make_shared<text_sink>(backend);

    namespace expr = boost::log::expressions;
    sink->set_formatter(
      expr::stream
        << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
        << " [" << boost::log::trivial::severity << "] "
        << expr::smessage
    );

    boost::log::core::get()->add_sink(sink);
    boost::log::add_common_attributes();

    set_log_level(min_level);
    enable_logging();

    BOOST_LOG_TRIVIAL(info) << "Logger: Logging initialized with file: " << log_path.string()
                            << " (level " << csu::logger::to_string(min_level) << ")";
  }
  catch (const std::exception& e) {
    std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
    throw;
  }
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

} // namespace csu::logger
