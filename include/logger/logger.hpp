#ifndef CSU_LOGGER_HPP
#define CSU_LOGGER_HPP

#include <boost/log/trivial.hpp>
#include <string>

namespace csu::logger {

using severity_level = boost::log::trivial::severity_level;

// Convert severity level to string for formatting
const char* to_string(severity_level level);

// Parses "trace", "debug", "info", "warning", "error" or "fatal".
// Returns false and leaves level untouched for anything else
bool parse_severity(const std::string& text, severity_level& level);

// Routes all records to a single text file sink; replaces previous sinks
void init_logging(const std::string& log_file = "checksum-utils.log",
                  severity_level min_level = severity_level::info);

void set_log_level(severity_level level);
void enable_logging();
void disable_logging();

} // namespace csu::logger

// Convenience macros for logging
#define LOG_TRACE BOOST_LOG_TRIVIAL(trace)
#define LOG_DEBUG BOOST_LOG_TRIVIAL(debug)
#define LOG_INFO BOOST_LOG_TRIVIAL(info)
#define LOG_WARN BOOST_LOG_TRIVIAL(warning)
#define LOG_ERROR BOOST_LOG_TRIVIAL(error)
#define LOG_FATAL BOOST_LOG_TRIVIAL(fatal)

#endif // CSU_LOGGER_HPP
