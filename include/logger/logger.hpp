#ifndef PUBFS_LOGGER_HPP
#define PUBFS_LOGGER_HPP

#include <string>
#include <boost/log/trivial.hpp>

namespace pubfs {
namespace logging {

using severity_level = boost::log::trivial::severity_level;

// Directory receiving log files
inline const std::string LOG_DIRECTORY = "logs";

// Sets up a file sink at logs/<log_name>.log, replacing any existing sinks
void init_logging(const std::string& log_name = "pubfs",
                  severity_level min_level = severity_level::info);

// Sets up a console sink, replacing any existing sinks
void init_console_logging(severity_level min_level = severity_level::info);

// Drops records below min_level
void set_log_level(severity_level min_level);

void enable_logging();
void disable_logging();

} // namespace logging
} // namespace pubfs

// Convenience macros for logging
#define LOG_TRACE BOOST_LOG_TRIVIAL(trace)
#define LOG_DEBUG BOOST_LOG_TRIVIAL(debug)
#define LOG_INFO BOOST_LOG_TRIVIAL(info)
#define LOG_WARN BOOST_LOG_TRIVIAL(warning)
#define LOG_ERROR BOOST_LOG_TRIVIAL(error)
#define LOG_FATAL BOOST_LOG_TRIVIAL(fatal)

#endif // PUBFS_LOGGER_HPP
