#ifndef AUTONOMI_UTILS_LOGGER_HPP
#define AUTONOMI_UTILS_LOGGER_HPP

#include <boost/log/trivial.hpp>
#include <string>

namespace autonomi {
namespace utils {
namespace logging {

using severity_level = boost::log::trivial::severity_level;

// Parses "trace", "debug", "info", "warning", "error" or "fatal"
severity_level parse_severity(const std::string& name);

// Replaces all sinks with a synchronous file sink at log_file
void init_logging(const std::string& log_file = "autonomi.log",
                  severity_level min_level = boost::log::trivial::info);

// Replaces all sinks with a console sink, used by tests
void init_console_logging(severity_level min_level = boost::log::trivial::warning);

// Adjusts the core severity filter without touching sinks
void set_log_level(severity_level min_level);

} // namespace logging
} // namespace utils
} // namespace autonomi

#endif // AUTONOMI_UTILS_LOGGER_HPP
