#ifndef BSYNC_LOGGER_HPP
#define BSYNC_LOGGER_HPP

#include <string>
#include <boost/log/trivial.hpp>

namespace bsync {
namespace logger {

using severity_level = boost::log::trivial::severity_level;

// Parses "trace", "debug", "info", "warning", "error" or "fatal" (case-insensitive).
// Throws std::invalid_argument on anything else.
severity_level parse_severity(const std::string& name);

// Initialize logging system: a synchronous text file sink and, optionally,
// a console sink on std::clog. Any previously installed sinks are removed.
void init_logging(const std::string& log_file,
                  severity_level min_level = severity_level::info,
                  bool console = false);

// Adjust the minimum severity after initialization
void set_log_level(severity_level min_level);

} // namespace logger
} // namespace bsync

#endif // BSYNC_LOGGER_HPP
