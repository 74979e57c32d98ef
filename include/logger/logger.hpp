#ifndef FLUX_LOGGER_HPP
#define FLUX_LOGGER_HPP

#include <string>
#include <boost/log/trivial.hpp>

namespace flux::logger {

using severity_level = boost::log::trivial::severity_level;

// Installs a synchronous text file sink and, optionally, a console sink.
// Any previously installed sinks are removed first.
void init_logging(const std::string& log_file = "flux.log",
                  severity_level min_level = severity_level::info,
                  bool console = false);

// Changes the minimum severity of the installed sinks
void set_log_level(severity_level min_level);

// Parses "trace", "debug", "info", "warning", "error" or "fatal"
severity_level parse_severity(const std::string& name);

} // namespace flux::logger

#endif // FLUX_LOGGER_HPP
