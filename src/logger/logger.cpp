#include "logger/logger.hpp"
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/core/null_deleter.hpp>
#include <boost/shared_ptr.hpp>
#include <boost/make_shared.hpp>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace bsync {
namespace logger {

namespace {

namespace expr = boost::log::expressions;

// Common line layout shared by the file and console sinks
auto make_formatter() {
  return expr::stream
    << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
    << " [" << boost::log::trivial::severity << "] "
    << expr::smessage;
}

} // namespace

severity_level parse_severity(const std::string& name) {
  std::string lowered(name);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (lowered == "trace")   return severity_level::trace;
  if (lowered == "debug")   return severity_level::debug;
  if (lowered == "info")    return severity_level::info;
  if (lowered == "warning" || lowered == "warn") return severity_level::warning;
  if (lowered == "error")   return severity_level::error;
  if (lowered == "fatal")   return severity_level::fatal;

  throw std::invalid_argument("Unknown log level: " + name);
}

void init_logging(const std::string& log_file, severity_level min_level, bool console) {
  try {
    // Clear any existing sinks
    boost::log::core::get()->remove_all_sinks();

    if (!log_file.empty()) {
      // Convert to absolute path so the log location does not depend on later chdir
      std::filesystem::path log_path = std::filesystem::absolute(log_file);
      if (log_path.has_parent_path()) {
        std::filesystem::create_directories(log_path.parent_path());
      }

      auto backend = boost::make_shared<boost::log::sinks::text_file_backend>();
      backend->set_file_name_pattern(log_path.string());
      backend->set_open_mode(std::ios::out | std::ios::app);
      backend->auto_flush(true);

      using file_sink = boost::log::sinks::synchronous_sink<boost::log::sinks::text_file_backend>;
      auto sink = boost::make_shared<file_sink>(backend);
      sink->set_formatter(make_formatter());
      boost::log::core::get()->add_sink(sink);
    }

    if (console) {
      auto backend = boost::make_shared<boost::log::sinks::text_ostream_backend>();
      backend->add_stream(boost::shared_ptr<std::ostream>(&std::clog, boost::null_deleter()));
      backend->auto_flush(true);

      using console_sink = boost::log::sinks::synchronous_sink<boost::log::sinks::text_ostream_backend>;
      auto sink = boost::make_shared<console_sink>(backend);
      sink->set_formatter(make_formatter());
      boost::log::core::get()->add_sink(sink);
    }

    boost::log::add_common_attributes();
    set_log_level(min_level);
    boost::log::core::get()->set_logging_enabled(true);

    BOOST_LOG_TRIVIAL(debug) << "Logger: Logging initialized, file: "
                             << (log_file.empty() ? std::string("<none>") : log_file);
  }
  catch (const std::exception& e) {
    std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
    throw;
  }
}

void set_log_level(severity_level min_level) {
  boost::log::core::get()->set_filter(boost::log::trivial::severity >= min_level);
}

} // namespace logger
} // namespace bsync
