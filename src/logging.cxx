#include <resumable-tar-upload/errors.hxx>
#include <resumable-tar-upload/logging.hxx>

#include <boost/date_time/posix_time/posix_time_types.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/keywords/format.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>

#include <iostream>
#include <string>

namespace logging = boost::log;
namespace expr = boost::log::expressions;

namespace resumable_tar_upload {

logging::trivial::severity_level parse_severity(std::string_view name) {
  using logging::trivial::severity_level;
  if (name == "trace")
    return severity_level::trace;
  if (name == "debug")
    return severity_level::debug;
  if (name == "info")
    return severity_level::info;
  if (name == "warning")
    return severity_level::warning;
  if (name == "error")
    return severity_level::error;
  throw InvalidInputError("Unknown log level: " + std::string(name));
}

void init_logging(logging::trivial::severity_level min_severity) {
  logging::add_common_attributes();
  logging::add_console_log(
      std::clog,
      logging::keywords::format =
          (expr::stream << expr::format_date_time<boost::posix_time::ptime>(
                               "TimeStamp", "%Y-%m-%d %H:%M:%S")
                        << " [" << logging::trivial::severity << "] "
                        << expr::smessage));
  logging::core::get()->set_filter(logging::trivial::severity >=
                                   min_severity);
}
} // namespace resumable_tar_upload
