#pragma once

#include <boost/log/trivial.hpp>

#include <string_view>

namespace resumable_tar_upload {
/**
 * @brief Parse a severity name: trace, debug, info, warning or error.
 *
 * @throws InvalidInputError for any other name.
 */
boost::log::trivial::severity_level parse_severity(std::string_view name);

/**
 * @brief Route the trivial logger to stderr with timestamps, dropping records
 * below @p min_severity.
 */
void init_logging(boost::log::trivial::severity_level min_severity);
} // namespace resumable_tar_upload
