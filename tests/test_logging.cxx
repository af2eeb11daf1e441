#include <resumable-tar-upload/errors.hxx>
#include <resumable-tar-upload/logging.hxx>

#include <gtest/gtest.h>

namespace rtu = resumable_tar_upload;
using boost::log::trivial::severity_level;

TEST(Logging, ParsesSeverityNames) {
  EXPECT_EQ(rtu::parse_severity("trace"), severity_level::trace);
  EXPECT_EQ(rtu::parse_severity("debug"), severity_level::debug);
  EXPECT_EQ(rtu::parse_severity("info"), severity_level::info);
  EXPECT_EQ(rtu::parse_severity("warning"), severity_level::warning);
  EXPECT_EQ(rtu::parse_severity("error"), severity_level::error);
  EXPECT_THROW(rtu::parse_severity("verbose"), rtu::InvalidInputError);
  EXPECT_THROW(rtu::parse_severity("INFO"), rtu::InvalidInputError);
}
