#pragma once

// Normally injected by the build from the project version.
#ifndef RESUMABLE_TAR_UPLOAD_VERSION
#define RESUMABLE_TAR_UPLOAD_VERSION "0.0.0"
#endif

namespace resumable_tar_upload {
/// Version string reported by the command line tool and the User-Agent.
inline constexpr const char *version = RESUMABLE_TAR_UPLOAD_VERSION;
} // namespace resumable_tar_upload
