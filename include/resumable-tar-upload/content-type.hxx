#pragma once

#include <string>
#include <string_view>

namespace resumable_tar_upload {
/// Content type used when an extension is unknown.
inline constexpr const char *default_content_type = "application/octet-stream";

/**
 * @brief Guess a media content type from the extension of @p path.
 *
 * Matching is case-insensitive. Unknown extensions give
 * default_content_type.
 */
std::string detect_content_type(std::string_view path);

/// Whether @p content_type names an image (`image/...`).
bool is_image_content_type(std::string_view content_type) noexcept;
} // namespace resumable_tar_upload
