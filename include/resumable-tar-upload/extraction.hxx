#pragma once

#include <rapidjson/document.h>

namespace resumable_tar_upload {
/**
 * @brief Remove server-internal bookkeeping from analysis metadata.
 *
 * Drops the keys `upload_id`, `uploadId`, `detected_media_type`,
 * `analysis_mode_requested`, `analysis_mode_used`, `multipass` and `model`
 * from every object nested anywhere in @p value, arrays included. A
 * top-level value that is not an object is replaced by an empty object.
 */
void strip_internal_fields(rapidjson::Document &value);
} // namespace resumable_tar_upload
