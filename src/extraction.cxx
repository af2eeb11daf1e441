#include <resumable-tar-upload/extraction.hxx>

#include <algorithm>
#include <iterator>
#include <string_view>

namespace resumable_tar_upload {
namespace {

constexpr std::string_view internal_keys[] = {
    "upload_id",
    "uploadId",
    "detected_media_type",
    "analysis_mode_requested",
    "analysis_mode_used",
    "multipass",
    "model",
};

bool is_internal_key_impl(const rapidjson::Value &name) {
  const std::string_view key(name.GetString(), name.GetStringLength());
  return std::find(std::begin(internal_keys), std::end(internal_keys), key) !=
         std::end(internal_keys);
}

void strip_impl(rapidjson::Value &value) {
  if (value.IsArray()) {
    for (auto &item : value.GetArray())
      strip_impl(item);
    return;
  }
  if (!value.IsObject())
    return;

  for (auto it = value.MemberBegin(); it != value.MemberEnd();) {
    if (is_internal_key_impl(it->name)) {
      it = value.EraseMember(it);
    } else {
      strip_impl(it->value);
      ++it;
    }
  }
}

} // unnamed namespace

void strip_internal_fields(rapidjson::Document &value) {
  if (!value.IsObject()) {
    value.SetObject();
    return;
  }
  strip_impl(value);
}
} // namespace resumable_tar_upload
