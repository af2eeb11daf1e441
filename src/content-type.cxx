#include <resumable-tar-upload/content-type.hxx>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iterator>

namespace resumable_tar_upload {
namespace {

struct ExtensionType {
  std::string_view extension;
  std::string_view content_type;
};

constexpr ExtensionType known_types[] = {
    {".avif", "image/avif"},       {".bmp", "image/bmp"},
    {".gif", "image/gif"},         {".heic", "image/heic"},
    {".jpeg", "image/jpeg"},       {".jpg", "image/jpeg"},
    {".png", "image/png"},         {".svg", "image/svg+xml"},
    {".tif", "image/tiff"},        {".tiff", "image/tiff"},
    {".webp", "image/webp"},       {".avi", "video/x-msvideo"},
    {".m4v", "video/x-m4v"},       {".mkv", "video/x-matroska"},
    {".mov", "video/quicktime"},   {".mp4", "video/mp4"},
    {".mpeg", "video/mpeg"},       {".webm", "video/webm"},
    {".aac", "audio/aac"},         {".flac", "audio/flac"},
    {".m4a", "audio/mp4"},         {".mp3", "audio/mpeg"},
    {".ogg", "audio/ogg"},         {".wav", "audio/wav"},
    {".pdf", "application/pdf"},   {".json", "application/json"},
    {".txt", "text/plain"},        {".csv", "text/csv"},
    {".tar", "application/x-tar"}, {".zip", "application/zip"},
};

} // unnamed namespace

std::string detect_content_type(std::string_view path) {
  auto extension = std::filesystem::path(path).extension().string();
  std::transform(extension.begin(), extension.end(), extension.begin(),
                 [](unsigned char c) {
                   return static_cast<char>(std::tolower(c));
                 });

  const auto it = std::find_if(
      std::begin(known_types), std::end(known_types),
      [&extension](const ExtensionType &t) { return t.extension == extension; });
  if (it == std::end(known_types))
    return default_content_type;
  return std::string(it->content_type);
}

bool is_image_content_type(std::string_view content_type) noexcept {
  constexpr std::string_view prefix = "image/";
  if (content_type.size() <= prefix.size())
    return false;
  for (std::size_t i = 0; i < prefix.size(); ++i)
    if (std::tolower(static_cast<unsigned char>(content_type[i])) != prefix[i])
      return false;
  return true;
}
} // namespace resumable_tar_upload
