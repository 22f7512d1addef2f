/**
 * @file image_format.hpp
 * @brief Defines the raster formats optipack recognises and their mappings.
 *
 * Provides the ImageFormat enum together with maps and helpers to convert
 * between the enum, MIME types, file extensions and display names.
 */

#ifndef OPTIPACK_IMAGE_FORMAT_HPP
#define OPTIPACK_IMAGE_FORMAT_HPP

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace optipack {

/**
 * @brief Enumerates the raster formats an archive entry can be detected as.
 */
enum class ImageFormat {
    Jpeg,
    Png,
    Gif,
    Bmp,
    Tiff,
    Webp,
    Unknown
};

///< Map linking MIME type strings to their corresponding ImageFormat.
inline const std::unordered_map<std::string, ImageFormat> mime_to_image_format = {
    { "image/jpeg",        ImageFormat::Jpeg },
    { "image/pjpeg",       ImageFormat::Jpeg },
    { "image/png",         ImageFormat::Png },
    { "image/apng",        ImageFormat::Png },
    { "image/gif",         ImageFormat::Gif },
    { "image/bmp",         ImageFormat::Bmp },
    { "image/x-ms-bmp",    ImageFormat::Bmp },
    { "image/x-bmp",       ImageFormat::Bmp },
    { "image/tiff",        ImageFormat::Tiff },
    { "image/webp",        ImageFormat::Webp },
    { "image/x-webp",      ImageFormat::Webp },
};

///< Map linking lowercase file extensions to their ImageFormat.
inline const std::unordered_map<std::string, ImageFormat> ext_to_image_format = {
    { ".jpg",  ImageFormat::Jpeg },
    { ".jpeg", ImageFormat::Jpeg },
    { ".png",  ImageFormat::Png },
    { ".gif",  ImageFormat::Gif },
    { ".bmp",  ImageFormat::Bmp },
    { ".tif",  ImageFormat::Tiff },
    { ".tiff", ImageFormat::Tiff },
    { ".webp", ImageFormat::Webp },
};

/**
 * @brief Converts an ImageFormat to its lowercase display name.
 * @param fmt The ImageFormat enum value.
 * @return A string such as "jpeg", "png" or "unknown".
 */
inline std::string_view image_format_to_string(const ImageFormat fmt) {
    switch (fmt) {
        case ImageFormat::Jpeg: return "jpeg";
        case ImageFormat::Png:  return "png";
        case ImageFormat::Gif:  return "gif";
        case ImageFormat::Bmp:  return "bmp";
        case ImageFormat::Tiff: return "tiff";
        case ImageFormat::Webp: return "webp";
        default:                return "unknown";
    }
}

inline std::string lowercase_extension(const std::filesystem::path& name) {
    std::string ext = name.extension().string();
    std::ranges::transform(ext, ext.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

/**
 * @brief Maps an entry name to a format using only its extension.
 *
 * The match is case-insensitive ("A.JPG" is a JPEG).
 *
 * @param name Entry name or path.
 * @return The format, or std::nullopt when the extension is not an image one.
 */
inline std::optional<ImageFormat> image_format_from_extension(const std::filesystem::path& name) {
    const auto it = ext_to_image_format.find(lowercase_extension(name));
    if (it == ext_to_image_format.end()) return std::nullopt;
    return it->second;
}

/**
 * @brief Maps a MIME type to a format.
 * @return The format, or std::nullopt for non-image MIME types.
 */
inline std::optional<ImageFormat> image_format_from_mime(const std::string& mime) {
    const auto it = mime_to_image_format.find(mime);
    if (it == mime_to_image_format.end()) return std::nullopt;
    return it->second;
}

} // namespace optipack

#endif // OPTIPACK_IMAGE_FORMAT_HPP
