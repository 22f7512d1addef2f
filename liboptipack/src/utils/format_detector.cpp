#include "../../include/format_detector.hpp"
#include "../../include/logger.hpp"
#include <magic.h>
#include <filesystem>

namespace optipack {

namespace {

// one libmagic handle per thread: magic_t is not safe to share
class MagicCookie {
public:
    MagicCookie() {
        cookie_ = magic_open(MAGIC_MIME_TYPE | MAGIC_ERROR);
        if (!cookie_) {
            Logger::log(LogLevel::Warning, "magic_open failed, falling back to extensions", "libmagic");
            return;
        }
        if (magic_load(cookie_, nullptr) != 0) {
            Logger::log(LogLevel::Warning,
                        std::string("magic_load failed: ") + (magic_error(cookie_) ? magic_error(cookie_) : "?"),
                        "libmagic");
            magic_close(cookie_);
            cookie_ = nullptr;
        }
    }

    ~MagicCookie() {
        if (cookie_) magic_close(cookie_);
    }

    MagicCookie(const MagicCookie&) = delete;
    MagicCookie& operator=(const MagicCookie&) = delete;

    [[nodiscard]] magic_t get() const noexcept { return cookie_; }

private:
    magic_t cookie_ = nullptr;
};

magic_t thread_cookie() {
    thread_local MagicCookie cookie;
    return cookie.get();
}

} // namespace

std::string FormatDetector::detect_mime(const ByteView data) {
    if (data.empty()) return {};
    const magic_t magic = thread_cookie();
    if (!magic) return {};
    const char* mime = magic_buffer(magic, data.data(), data.size());
    return mime ? mime : "";
}

ImageFormat FormatDetector::detect(const std::string_view name, const ByteView data) {
    if (const auto by_content = image_format_from_mime(detect_mime(data))) {
        return *by_content;
    }
    if (const auto by_name = image_format_from_extension(std::filesystem::path(name))) {
        return *by_name;
    }
    return ImageFormat::Unknown;
}

bool FormatDetector::is_image_entry(const std::string_view name, const ByteView data) {
    if (image_format_from_extension(std::filesystem::path(name))) return true;
    return image_format_from_mime(detect_mime(data)).has_value();
}

} // namespace optipack
