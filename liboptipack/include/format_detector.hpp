#ifndef OPTIPACK_FORMAT_DETECTOR_HPP
#define OPTIPACK_FORMAT_DETECTOR_HPP

#include "byte_buffer.hpp"
#include "image_format.hpp"
#include <string>
#include <string_view>

namespace optipack {

    /**
     * @brief Content-based image format detection.
     *
     * Sniffs the bytes with libmagic and falls back to the entry's file
     * extension when libmagic cannot load its database or reports a
     * non-image type.
     */
    class FormatDetector {
    public:
        /**
         * @brief Detect the MIME type of an in-memory buffer.
         * @param data The bytes to inspect.
         * @return A MIME string (e.g. "image/png"), or empty if libmagic failed.
         */
        static std::string detect_mime(ByteView data);

        /**
         * @brief Detect the image format of an archive entry.
         *
         * Content wins over the name: a PNG stored as "photo.jpg" is a PNG.
         *
         * @param name The entry name, used for the extension fallback.
         * @param data The entry bytes.
         * @return The detected format, ImageFormat::Unknown if neither check matches.
         */
        static ImageFormat detect(std::string_view name, ByteView data);

        /**
         * @brief Whether an archive entry should be treated as an image.
         *
         * True when the extension is an image extension or the content
         * sniffs as a supported image format.
         */
        static bool is_image_entry(std::string_view name, ByteView data);
    };

} // namespace optipack

#endif // OPTIPACK_FORMAT_DETECTOR_HPP
