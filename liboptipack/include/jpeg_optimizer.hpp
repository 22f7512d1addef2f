/**
 * @file jpeg_optimizer.hpp
 * @brief Defines the IImageOptimizer implementation for JPEG files.
 */

#ifndef OPTIPACK_JPEG_OPTIMIZER_HPP
#define OPTIPACK_JPEG_OPTIMIZER_HPP

#include "image_optimizer.hpp"

namespace optipack {

    /**
     * @brief Re-encodes JPEG files at the job's quality using libjpeg.
     *
     * @details Performs a full decode and encode cycle with Huffman
     * optimisation. APPn and COM markers (EXIF, XMP, comments) are not
     * carried over. Corrupt-data warnings raised while decoding, such as
     * a premature end of data, are treated as errors.
     */
    class JpegOptimizer final : public IImageOptimizer {
    public:
        [[nodiscard]] std::string_view get_name() const noexcept override {
            return "JpegOptimizer";
        }

        [[nodiscard]] ImageFormat format() const noexcept override { return ImageFormat::Jpeg; }

        [[nodiscard]] bool always_replace() const noexcept override { return true; }

        /**
         * @brief Decodes and re-encodes the input at options.jpeg_quality.
         * @throws std::runtime_error if libjpeg rejects the input.
         */
        std::optional<ByteBuffer> optimize(ByteView input,
                                           const OptimizationOptions& options) override;

        /**
         * @brief Decodes a JPEG into a RasterImage (gray, RGB or CMYK).
         * @throws std::runtime_error on a fatal error or a corrupt-data warning.
         */
        static RasterImage decode(ByteView input, bool* progressive = nullptr);

        /**
         * @brief Encodes 8-bit pixels as a baseline or progressive JPEG.
         * @param image Gray, RGB or CMYK pixels.
         * @param quality 1..100.
         * @param progressive Emit a progressive scan script.
         * @throws std::runtime_error if libjpeg fails.
         */
        static ByteBuffer encode(const RasterImage& image, int quality, bool progressive = false);
    };

} // namespace optipack

#endif // OPTIPACK_JPEG_OPTIMIZER_HPP
