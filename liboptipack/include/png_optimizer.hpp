/**
 * @file png_optimizer.hpp
 * @brief Defines the IImageOptimizer implementation for PNG files.
 */

#ifndef OPTIPACK_PNG_OPTIMIZER_HPP
#define OPTIPACK_PNG_OPTIMIZER_HPP

#include "image_optimizer.hpp"

namespace optipack {

    /**
     * @brief Lossless PNG recompression using libpng and zlib.
     *
     * @details Rewrites the image data at zlib level 9 with adaptive
     * filtering, drops textual and timestamp chunks, keeps colour
     * management chunks, and removes an alpha channel that is fully
     * opaque.
     */
    class PngOptimizer final : public IImageOptimizer {
    public:
        [[nodiscard]] std::string_view get_name() const noexcept override {
            return "PngOptimizer";
        }

        [[nodiscard]] ImageFormat format() const noexcept override { return ImageFormat::Png; }

        std::optional<ByteBuffer> optimize(ByteView input,
                                           const OptimizationOptions& options) override;

        /**
         * @brief Whether the PNG declares any transparency.
         *
         * True when the colour type carries an alpha channel or a tRNS
         * chunk is present. Pixel values are not inspected: a fully
         * opaque RGBA image still counts as having alpha.
         *
         * @throws std::runtime_error if the header cannot be read.
         */
        static bool has_alpha_channel(ByteView input);

        /**
         * @brief Decodes to 8-bit gray or RGB, for JPEG conversion.
         *
         * Palette images are expanded and 16-bit samples are reduced to 8 bits.
         * Must only be used on images without alpha.
         *
         * @throws std::runtime_error on decode failure.
         */
        static RasterImage decode_opaque(ByteView input);
    };

} // namespace optipack

#endif // OPTIPACK_PNG_OPTIMIZER_HPP
