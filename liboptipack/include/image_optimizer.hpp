/**
 * @file image_optimizer.hpp
 * @brief Defines the abstract interface for per-format image optimizers.
 *
 * Every supported raster format is handled by a concrete class derived
 * from IImageOptimizer. Optimizers work on in-memory buffers; the size
 * policy (keep the smaller artifact or always replace) is applied by the
 * ImageTransformer, not by the optimizer itself.
 */

#ifndef OPTIPACK_IMAGE_OPTIMIZER_HPP
#define OPTIPACK_IMAGE_OPTIMIZER_HPP

#include "byte_buffer.hpp"
#include "image_format.hpp"
#include "optimization_options.hpp"
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace optipack {

    /**
     * @brief Abstract interface for one format's recompression pass.
     */
    class IImageOptimizer {
    public:
        virtual ~IImageOptimizer() = default;

        /**
         * @brief Short identifier used in logs (e.g. "JpegOptimizer").
         */
        [[nodiscard]] virtual std::string_view get_name() const noexcept = 0;

        /**
         * @brief The format this optimizer accepts.
         */
        [[nodiscard]] virtual ImageFormat format() const noexcept = 0;

        /**
         * @brief Whether the candidate replaces the source even when larger.
         *
         * True for lossy re-encodes, whose point is the quality setting,
         * not the byte count. Lossless passes return false and are only
         * kept when they actually shrink the file.
         */
        [[nodiscard]] virtual bool always_replace() const noexcept { return false; }

        /**
         * @brief Produces a recompressed candidate for the given bytes.
         *
         * @param input The source image.
         * @param options Job options (quality, etc.).
         * @return The candidate bytes, or std::nullopt if this variant of
         * the format is deliberately left alone (e.g. lossy WebP).
         * @throws std::runtime_error if the bytes cannot be decoded or encoded.
         */
        virtual std::optional<ByteBuffer> optimize(ByteView input,
                                                   const OptimizationOptions& options) = 0;
    };

    /// Largest side length any decoder is allowed to accept.
    inline constexpr std::uint32_t kMaxImageDimension = 65535;

    /// Largest decoded raster, in pixels, an optimizer will allocate for.
    inline constexpr std::uint64_t kMaxImagePixels = std::uint64_t{1} << 27;

    /**
     * @brief Rejects header-declared dimensions before any pixel buffer is sized from them.
     * @throws std::runtime_error when the image is empty or larger than the limits above.
     */
    inline void check_pixel_budget(const std::uint64_t width, const std::uint64_t height,
                                   const std::string_view codec) {
        if (width == 0 || height == 0) {
            throw std::runtime_error(std::string(codec) + ": image has no pixels");
        }
        if (width > kMaxImageDimension || height > kMaxImageDimension || width * height > kMaxImagePixels) {
            throw std::runtime_error(std::string(codec) + ": image of " + std::to_string(width) + "x"
                                     + std::to_string(height) + " pixels exceeds the decode limit");
        }
    }

    /**
     * @brief 8-bit interleaved pixels, row-major, top-down.
     *
     * components is 1 (gray), 3 (RGB) or 4 (CMYK for JPEG sources).
     */
    struct RasterImage {
        unsigned width = 0;
        unsigned height = 0;
        int components = 0;
        ByteBuffer pixels;
    };

} // namespace optipack

#endif // OPTIPACK_IMAGE_OPTIMIZER_HPP
