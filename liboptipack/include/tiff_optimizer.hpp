/**
 * @file tiff_optimizer.hpp
 * @brief Defines the IImageOptimizer implementation for TIFF files.
 */

#ifndef OPTIPACK_TIFF_OPTIMIZER_HPP
#define OPTIPACK_TIFF_OPTIMIZER_HPP

#include "image_optimizer.hpp"

namespace optipack {

    /**
     * @brief Re-encodes every TIFF page as RGBA with Adobe Deflate and a
     * horizontal predictor. Multi-page files are preserved page by page.
     */
    class TiffOptimizer final : public IImageOptimizer {
    public:
        [[nodiscard]] std::string_view get_name() const noexcept override {
            return "TiffOptimizer";
        }

        [[nodiscard]] ImageFormat format() const noexcept override { return ImageFormat::Tiff; }

        std::optional<ByteBuffer> optimize(ByteView input,
                                           const OptimizationOptions& options) override;
    };

} // namespace optipack

#endif // OPTIPACK_TIFF_OPTIMIZER_HPP
