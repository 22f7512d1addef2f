#ifndef OPTIPACK_WEBP_OPTIMIZER_HPP
#define OPTIPACK_WEBP_OPTIMIZER_HPP

#include "image_optimizer.hpp"

namespace optipack {

    /**
     * @brief Lossless WebP recompression with libwebp's strongest lossless preset.
     *
     * Lossy WebP inputs are left alone (optimize() returns std::nullopt).
     */
    class WebpOptimizer final : public IImageOptimizer {
    public:
        [[nodiscard]] std::string_view get_name() const noexcept override {
            return "WebpOptimizer";
        }

        [[nodiscard]] ImageFormat format() const noexcept override { return ImageFormat::Webp; }

        std::optional<ByteBuffer> optimize(ByteView input,
                                           const OptimizationOptions& options) override;
    };

} // namespace optipack

#endif // OPTIPACK_WEBP_OPTIMIZER_HPP
