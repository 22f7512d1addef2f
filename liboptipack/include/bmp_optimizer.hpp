#ifndef OPTIPACK_BMP_OPTIMIZER_HPP
#define OPTIPACK_BMP_OPTIMIZER_HPP

#include "image_optimizer.hpp"

namespace optipack {

    /**
     * @brief BMP recompression via bmplib (RLE4/RLE8/RLE24 where they apply).
     *
     * OS/2 bitmap arrays are left alone.
     */
    class BmpOptimizer final : public IImageOptimizer {
    public:
        [[nodiscard]] std::string_view get_name() const noexcept override {
            return "BmpOptimizer";
        }

        [[nodiscard]] ImageFormat format() const noexcept override { return ImageFormat::Bmp; }

        std::optional<ByteBuffer> optimize(ByteView input,
                                           const OptimizationOptions& options) override;
    };

} // namespace optipack

#endif // OPTIPACK_BMP_OPTIMIZER_HPP
