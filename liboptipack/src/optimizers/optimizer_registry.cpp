#include "../../include/optimizer_registry.hpp"
#include "../../include/bmp_optimizer.hpp"
#include "../../include/jpeg_optimizer.hpp"
#include "../../include/png_optimizer.hpp"
#include "../../include/tiff_optimizer.hpp"
#include "../../include/webp_optimizer.hpp"
#include <algorithm>

namespace optipack {

OptimizerRegistry::OptimizerRegistry() {
    optimizers_.push_back(std::make_unique<JpegOptimizer>());
    optimizers_.push_back(std::make_unique<PngOptimizer>());
    optimizers_.push_back(std::make_unique<TiffOptimizer>());
    optimizers_.push_back(std::make_unique<WebpOptimizer>());
    optimizers_.push_back(std::make_unique<BmpOptimizer>());
}

IImageOptimizer* OptimizerRegistry::find(const ImageFormat format) const {
    const auto it = std::ranges::find_if(optimizers_, [format](const auto& opt) {
        return opt->format() == format;
    });
    return it == optimizers_.end() ? nullptr : it->get();
}

} // namespace optipack
