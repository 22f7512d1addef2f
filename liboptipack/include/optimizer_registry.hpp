/**
 * @file optimizer_registry.hpp
 * @brief Defines the registry that owns one IImageOptimizer per format.
 */

#ifndef OPTIPACK_OPTIMIZER_REGISTRY_HPP
#define OPTIPACK_OPTIMIZER_REGISTRY_HPP

#include "image_optimizer.hpp"
#include <memory>
#include <vector>

namespace optipack {

/**
 * @brief Registry of the built-in image optimizers.
 *
 * @details Owns the lifetime of every concrete IImageOptimizer. The
 * optimizers hold no per-call state, so one registry is shared by all
 * concurrently running jobs.
 */
class OptimizerRegistry {
public:
    /**
     * @brief Construct and register all built-in optimizers.
     */
    OptimizerRegistry();

    /**
     * @brief Find the optimizer for a format.
     * @return A non-owning pointer, or nullptr if the format has no
     * optimization pass (GIF, Unknown).
     */
    [[nodiscard]] IImageOptimizer* find(ImageFormat format) const;

    [[nodiscard]] const std::vector<std::unique_ptr<IImageOptimizer>>& all() const { return optimizers_; }

private:
    ///< Owned instances of all registered optimizers.
    std::vector<std::unique_ptr<IImageOptimizer>> optimizers_;
};

} // namespace optipack

#endif // OPTIPACK_OPTIMIZER_REGISTRY_HPP
