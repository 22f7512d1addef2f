/**
 * @file image_transformer.hpp
 * @brief Applies the per-format optimization policy to one archive entry.
 */

#ifndef OPTIPACK_IMAGE_TRANSFORMER_HPP
#define OPTIPACK_IMAGE_TRANSFORMER_HPP

#include "byte_buffer.hpp"
#include "image_format.hpp"
#include "optimization_options.hpp"
#include "optimized_result.hpp"
#include "optimizer_registry.hpp"
#include <string_view>

namespace optipack {

    /**
     * @brief Bytes to store in the result archive plus the entry's metrics.
     */
    struct TransformOutput {
        ByteBuffer bytes;
        OptimizedResult result;
    };

    /**
     * @brief Stateless transformation of one image.
     *
     * @details Policy per declared format:
     * - JPEG: re-encoded at the job quality, always emitted (SUCCESS).
     * - PNG: lossless pass, kept only if smaller; with conversion enabled
     *   and no alpha channel, replaced by a JPEG named `<stem>.jpg`.
     * - TIFF, WebP, BMP: lossless pass, kept only if smaller.
     * - GIF: stored unchanged (SKIPPED).
     * - Unknown or undecodable: stored unchanged (ERROR, errorDetail set).
     *
     * Codec failures never escape transform(); std::bad_alloc does.
     */
    class ImageTransformer {
    public:
        explicit ImageTransformer(const OptimizerRegistry& registry) : registry_(registry) {}

        /**
         * @brief Transform one entry.
         * @param name Entry name in the submitted archive.
         * @param bytes Entry contents.
         * @param declared_format Detected format of the entry.
         * @param options Job options.
         * @return The bytes to archive and the OptimizedResult describing them.
         * @throws std::bad_alloc when memory runs out.
         */
        [[nodiscard]] TransformOutput transform(std::string_view name,
                                                ByteView bytes,
                                                ImageFormat declared_format,
                                                const OptimizationOptions& options) const;

        /**
         * @brief Name of a PNG entry once converted: same directory, `.jpg` extension.
         */
        [[nodiscard]] static std::string converted_name(std::string_view name);

    private:
        const OptimizerRegistry& registry_;
    };

} // namespace optipack

#endif // OPTIPACK_IMAGE_TRANSFORMER_HPP
