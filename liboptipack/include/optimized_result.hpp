/**
 * @file optimized_result.hpp
 * @brief Outcome of transforming one archive entry.
 */

#ifndef OPTIPACK_OPTIMIZED_RESULT_HPP
#define OPTIPACK_OPTIMIZED_RESULT_HPP

#include "image_format.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace optipack {

    /**
     * @brief Per-entry status.
     */
    enum class ResultStatus {
        Success, ///< Re-encoded (or converted) bytes were emitted
        Skipped, ///< Original bytes emitted unchanged
        Error    ///< Decoding failed; original bytes emitted unchanged
    };

    [[nodiscard]] std::string_view to_string(ResultStatus status) noexcept;

    /**
     * @brief Immutable per-entry metrics, produced by the ImageTransformer.
     */
    struct OptimizedResult {
        std::string name;                       ///< Entry name in the submitted archive
        std::string output_name;                ///< Entry name in the result archive
        ImageFormat format = ImageFormat::Unknown; ///< Detected source format
        std::uint64_t original_size = 0;        ///< Source size in bytes
        std::uint64_t optimized_size = 0;       ///< Emitted size in bytes
        double saving_percentage = 0.0;         ///< May be negative
        ResultStatus status = ResultStatus::Skipped;
        std::optional<std::string> error_detail; ///< Set for ERROR results
        bool converted = false;                 ///< PNG re-encoded as JPEG

        bool operator==(const OptimizedResult&) const = default;
    };

    /**
     * @brief (original - optimized) / original * 100.
     *
     * Negative when the output grew. A zero-byte original yields 0.
     */
    [[nodiscard]] double compute_saving_percentage(std::uint64_t original_size,
                                                   std::uint64_t optimized_size) noexcept;

} // namespace optipack

#endif // OPTIPACK_OPTIMIZED_RESULT_HPP
