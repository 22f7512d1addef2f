/**
 * @file optimization_options.hpp
 * @brief Per-job optimization settings and their validation.
 */

#ifndef OPTIPACK_OPTIMIZATION_OPTIONS_HPP
#define OPTIPACK_OPTIMIZATION_OPTIONS_HPP

#include <string>
#include <string_view>

namespace optipack {

    inline constexpr int kMinJpegQuality = 1;
    inline constexpr int kMaxJpegQuality = 100;
    inline constexpr int kDefaultJpegQuality = 85;

    /**
     * @brief Settings applied to every image of one job.
     *
     * @details Immutable once a job is created. Out-of-range quality is a
     * rejection, never a clamp.
     */
    struct OptimizationOptions {
        int jpeg_quality = kDefaultJpegQuality;  ///< JPEG encoder quality, 1..100
        bool convert_png_to_jpeg = false;        ///< Convert opaque PNGs to JPEG

        /**
         * @brief Checks the option ranges.
         * @throws ValidationError if jpeg_quality is outside [1, 100].
         */
        void validate() const;

        /**
         * @brief Builds options from textual form fields.
         *
         * An empty quality string selects the default. The quality must be
         * a plain decimal integer; "85.5" or "high" are rejected.
         *
         * @param quality The raw quality value.
         * @param convert_png The raw conversion flag (see parse_flag()).
         * @return Validated options.
         * @throws ValidationError on malformed or out-of-range input.
         */
        static OptimizationOptions parse(std::string_view quality, std::string_view convert_png);

        /**
         * @brief Parses an HTML-form style boolean.
         *
         * "on", "true", "yes", "1" are true; "", "off", "false", "no", "0"
         * are false (case-insensitive).
         *
         * @throws ValidationError for anything else.
         */
        static bool parse_flag(std::string_view value);

        bool operator==(const OptimizationOptions&) const = default;
    };

    std::string to_string(const OptimizationOptions& options);

} // namespace optipack

#endif // OPTIPACK_OPTIMIZATION_OPTIONS_HPP
