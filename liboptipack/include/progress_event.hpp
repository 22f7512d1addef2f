#ifndef OPTIPACK_PROGRESS_EVENT_HPP
#define OPTIPACK_PROGRESS_EVENT_HPP

#include "optimized_result.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>
#include <variant>

namespace optipack {

/**
 * @brief Events a job produces while it runs.
 *
 * These lightweight structs travel through a job's EventChannel to every
 * attached consumer. They are data carriers without behavior. Each job
 * emits one FileComplete per processed entry, each followed by a
 * Progress, and ends with exactly one terminal event (Complete or Failed).
 */

/**
 * @brief Aggregate progress after an entry finished.
 */
struct Progress {
    int percent = 0; ///< processed / total * 100, non-decreasing, 100 on the last entry
};

/**
 * @brief One entry has been transformed.
 */
struct FileComplete {
    OptimizedResult result;
};

/**
 * @brief Terminal: the artifact is stored and can be fetched.
 */
struct Complete {
    std::string artifact_id;
};

/**
 * @brief Terminal: the job failed as a whole; no artifact exists.
 */
struct Failed {
    std::string reason;
};

using ProgressEvent = std::variant<Progress, FileComplete, Complete, Failed>;

[[nodiscard]] inline bool is_terminal(const ProgressEvent& event) noexcept {
    return std::holds_alternative<Complete>(event) || std::holds_alternative<Failed>(event);
}

/**
 * @brief Wire type tag: "progress", "file_complete", "complete" or "failed".
 */
[[nodiscard]] std::string_view event_type(const ProgressEvent& event) noexcept;

/**
 * @brief Encodes an event as a discriminated JSON record.
 *
 * Example: {"type":"progress","percent":50}
 */
[[nodiscard]] nlohmann::json to_json(const ProgressEvent& event);

/**
 * @brief Serialises an event to one UTF-8 JSON message.
 */
[[nodiscard]] std::string encode_event(const ProgressEvent& event);

/**
 * @brief Parses a message produced by encode_event().
 * @throws ValidationError on malformed JSON or an unknown type tag.
 */
[[nodiscard]] ProgressEvent decode_event(std::string_view message);

[[nodiscard]] nlohmann::json to_json(const OptimizedResult& result);

} // namespace optipack

#endif // OPTIPACK_PROGRESS_EVENT_HPP
