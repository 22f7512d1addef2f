/**
 * @file job.hpp
 * @brief Job lifecycle states and the read-only job snapshot.
 */

#ifndef OPTIPACK_JOB_HPP
#define OPTIPACK_JOB_HPP

#include "optimization_options.hpp"
#include "optimized_result.hpp"
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace optipack {

    using JobId = std::string;
    using Clock = std::chrono::system_clock;

    /**
     * @brief Job state machine: Created -> Running -> {Done, Failed}.
     *
     * Done and Failed are absorbing.
     */
    enum class JobState {
        Created,
        Running,
        Done,
        Failed
    };

    [[nodiscard]] std::string_view to_string(JobState state) noexcept;

    [[nodiscard]] inline bool is_terminal(const JobState state) noexcept {
        return state == JobState::Done || state == JobState::Failed;
    }

    /**
     * @brief Copy of a job's current state.
     *
     * Reconnecting consumers rebuild their view from a snapshot and then
     * follow the event stream from that point on.
     */
    struct JobSnapshot {
        JobId id;
        JobState state = JobState::Created;
        OptimizationOptions options;
        Clock::time_point created_at{};
        std::optional<Clock::time_point> finished_at;
        std::optional<Clock::time_point> retrieved_at; ///< first successful artifact fetch
        std::optional<std::string> artifact_id;
        std::optional<std::string> failure_reason;
        std::size_t total_entries = 0;
        std::size_t processed_entries = 0;
        int percent = 0;
        std::vector<OptimizedResult> results;
    };

} // namespace optipack

#endif // OPTIPACK_JOB_HPP
