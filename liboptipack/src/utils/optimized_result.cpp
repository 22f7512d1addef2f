#include "../../include/optimized_result.hpp"
#include "../../include/job.hpp"

namespace optipack {

std::string_view to_string(const ResultStatus status) noexcept {
    switch (status) {
        case ResultStatus::Success: return "success";
        case ResultStatus::Skipped: return "skipped";
        case ResultStatus::Error:   return "error";
    }
    return "error";
}

std::string_view to_string(const JobState state) noexcept {
    switch (state) {
        case JobState::Created: return "created";
        case JobState::Running: return "running";
        case JobState::Done:    return "done";
        case JobState::Failed:  return "failed";
    }
    return "failed";
}

double compute_saving_percentage(const std::uint64_t original_size,
                                 const std::uint64_t optimized_size) noexcept {
    if (original_size == 0) return 0.0;
    return (static_cast<double>(original_size) - static_cast<double>(optimized_size))
           / static_cast<double>(original_size) * 100.0;
}

} // namespace optipack
