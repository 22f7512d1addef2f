/**
 * @file job_registry.hpp
 * @brief Thread-safe registry of job identity, state and artifact location.
 */

#ifndef OPTIPACK_JOB_REGISTRY_HPP
#define OPTIPACK_JOB_REGISTRY_HPP

#include "job.hpp"
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <stop_token>
#include <string>
#include <unordered_map>
#include <vector>

namespace optipack {

/**
 * @brief Lifetime counters since the process started.
 */
struct ServiceStats {
    std::uint64_t jobs_submitted = 0;
    std::uint64_t jobs_completed = 0;
    std::uint64_t jobs_failed = 0;
    std::uint64_t files_processed = 0;
};

/**
 * @brief Owns every job record and its transitions.
 *
 * @details The map is guarded by a shared mutex that is only held to
 * look records up or to insert and erase them. Each record has its own
 * mutex, so updates for one job never contend with another job.
 *
 * Terminal transitions return whether they took effect. The caller that
 * wins the transition is the one that publishes the terminal event, which
 * keeps "exactly one terminal event" true when the runner and the reaper
 * race.
 */
class JobRegistry {
public:
    /**
     * @brief Registers a new job in state Created.
     * @return The new job id (32 lowercase hex characters).
     */
    JobId create(const OptimizationOptions& options);

    /**
     * @brief Created -> Running.
     * @return false if the job is unknown or not in Created.
     */
    bool mark_running(const JobId& id);

    void set_total(const JobId& id, std::size_t total);

    /**
     * @brief Appends a per-entry result and updates progress counters.
     */
    void record_result(const JobId& id, const OptimizedResult& result, int percent);

    /**
     * @brief Records the finished artifact and transitions to Done.
     * @return false if the job is unknown or already terminal.
     */
    bool register_artifact(const JobId& id, const std::string& artifact_id);

    /**
     * @brief Transitions to Failed.
     * @return false if the job is unknown or already terminal.
     */
    bool mark_failed(const JobId& id, const std::string& reason);

    /**
     * @brief Snapshot of a job.
     * @throws NotFoundError for unknown or removed jobs.
     */
    [[nodiscard]] JobSnapshot lookup(const JobId& id) const;

    [[nodiscard]] std::optional<JobSnapshot> find(const JobId& id) const;

    /**
     * @brief Resolves a job id or an artifact id to a finished artifact id.
     * @return std::nullopt unless the job is Done and its artifact is registered.
     */
    [[nodiscard]] std::optional<std::string> resolve_artifact(const std::string& job_or_artifact_id) const;

    /**
     * @brief Stamps the first retrieval of an artifact. Later calls keep the first stamp.
     */
    void mark_retrieved(const std::string& artifact_id, Clock::time_point when);

    /**
     * @brief Stop token the runner polls between entries.
     */
    [[nodiscard]] std::stop_token stop_token(const JobId& id) const;

    /**
     * @brief Requests cooperative cancellation of a job.
     */
    bool request_stop(const JobId& id);

    void remove(const JobId& id);

    [[nodiscard]] std::vector<JobSnapshot> list() const;
    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] ServiceStats stats() const;

private:
    struct Record {
        mutable std::mutex mtx;
        JobSnapshot snapshot;
        std::stop_source stop;
    };

    [[nodiscard]] std::shared_ptr<Record> get(const JobId& id) const;

    mutable std::shared_mutex mtx_;
    std::unordered_map<JobId, std::shared_ptr<Record>> jobs_;
    std::unordered_map<std::string, JobId> artifacts_; ///< artifact id -> job id

    std::atomic<std::uint64_t> jobs_submitted_{0};
    std::atomic<std::uint64_t> jobs_completed_{0};
    std::atomic<std::uint64_t> jobs_failed_{0};
    std::atomic<std::uint64_t> files_processed_{0};
};

} // namespace optipack

#endif // OPTIPACK_JOB_REGISTRY_HPP
