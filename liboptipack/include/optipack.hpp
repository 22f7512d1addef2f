/**
 * @file optipack.hpp
 * @brief Public API of the optipack library.
 */

#ifndef OPTIPACK_HPP
#define OPTIPACK_HPP

#include "byte_buffer.hpp"
#include "event_channel.hpp"
#include "job.hpp"
#include "job_registry.hpp"
#include "optimization_options.hpp"
#include "service_config.hpp"
#include <cstddef>
#include <memory>
#include <string>

namespace optipack {

/**
 * @brief A job id together with a subscription attached before the job started.
 */
struct SubmittedJob {
    JobId job_id;
    std::shared_ptr<EventSubscription> events;
};

/**
 * @brief Asynchronous batch image optimization.
 *
 * @details Accepts archives, runs each as a job on a worker pool, exposes
 * each job's progress as an event stream and keeps finished archives
 * available for retrieval until they are fetched or their retention
 * expires. Uses the PIMPL idiom to hide the codec and archive stacks.
 *
 * All member functions are thread-safe.
 */
class OptimizationService {
public:
    explicit OptimizationService(ServiceConfig config = {});
    ~OptimizationService();

    OptimizationService(const OptimizationService&) = delete;
    OptimizationService& operator=(const OptimizationService&) = delete;

    /**
     * @brief Validates and queues a job. Returns without waiting for it.
     *
     * @param archive The uploaded archive bytes.
     * @param options Job options.
     * @return The new job id.
     * @throws ValidationError if the options are out of range or the
     * payload is not a readable archive. No job is created.
     * @throws ServiceUnavailableError if the service is shutting down or full.
     */
    JobId submit(ByteBuffer archive, const OptimizationOptions& options);

    /**
     * @brief Like submit(), with a subscription attached before the job
     * is queued, so no event can be missed.
     */
    SubmittedJob submit_and_subscribe(ByteBuffer archive, const OptimizationOptions& options);

    /**
     * @brief Attaches to a job's event stream from now on.
     *
     * For a job that already ended, the subscription yields only the
     * terminal event.
     *
     * @throws NotFoundError for unknown or reclaimed jobs.
     */
    [[nodiscard]] std::shared_ptr<EventSubscription> stream_events(const JobId& job_id);

    /**
     * @brief Current state of a job.
     * @throws NotFoundError for unknown or reclaimed jobs.
     */
    [[nodiscard]] JobSnapshot lookup(const JobId& job_id) const;

    /**
     * @brief Returns the finished archive of a job.
     *
     * Accepts a job id or an artifact id. Repeated fetches before reclaim
     * return identical bytes. The first fetch starts the download grace
     * period after which the artifact is reclaimed.
     *
     * @throws NotFoundError if the job is not Done or the artifact is gone.
     */
    [[nodiscard]] ByteBuffer fetch_artifact(const std::string& job_or_artifact_id);

    [[nodiscard]] ServiceStats stats() const;

    /**
     * @brief Runs one cleanup pass as of `now`.
     *
     * Reclaims retrieved artifacts past the download grace, drops
     * terminal jobs past retention and fails running jobs that nobody
     * attached to within the unattended timeout. The reaper thread calls
     * this periodically.
     *
     * @return Number of jobs removed or failed.
     */
    std::size_t collect_expired(Clock::time_point now);

    /**
     * @brief Blocks until every queued and running job has finished.
     */
    void wait_idle();

    /**
     * @brief Stops accepting work, cancels running jobs and joins the workers.
     *
     * Jobs that did not reach a terminal state are failed. Idempotent.
     */
    void shutdown();

    [[nodiscard]] const ServiceConfig& config() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace optipack

#endif // OPTIPACK_HPP
