/**
 * @file job_runner.hpp
 * @brief Drives one optimization job from archive bytes to artifact.
 */

#ifndef OPTIPACK_JOB_RUNNER_HPP
#define OPTIPACK_JOB_RUNNER_HPP

#include "artifact_store.hpp"
#include "byte_buffer.hpp"
#include "event_channel.hpp"
#include "image_transformer.hpp"
#include "job_registry.hpp"
#include <stop_token>

namespace optipack {

/**
 * @brief Executes jobs on a worker thread.
 *
 * @details For each job: extract the archive, keep the image entries in
 * archive order, transform them one by one, and after every entry
 * publish FileComplete followed by Progress. A failing entry is recorded
 * and the batch continues. At the end the output archive is written to
 * the ArtifactStore and a single Complete is published.
 *
 * Archive-level failures, out-of-memory and cancellation fail the job
 * with a single Failed event; partial output is discarded.
 *
 * The runner holds references only; it is shared by all worker threads.
 */
class JobRunner {
public:
    JobRunner(JobRegistry& registry,
              EventChannelHub& channels,
              ArtifactStore& artifacts,
              const ImageTransformer& transformer)
        : registry_(registry), channels_(channels), artifacts_(artifacts), transformer_(transformer) {}

    /**
     * @brief Runs a job to a terminal state.
     *
     * Never throws: every failure ends as a Failed event.
     *
     * @param job_id A job previously created in the registry with an open channel.
     * @param archive The submitted archive bytes.
     * @param options Validated job options.
     * @param worker_stop Stop token of the executing worker (service shutdown).
     */
    void run(const JobId& job_id,
             const ByteBuffer& archive,
             const OptimizationOptions& options,
             std::stop_token worker_stop = {}) noexcept;

private:
    void fail(const JobId& job_id, EventChannel* channel, const std::string& reason) noexcept;

    JobRegistry& registry_;
    EventChannelHub& channels_;
    ArtifactStore& artifacts_;
    const ImageTransformer& transformer_;
};

} // namespace optipack

#endif // OPTIPACK_JOB_RUNNER_HPP
