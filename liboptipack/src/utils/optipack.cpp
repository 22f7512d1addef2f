/**
 * @file optipack.cpp
 * @brief Implementation of the public OptimizationService API.
 */

#include "../../include/optipack.hpp"

#include "../../include/archive.hpp"
#include "../../include/artifact_store.hpp"
#include "../../include/errors.hpp"
#include "../../include/image_transformer.hpp"
#include "../../include/job_runner.hpp"
#include "../../include/logger.hpp"
#include "../../include/optimizer_registry.hpp"
#include "../../include/thread_pool.hpp"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace optipack {

static const char* service_tag() {
    return "OptimizationService";
}

namespace {

    ServiceConfig normalized(ServiceConfig config) {
        if (config.worker_threads == 0) {
            config.worker_threads = std::max(1u, std::thread::hardware_concurrency());
        }
        return config;
    }

    std::string seconds_string(const std::chrono::seconds s) {
        return std::to_string(s.count()) + "s";
    }

} // namespace

struct OptimizationService::Impl {
    ServiceConfig config;
    JobRegistry registry;
    EventChannelHub channels;
    ArtifactStore artifacts;
    OptimizerRegistry optimizers;
    ImageTransformer transformer;
    JobRunner runner;

    std::atomic<bool> accepting{true};
    std::mutex shutdown_mtx;

    // workers and reaper reference the members above, so they are destroyed first
    ThreadPool pool;
    std::condition_variable_any reaper_cv;
    std::jthread reaper;

    explicit Impl(ServiceConfig cfg)
        : config(normalized(std::move(cfg))),
          channels(config.channel_backlog),
          artifacts(config.data_dir),
          transformer(optimizers),
          runner(registry, channels, artifacts, transformer),
          pool(config.worker_threads) {
        if (config.reaper_interval.count() > 0) {
            reaper = std::jthread([this](const std::stop_token& st) { reaper_loop(st); });
        }
        Logger::log(LogLevel::Info, "Service started with " + std::to_string(pool.size()) +
                    " worker(s), artifacts in " + artifacts.directory().string(), service_tag());
    }

    void reaper_loop(const std::stop_token& st) {
        std::mutex mtx;
        std::unique_lock lk(mtx);
        while (!st.stop_requested()) {
            reaper_cv.wait_for(lk, st, config.reaper_interval, [] { return false; });
            if (st.stop_requested()) break;
            try {
                collect_expired(Clock::now());
            } catch (const std::exception& e) {
                Logger::log(LogLevel::Error, std::string("Cleanup pass failed: ") + e.what(), service_tag());
            }
        }
    }

    JobId enqueue(ByteBuffer archive, const OptimizationOptions& options,
                  std::shared_ptr<EventSubscription>* subscription) {
        if (!accepting.load()) {
            throw ServiceUnavailableError("service is shutting down");
        }
        options.validate();

        std::size_t members = 0;
        try {
            members = validate_archive(archive);
        } catch (const ArchiveError& e) {
            throw ValidationError(std::string("invalid archive: ") + e.what());
        }

        if (config.max_pending_jobs > 0 && pool.pending() >= config.max_pending_jobs) {
            throw ServiceUnavailableError("job queue is full");
        }

        const JobId id = registry.create(options);
        const auto channel = channels.open(id);
        if (subscription) {
            *subscription = channel->subscribe();
        }

        auto payload = std::make_shared<const ByteBuffer>(std::move(archive));
        try {
            pool.submit([this, id, payload, options](const std::stop_token st) {
                runner.run(id, *payload, options, st);
            });
        } catch (const std::runtime_error&) {
            // the pool stopped between the accepting check and here
            if (registry.mark_failed(id, "service is shutting down")) {
                channel->publish(Failed{"service is shutting down"});
            }
            throw ServiceUnavailableError("service is shutting down");
        }

        Logger::log(LogLevel::Info, "Job " + id + " accepted: " + std::to_string(payload->size()) + " bytes, " +
                    std::to_string(members) + " member(s), " + to_string(options), service_tag());
        return id;
    }

    void reclaim(const JobSnapshot& job, const char* why) {
        if (job.artifact_id) {
            artifacts.remove(*job.artifact_id);
        }
        registry.remove(job.id);
        channels.remove(job.id);
        Logger::log(LogLevel::Info, "Job " + job.id + " reclaimed (" + why + ")", service_tag());
    }

    std::size_t collect_expired(const Clock::time_point now) {
        std::size_t collected = 0;
        for (const auto& job : registry.list()) {
            if (is_terminal(job.state)) {
                if (job.retrieved_at && now - *job.retrieved_at >= config.download_grace) {
                    reclaim(job, "retrieved");
                    ++collected;
                } else if (job.finished_at && now - *job.finished_at >= config.retention) {
                    reclaim(job, "retention expired");
                    ++collected;
                }
                continue;
            }

            const auto channel = channels.find(job.id);
            const bool attended = channel && channel->ever_subscribed();
            if (attended || now - job.created_at < config.unattended_timeout) {
                continue;
            }
            const std::string reason = "no consumer attached within " + seconds_string(config.unattended_timeout);
            if (registry.mark_failed(job.id, reason)) {
                if (channel) {
                    channel->publish(Failed{reason});
                }
                registry.request_stop(job.id);
                Logger::log(LogLevel::Warning, "Job " + job.id + " failed: " + reason, service_tag());
                ++collected;
            }
        }
        return collected;
    }

    void shutdown() {
        std::lock_guard lk(shutdown_mtx);
        if (!accepting.exchange(false)) {
            return;
        }
        if (reaper.joinable()) {
            reaper.request_stop();
            reaper_cv.notify_all();
            reaper.join();
        }

        for (const auto& job : registry.list()) {
            if (!is_terminal(job.state)) {
                registry.request_stop(job.id);
            }
        }
        pool.request_stop();
        pool.wait_idle();

        // queued jobs were discarded without running
        for (const auto& job : registry.list()) {
            if (!is_terminal(job.state) && registry.mark_failed(job.id, "service is shutting down")) {
                if (const auto channel = channels.find(job.id)) {
                    channel->publish(Failed{"service is shutting down"});
                }
            }
        }
        Logger::log(LogLevel::Info, "Service stopped", service_tag());
    }
};

OptimizationService::OptimizationService(ServiceConfig config)
    : impl_(std::make_unique<Impl>(std::move(config))) {}

OptimizationService::~OptimizationService() {
    shutdown();
}

JobId OptimizationService::submit(ByteBuffer archive, const OptimizationOptions& options) {
    return impl_->enqueue(std::move(archive), options, nullptr);
}

SubmittedJob OptimizationService::submit_and_subscribe(ByteBuffer archive, const OptimizationOptions& options) {
    SubmittedJob job;
    job.job_id = impl_->enqueue(std::move(archive), options, &job.events);
    return job;
}

std::shared_ptr<EventSubscription> OptimizationService::stream_events(const JobId& job_id) {
    const auto channel = impl_->channels.find(job_id);
    if (!channel) {
        throw NotFoundError("unknown job: " + job_id);
    }
    return channel->subscribe();
}

JobSnapshot OptimizationService::lookup(const JobId& job_id) const {
    return impl_->registry.lookup(job_id);
}

ByteBuffer OptimizationService::fetch_artifact(const std::string& job_or_artifact_id) {
    const auto artifact_id = impl_->registry.resolve_artifact(job_or_artifact_id);
    if (!artifact_id) {
        throw NotFoundError("no finished artifact for " + job_or_artifact_id);
    }
    ByteBuffer bytes = impl_->artifacts.load(*artifact_id);
    impl_->registry.mark_retrieved(*artifact_id, Clock::now());
    return bytes;
}

ServiceStats OptimizationService::stats() const {
    return impl_->registry.stats();
}

std::size_t OptimizationService::collect_expired(const Clock::time_point now) {
    return impl_->collect_expired(now);
}

void OptimizationService::wait_idle() {
    impl_->pool.wait_idle();
}

void OptimizationService::shutdown() {
    impl_->shutdown();
}

const ServiceConfig& OptimizationService::config() const noexcept {
    return impl_->config;
}

} // namespace optipack
