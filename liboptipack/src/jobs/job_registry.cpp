#include "../../include/job_registry.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include "../../include/random_utils.hpp"

namespace optipack {

std::shared_ptr<JobRegistry::Record> JobRegistry::get(const JobId& id) const {
    std::shared_lock lk(mtx_);
    const auto it = jobs_.find(id);
    return it == jobs_.end() ? nullptr : it->second;
}

JobId JobRegistry::create(const OptimizationOptions& options) {
    auto record = std::make_shared<Record>();
    record->snapshot.options = options;
    record->snapshot.created_at = Clock::now();

    std::unique_lock lk(mtx_);
    JobId id;
    do {
        id = RandomUtils::random_hex_id();
    } while (jobs_.contains(id));
    record->snapshot.id = id;
    jobs_.emplace(id, std::move(record));
    ++jobs_submitted_;
    return id;
}

bool JobRegistry::mark_running(const JobId& id) {
    const auto rec = get(id);
    if (!rec) return false;
    std::lock_guard lk(rec->mtx);
    if (rec->snapshot.state != JobState::Created) return false;
    rec->snapshot.state = JobState::Running;
    return true;
}

void JobRegistry::set_total(const JobId& id, const std::size_t total) {
    if (const auto rec = get(id)) {
        std::lock_guard lk(rec->mtx);
        rec->snapshot.total_entries = total;
    }
}

void JobRegistry::record_result(const JobId& id, const OptimizedResult& result, const int percent) {
    const auto rec = get(id);
    if (!rec) return;
    {
        std::lock_guard lk(rec->mtx);
        rec->snapshot.results.push_back(result);
        rec->snapshot.processed_entries = rec->snapshot.results.size();
        rec->snapshot.percent = percent;
    }
    ++files_processed_;
}

bool JobRegistry::register_artifact(const JobId& id, const std::string& artifact_id) {
    const auto rec = get(id);
    if (!rec) return false;
    {
        std::lock_guard lk(rec->mtx);
        if (is_terminal(rec->snapshot.state)) return false;
        rec->snapshot.state = JobState::Done;
        rec->snapshot.artifact_id = artifact_id;
        rec->snapshot.finished_at = Clock::now();
    }
    {
        std::unique_lock lk(mtx_);
        artifacts_[artifact_id] = id;
    }
    ++jobs_completed_;
    return true;
}

bool JobRegistry::mark_failed(const JobId& id, const std::string& reason) {
    const auto rec = get(id);
    if (!rec) return false;
    {
        std::lock_guard lk(rec->mtx);
        if (is_terminal(rec->snapshot.state)) return false;
        rec->snapshot.state = JobState::Failed;
        rec->snapshot.failure_reason = reason;
        rec->snapshot.finished_at = Clock::now();
    }
    ++jobs_failed_;
    return true;
}

JobSnapshot JobRegistry::lookup(const JobId& id) const {
    auto snapshot = find(id);
    if (!snapshot) {
        throw NotFoundError("unknown job: " + id);
    }
    return std::move(*snapshot);
}

std::optional<JobSnapshot> JobRegistry::find(const JobId& id) const {
    const auto rec = get(id);
    if (!rec) return std::nullopt;
    std::lock_guard lk(rec->mtx);
    return rec->snapshot;
}

std::optional<std::string> JobRegistry::resolve_artifact(const std::string& job_or_artifact_id) const {
    auto rec = get(job_or_artifact_id);
    if (!rec) {
        std::shared_lock lk(mtx_);
        const auto it = artifacts_.find(job_or_artifact_id);
        if (it == artifacts_.end()) return std::nullopt;
        const auto job = jobs_.find(it->second);
        if (job == jobs_.end()) return std::nullopt;
        rec = job->second;
    }
    std::lock_guard lk(rec->mtx);
    if (rec->snapshot.state != JobState::Done) return std::nullopt;
    return rec->snapshot.artifact_id;
}

void JobRegistry::mark_retrieved(const std::string& artifact_id, const Clock::time_point when) {
    std::shared_ptr<Record> rec;
    {
        std::shared_lock lk(mtx_);
        const auto it = artifacts_.find(artifact_id);
        if (it == artifacts_.end()) return;
        const auto job = jobs_.find(it->second);
        if (job == jobs_.end()) return;
        rec = job->second;
    }
    std::lock_guard lk(rec->mtx);
    if (!rec->snapshot.retrieved_at) {
        rec->snapshot.retrieved_at = when;
    }
}

std::stop_token JobRegistry::stop_token(const JobId& id) const {
    const auto rec = get(id);
    if (!rec) {
        throw NotFoundError("unknown job: " + id);
    }
    return rec->stop.get_token();
}

bool JobRegistry::request_stop(const JobId& id) {
    const auto rec = get(id);
    return rec && rec->stop.request_stop();
}

void JobRegistry::remove(const JobId& id) {
    std::unique_lock lk(mtx_);
    const auto it = jobs_.find(id);
    if (it == jobs_.end()) return;
    {
        std::lock_guard rec_lk(it->second->mtx);
        if (it->second->snapshot.artifact_id) {
            artifacts_.erase(*it->second->snapshot.artifact_id);
        }
    }
    jobs_.erase(it);
    Logger::log(LogLevel::Debug, "Job " + id + " removed from registry", "JobRegistry");
}

std::vector<JobSnapshot> JobRegistry::list() const {
    std::vector<std::shared_ptr<Record>> records;
    {
        std::shared_lock lk(mtx_);
        records.reserve(jobs_.size());
        for (const auto& [id, rec] : jobs_) {
            records.push_back(rec);
        }
    }
    std::vector<JobSnapshot> out;
    out.reserve(records.size());
    for (const auto& rec : records) {
        std::lock_guard lk(rec->mtx);
        out.push_back(rec->snapshot);
    }
    return out;
}

std::size_t JobRegistry::size() const {
    std::shared_lock lk(mtx_);
    return jobs_.size();
}

ServiceStats JobRegistry::stats() const {
    ServiceStats s;
    s.jobs_submitted = jobs_submitted_.load();
    s.jobs_completed = jobs_completed_.load();
    s.jobs_failed = jobs_failed_.load();
    s.files_processed = files_processed_.load();
    return s;
}

} // namespace optipack
