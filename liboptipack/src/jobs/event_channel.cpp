#include "../../include/event_channel.hpp"
#include "../../include/logger.hpp"
#include <algorithm>
#include <stdexcept>

namespace optipack {

EventChannel::EventChannel(std::string job_id, const std::size_t max_backlog)
    : job_id_(std::move(job_id)), max_backlog_(std::max<std::size_t>(max_backlog, 1)) {}

bool EventChannel::publish(ProgressEvent event) {
    {
        std::lock_guard lk(mtx_);
        if (closed_) {
            return false;
        }
        closed_ = is_terminal(event);
        log_.push_back(Entry{next_seq_++, std::move(event)});
        trim_locked();
    }
    cv_.notify_all();
    return true;
}

std::shared_ptr<EventSubscription> EventChannel::subscribe() {
    std::lock_guard lk(mtx_);
    const std::uint64_t id = next_subscriber_++;
    // a late subscriber still gets the terminal event, which trim_locked() never drops
    cursors_[id] = closed_ ? log_.back().seq : next_seq_;
    ever_subscribed_ = true;
    return std::make_shared<EventSubscription>(shared_from_this(), id);
}

bool EventChannel::closed() const {
    std::lock_guard lk(mtx_);
    return closed_;
}

std::size_t EventChannel::subscriber_count() const {
    std::lock_guard lk(mtx_);
    return cursors_.size();
}

bool EventChannel::ever_subscribed() const {
    std::lock_guard lk(mtx_);
    return ever_subscribed_;
}

std::size_t EventChannel::backlog() const {
    std::lock_guard lk(mtx_);
    return log_.size();
}

std::optional<ProgressEvent> EventChannel::wait_next(const std::uint64_t id,
                                                     const std::chrono::milliseconds timeout,
                                                     bool& finished) {
    std::unique_lock lk(mtx_);
    if (!cursors_.contains(id)) {
        finished = true;
        return std::nullopt;
    }

    // cursors_ may rehash while the lock is released, so look the cursor up each time
    const bool ready = cv_.wait_for(lk, timeout, [&] {
        return !log_.empty() && log_.back().seq >= cursors_.at(id);
    });
    if (!ready) {
        return std::nullopt;
    }

    std::uint64_t& cursor = cursors_.at(id);
    const auto entry = std::ranges::lower_bound(log_, cursor, {}, &Entry::seq);
    ProgressEvent event = entry->event;
    cursor = entry->seq + 1;
    finished = is_terminal(event);
    trim_locked();
    return event;
}

void EventChannel::detach(const std::uint64_t id) {
    std::lock_guard lk(mtx_);
    cursors_.erase(id);
    trim_locked();
}

void EventChannel::trim_locked() {
    // drop what every subscriber has consumed; with none attached nobody can read the past
    std::uint64_t low = next_seq_;
    for (const auto& [id, cursor] : cursors_) {
        low = std::min(low, cursor);
    }
    while (!log_.empty() && log_.front().seq < low) {
        if (closed_ && log_.size() == 1) break;
        log_.pop_front();
    }

    if (log_.size() <= max_backlog_) {
        return;
    }

    // over budget: keep only the newest Progress, it supersedes the older ones
    bool newer_progress = false;
    for (auto it = log_.rbegin(); it != log_.rend();) {
        if (std::holds_alternative<Progress>(it->event)) {
            if (newer_progress) {
                it = std::make_reverse_iterator(log_.erase(std::next(it).base()));
                continue;
            }
            newer_progress = true;
        }
        ++it;
    }
    if (log_.size() > max_backlog_) {
        Logger::log(LogLevel::Debug, "Job " + job_id_ + ": " + std::to_string(log_.size()) +
                    " events retained for a slow subscriber", "EventChannel");
    }
}

EventSubscription::~EventSubscription() {
    release();
}

std::optional<ProgressEvent> EventSubscription::next(const std::chrono::milliseconds timeout) {
    if (finished_ || released_) {
        return std::nullopt;
    }
    auto event = channel_->wait_next(id_, timeout, finished_);
    if (finished_) {
        release();
    }
    return event;
}

void EventSubscription::release() {
    if (released_) return;
    released_ = true;
    channel_->detach(id_);
}

std::shared_ptr<EventChannel> EventChannelHub::open(const std::string& job_id) {
    std::unique_lock lk(mtx_);
    auto [it, inserted] = channels_.try_emplace(job_id, nullptr);
    if (!inserted) {
        throw std::logic_error("event channel already open for job " + job_id);
    }
    it->second = std::make_shared<EventChannel>(job_id, max_backlog_);
    return it->second;
}

std::shared_ptr<EventChannel> EventChannelHub::find(const std::string& job_id) const {
    std::shared_lock lk(mtx_);
    const auto it = channels_.find(job_id);
    return it == channels_.end() ? nullptr : it->second;
}

void EventChannelHub::remove(const std::string& job_id) {
    std::unique_lock lk(mtx_);
    channels_.erase(job_id);
}

std::size_t EventChannelHub::size() const {
    std::shared_lock lk(mtx_);
    return channels_.size();
}

} // namespace optipack
