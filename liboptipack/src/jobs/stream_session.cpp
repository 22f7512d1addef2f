#include "../../include/stream_session.hpp"
#include "../../include/logger.hpp"
#include <algorithm>

namespace optipack {

StreamSession::StreamSession(std::shared_ptr<EventSubscription> subscription,
                             const std::chrono::milliseconds keepalive_interval)
    : subscription_(std::move(subscription)), keepalive_(keepalive_interval) {}

StreamSession::~StreamSession() {
    release();
}

std::string StreamSession::format_frame(const ProgressEvent& event) {
    std::string frame = "data: ";
    frame += encode_event(event);
    frame += "\n\n";
    return frame;
}

StreamSession::PumpResult StreamSession::pump(const FrameWriter& write) {
    if (finished_) {
        return PumpResult::Finished;
    }
    if (!subscription_) {
        return PumpResult::Disconnected;
    }

    const auto event = subscription_->next(keepalive_);
    if (!event) {
        if (subscription_->finished()) {
            // detached underneath us without a terminal event
            release();
            return PumpResult::Disconnected;
        }
        if (!write(kKeepaliveFrame)) {
            Logger::log(LogLevel::Debug, "Stream client for job " + subscription_->job_id() + " went away",
                        "StreamSession");
            release();
            return PumpResult::Disconnected;
        }
        return PumpResult::Continue;
    }

    const bool terminal = is_terminal(*event);
    if (!write(format_frame(*event))) {
        Logger::log(LogLevel::Debug, "Stream client for job " + subscription_->job_id() + " went away",
                    "StreamSession");
        release();
        return PumpResult::Disconnected;
    }
    if (terminal) {
        finished_ = true;
        release();
        return PumpResult::Finished;
    }
    return PumpResult::Continue;
}

void StreamSession::release() {
    if (subscription_) {
        subscription_->release();
        subscription_.reset();
    }
}

StreamSlots::Slot& StreamSlots::Slot::operator=(Slot&& other) noexcept {
    if (this != &other) {
        if (owner_) owner_->release();
        owner_ = std::exchange(other.owner_, nullptr);
    }
    return *this;
}

StreamSlots::Slot::~Slot() {
    if (owner_) owner_->release();
}

std::size_t StreamSlots::capacity_for_pool(const std::size_t pool_threads) noexcept {
    if (pool_threads <= 1) return 1;
    const std::size_t reserved = std::max<std::size_t>(1, pool_threads / 4);
    return pool_threads - reserved;
}

std::optional<StreamSlots::Slot> StreamSlots::try_acquire() noexcept {
    std::size_t current = in_use_.load();
    do {
        if (current >= capacity_) return std::nullopt;
    } while (!in_use_.compare_exchange_weak(current, current + 1));
    return Slot(this);
}

void StreamSlots::release() noexcept {
    in_use_.fetch_sub(1);
}

} // namespace optipack
