/**
 * @file event_channel.hpp
 * @brief Per-job ordered event log with attachable consumers.
 *
 * One EventChannel exists per job. The JobRunner publishes into it and
 * any number of EventSubscription objects read from it, each at its own
 * pace. Channels of different jobs share no lock.
 */

#ifndef OPTIPACK_EVENT_CHANNEL_HPP
#define OPTIPACK_EVENT_CHANNEL_HPP

#include "progress_event.hpp"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace optipack {

class EventSubscription;

/**
 * @brief Ordered event log of one job.
 *
 * @details Events are stamped with a sequence number on publish. A new
 * subscriber starts at the current end of the log: it sees only events
 * published after it attached. Once a terminal event is published the
 * channel is closed; later publishes are ignored and a subscriber that
 * attaches afterwards receives just the terminal event.
 *
 * Retention: entries every live subscriber has read are discarded. If a
 * slow subscriber lets the log grow beyond max_backlog, Progress events
 * superseded by a newer Progress are compacted away. FileComplete and
 * terminal events are never dropped.
 */
class EventChannel : public std::enable_shared_from_this<EventChannel> {
public:
    EventChannel(std::string job_id, std::size_t max_backlog);

    EventChannel(const EventChannel&) = delete;
    EventChannel& operator=(const EventChannel&) = delete;

    /**
     * @brief Appends an event and wakes waiting subscribers.
     * @return false if the channel was already closed (event ignored).
     */
    bool publish(ProgressEvent event);

    /**
     * @brief Attaches a consumer at the current end of the log.
     */
    [[nodiscard]] std::shared_ptr<EventSubscription> subscribe();

    [[nodiscard]] const std::string& job_id() const noexcept { return job_id_; }
    [[nodiscard]] bool closed() const;
    [[nodiscard]] std::size_t subscriber_count() const;
    [[nodiscard]] bool ever_subscribed() const;
    [[nodiscard]] std::size_t backlog() const;

private:
    friend class EventSubscription;

    struct Entry {
        std::uint64_t seq;
        ProgressEvent event;
    };

    std::optional<ProgressEvent> wait_next(std::uint64_t id,
                                           std::chrono::milliseconds timeout,
                                           bool& finished);
    void detach(std::uint64_t id);
    void trim_locked();

    const std::string job_id_;
    const std::size_t max_backlog_;

    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::deque<Entry> log_;                                   ///< sorted by seq
    std::unordered_map<std::uint64_t, std::uint64_t> cursors_; ///< subscriber id -> next seq to read
    std::uint64_t next_seq_{0};
    std::uint64_t next_subscriber_{0};
    bool closed_{false};
    bool ever_subscribed_{false};
};

/**
 * @brief One consumer's position in an EventChannel.
 *
 * Destroying the subscription (or calling release()) detaches it. The
 * job is unaffected.
 */
class EventSubscription {
public:
    EventSubscription(std::shared_ptr<EventChannel> channel, std::uint64_t id)
        : channel_(std::move(channel)), id_(id) {}
    ~EventSubscription();

    EventSubscription(const EventSubscription&) = delete;
    EventSubscription& operator=(const EventSubscription&) = delete;

    /**
     * @brief Waits for the next event.
     * @param timeout Maximum time to suspend.
     * @return The event, or std::nullopt on timeout or once the terminal
     * event has been delivered.
     */
    std::optional<ProgressEvent> next(std::chrono::milliseconds timeout);

    /**
     * @brief True once the terminal event was returned by next().
     */
    [[nodiscard]] bool finished() const noexcept { return finished_; }

    /**
     * @brief Detach from the channel now. Idempotent.
     */
    void release();

    [[nodiscard]] const std::string& job_id() const noexcept { return channel_->job_id(); }

private:
    std::shared_ptr<EventChannel> channel_;
    std::uint64_t id_;
    bool finished_{false};
    bool released_{false};
};

/**
 * @brief Process-wide map of job id to EventChannel.
 *
 * The map lock is held only for lookup and insertion; all event traffic
 * goes through the per-channel lock.
 */
class EventChannelHub {
public:
    explicit EventChannelHub(std::size_t max_backlog = 1024) : max_backlog_(max_backlog) {}

    /**
     * @brief Creates the channel for a new job.
     * @throws std::logic_error if a channel for job_id already exists.
     */
    std::shared_ptr<EventChannel> open(const std::string& job_id);

    /**
     * @return The job's channel, or nullptr if unknown or removed.
     */
    [[nodiscard]] std::shared_ptr<EventChannel> find(const std::string& job_id) const;

    void remove(const std::string& job_id);

    [[nodiscard]] std::size_t size() const;

private:
    const std::size_t max_backlog_;
    mutable std::shared_mutex mtx_;
    std::unordered_map<std::string, std::shared_ptr<EventChannel>> channels_;
};

} // namespace optipack

#endif // OPTIPACK_EVENT_CHANNEL_HPP
