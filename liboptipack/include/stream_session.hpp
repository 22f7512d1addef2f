/**
 * @file stream_session.hpp
 * @brief Transport-independent core of the server-sent-events endpoint.
 */

#ifndef OPTIPACK_STREAM_SESSION_HPP
#define OPTIPACK_STREAM_SESSION_HPP

#include "event_channel.hpp"
#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace optipack {

    /**
     * @brief Relays one subscription to one client connection.
     *
     * @details Each pump() suspends on the subscription until an event
     * arrives or the keepalive interval elapses, then writes exactly one
     * frame: `data: <json>\n\n` for an event or `: keepalive\n\n`. After
     * the terminal event the session is finished. A failed write means the
     * client went away: the subscription is released and the job carries
     * on untouched.
     */
    class StreamSession {
    public:
        enum class PumpResult {
            Continue,    ///< A frame was written, call pump() again
            Finished,    ///< The terminal event was written
            Disconnected ///< The writer failed; the subscription is released
        };

        ///< Writes one frame; returns false if the peer is gone.
        using FrameWriter = std::function<bool(std::string_view)>;

        static constexpr std::string_view kKeepaliveFrame = ": keepalive\n\n";

        StreamSession(std::shared_ptr<EventSubscription> subscription,
                      std::chrono::milliseconds keepalive_interval);

        ~StreamSession();

        PumpResult pump(const FrameWriter& write);

        /**
         * @brief Drops the subscription. Safe to call more than once.
         */
        void release();

        [[nodiscard]] bool finished() const noexcept { return finished_; }
        [[nodiscard]] bool released() const noexcept { return subscription_ == nullptr; }

        /**
         * @brief Formats one event as an SSE message.
         */
        [[nodiscard]] static std::string format_frame(const ProgressEvent& event);

    private:
        std::shared_ptr<EventSubscription> subscription_;
        std::chrono::milliseconds keepalive_;
        bool finished_{false};
    };

    /**
     * @brief Bounded count of open streams.
     *
     * @details A stream occupies a serving thread for as long as the client
     * stays connected, so only part of a pool may be handed to streams; the
     * rest stays free for uploads, downloads and lookups.
     */
    class StreamSlots {
    public:
        /**
         * @brief Holds one slot until destroyed. Move-only.
         */
        class Slot {
        public:
            Slot(Slot&& other) noexcept : owner_(std::exchange(other.owner_, nullptr)) {}
            Slot& operator=(Slot&& other) noexcept;
            ~Slot();

            Slot(const Slot&) = delete;
            Slot& operator=(const Slot&) = delete;

        private:
            friend class StreamSlots;
            explicit Slot(StreamSlots* owner) noexcept : owner_(owner) {}

            StreamSlots* owner_;
        };

        explicit StreamSlots(std::size_t capacity) noexcept : capacity_(capacity) {}

        StreamSlots(const StreamSlots&) = delete;
        StreamSlots& operator=(const StreamSlots&) = delete;

        /**
         * @brief Slots that leave at least one thread of a pool of the given size for other requests.
         *
         * A quarter of the pool, and never less than one thread, is kept back.
         * A single-thread pool still gets one slot.
         */
        [[nodiscard]] static std::size_t capacity_for_pool(std::size_t pool_threads) noexcept;

        /**
         * @return A slot, or std::nullopt when all of them are taken.
         */
        [[nodiscard]] std::optional<Slot> try_acquire() noexcept;

        [[nodiscard]] std::size_t in_use() const noexcept { return in_use_.load(); }
        [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }

    private:
        void release() noexcept;

        const std::size_t capacity_;
        std::atomic<std::size_t> in_use_{0};
    };

} // namespace optipack

#endif // OPTIPACK_STREAM_SESSION_HPP
