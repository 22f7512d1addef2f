#include "stream_session.hpp"
#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace optipack;
using namespace std::chrono_literals;

namespace {

    struct Recorder {
        std::vector<std::string> frames;
        bool connected = true;

        StreamSession::FrameWriter writer() {
            return [this](std::string_view frame) {
                if (!connected) return false;
                frames.emplace_back(frame);
                return true;
            };
        }
    };

} // namespace

TEST(StreamSessionTest, FrameIsSseDataLine) {
    const std::string frame = StreamSession::format_frame(Progress{40});
    EXPECT_EQ(frame.rfind("data: ", 0), 0u);
    EXPECT_EQ(frame.substr(frame.size() - 2), "\n\n");
    const auto event = decode_event(frame.substr(6, frame.size() - 8));
    EXPECT_EQ(std::get<Progress>(event).percent, 40);
}

TEST(StreamSessionTest, KeepaliveWhileIdle) {
    const auto channel = std::make_shared<EventChannel>("job", 16);
    StreamSession session(channel->subscribe(), 10ms);
    Recorder client;

    EXPECT_EQ(session.pump(client.writer()), StreamSession::PumpResult::Continue);
    ASSERT_EQ(client.frames.size(), 1u);
    EXPECT_EQ(client.frames[0], StreamSession::kKeepaliveFrame);
}

TEST(StreamSessionTest, StreamsUntilTerminalEvent) {
    const auto channel = std::make_shared<EventChannel>("job", 16);
    StreamSession session(channel->subscribe(), 1s);
    channel->publish(Progress{50});
    channel->publish(Progress{100});
    channel->publish(Complete{"0123456789abcdef0123456789abcdef"});
    Recorder client;

    EXPECT_EQ(session.pump(client.writer()), StreamSession::PumpResult::Continue);
    EXPECT_EQ(session.pump(client.writer()), StreamSession::PumpResult::Continue);
    EXPECT_EQ(session.pump(client.writer()), StreamSession::PumpResult::Finished);
    EXPECT_TRUE(session.finished());
    EXPECT_TRUE(session.released());
    ASSERT_EQ(client.frames.size(), 3u);
    EXPECT_NE(client.frames[2].find("\"complete\""), std::string::npos);
    EXPECT_EQ(channel->subscriber_count(), 0u);

    EXPECT_EQ(session.pump(client.writer()), StreamSession::PumpResult::Finished);
    EXPECT_EQ(client.frames.size(), 3u);
}

TEST(StreamSessionTest, ClientDisconnectReleasesSubscriptionOnly) {
    const auto channel = std::make_shared<EventChannel>("job", 16);
    StreamSession session(channel->subscribe(), 1s);
    EXPECT_EQ(channel->subscriber_count(), 1u);

    channel->publish(Progress{10});
    Recorder client;
    client.connected = false;
    EXPECT_EQ(session.pump(client.writer()), StreamSession::PumpResult::Disconnected);
    EXPECT_TRUE(session.released());
    EXPECT_EQ(channel->subscriber_count(), 0u);

    // the job keeps publishing; a new observer still sees the outcome
    EXPECT_TRUE(channel->publish(Failed{"boom"}));
    const auto late = channel->subscribe();
    const auto event = late->next(1s);
    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(std::get<Failed>(*event).reason, "boom");
}

TEST(StreamSessionTest, DestructorDetaches) {
    const auto channel = std::make_shared<EventChannel>("job", 16);
    {
        StreamSession session(channel->subscribe(), 1s);
        EXPECT_EQ(channel->subscriber_count(), 1u);
    }
    EXPECT_EQ(channel->subscriber_count(), 0u);
}

TEST(StreamSlotsTest, PoolKeepsThreadsForOtherRequests) {
    EXPECT_EQ(StreamSlots::capacity_for_pool(16), 12u);
    EXPECT_EQ(StreamSlots::capacity_for_pool(4), 3u);
    EXPECT_EQ(StreamSlots::capacity_for_pool(2), 1u);
    EXPECT_EQ(StreamSlots::capacity_for_pool(1), 1u);
}

TEST(StreamSlotsTest, RefusesBeyondCapacityUntilASlotIsReleased) {
    StreamSlots slots(StreamSlots::capacity_for_pool(16));
    std::vector<StreamSlots::Slot> open;
    for (std::size_t i = 0; i < 12; ++i) {
        auto slot = slots.try_acquire();
        ASSERT_TRUE(slot.has_value());
        open.push_back(std::move(*slot));
    }
    EXPECT_EQ(slots.in_use(), 12u);
    EXPECT_FALSE(slots.try_acquire().has_value());
    EXPECT_EQ(slots.in_use(), 12u);

    open.pop_back();
    EXPECT_EQ(slots.in_use(), 11u);
    auto again = slots.try_acquire();
    EXPECT_TRUE(again.has_value());

    open.clear();
    again.reset();
    EXPECT_EQ(slots.in_use(), 0u);
}
