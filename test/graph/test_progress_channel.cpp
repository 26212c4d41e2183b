#include <catch2/catch_test_macros.hpp>

#include <workflow_tracker/graph/progress_channel.hpp>

#include <chrono>
#include <thread>
#include <vector>

using namespace workflow_tracker;

namespace {

ProgressEvent Event(int current, const std::string& phase = "scan") {
    ProgressEvent event;
    event.current = current;
    event.total = 100;
    event.phase = phase;
    event.message = "step " + std::to_string(current);
    return event;
}

} // namespace

TEST_CASE("ProgressChannel: FIFO order", "[graph][progress]") {
    ProgressChannel channel;
    channel.Push(Event(1));
    channel.Push(Event(2));
    CHECK(channel.Size() == 2);

    auto first = channel.TryPop();
    REQUIRE(first.has_value());
    CHECK(first->current == 1);
    auto second = channel.TryPop();
    REQUIRE(second.has_value());
    CHECK(second->current == 2);
    CHECK_FALSE(channel.TryPop().has_value());
}

TEST_CASE("ProgressChannel: full queue drops the oldest event", "[graph][progress]") {
    ProgressChannel channel(2);
    channel.Push(Event(1));
    channel.Push(Event(2));
    channel.Push(Event(3));

    CHECK(channel.Dropped() == 1);
    const auto events = channel.Drain();
    REQUIRE(events.size() == 2);
    CHECK(events[0].current == 2);
    CHECK(events[1].current == 3);

    auto latest = channel.Latest();
    REQUIRE(latest.has_value());
    CHECK(latest->current == 3);
    CHECK(channel.Size() == 0);
}

TEST_CASE("ProgressChannel: closing wakes the consumer", "[graph][progress]") {
    ProgressChannel channel;
    channel.Push(Event(7));
    channel.Close();
    CHECK(channel.IsClosed());

    // Queued events survive Close; new ones are ignored.
    channel.Push(Event(8));
    auto queued = channel.WaitPop(std::chrono::milliseconds(10));
    REQUIRE(queued.has_value());
    CHECK(queued->current == 7);
    CHECK_FALSE(channel.WaitPop(std::chrono::milliseconds(10)).has_value());
}

TEST_CASE("ProgressChannel: WaitPop times out on an idle channel", "[graph][progress]") {
    ProgressChannel channel;
    CHECK_FALSE(channel.WaitPop(std::chrono::milliseconds(5)).has_value());
    CHECK_FALSE(channel.Latest().has_value());
}

TEST_CASE("ProgressChannel: hands events across threads", "[graph][progress]") {
    ProgressChannel channel;
    auto callback = channel.Callback();

    std::thread producer([&] {
        for (int i = 1; i <= 50; ++i) {
            callback(Event(i));
        }
        channel.Close();
    });

    std::vector<int> seen;
    while (true) {
        auto event = channel.WaitPop(std::chrono::milliseconds(50));
        if (event.has_value()) {
            seen.push_back(event->current);
        } else if (channel.IsClosed() && channel.Size() == 0) {
            break;
        }
    }
    producer.join();

    REQUIRE(seen.size() == 50);
    CHECK(seen.front() == 1);
    CHECK(seen.back() == 50);
}
