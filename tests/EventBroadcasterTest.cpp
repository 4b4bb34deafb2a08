#include <gtest/gtest.h>

#include <atomic>
#include <mutex>
#include <stdexcept>
#include <vector>

#include "EventBroadcaster.h"
#include "TestDoubles.h"

namespace {

DeviceEvent Event(int n) {
    DeviceEvent event;
    event.device_name = "dev" + std::to_string(n);
    event.snapshot.device_name = event.device_name;
    return event;
}

struct Recorder {
    std::mutex mutex;
    std::vector<std::string> names;

    void Add(const DeviceEvent& event) {
        std::lock_guard<std::mutex> lock(mutex);
        names.push_back(event.device_name);
    }
    size_t Size() {
        std::lock_guard<std::mutex> lock(mutex);
        return names.size();
    }
};

} // namespace

class EventBroadcasterTest : public ::testing::Test {
protected:
    void TearDown() override { rt.Shutdown(); }

    AsioRuntime rt{ 4 };
    EventBroadcaster broadcaster{ rt.io };
};

TEST_F(EventBroadcasterTest, EachListenerSeesPublishOrder) {
    Recorder a, b;
    broadcaster.AddListener("a", [&a](const DeviceEvent& e) { a.Add(e); });
    broadcaster.AddListener("b", [&b](const DeviceEvent& e) { b.Add(e); });
    EXPECT_EQ(broadcaster.ListenerCount(), 2u);

    std::vector<std::string> expected;
    for (int i = 0; i < 50; ++i) {
        broadcaster.Publish(Event(i));
        expected.push_back("dev" + std::to_string(i));
    }

    ASSERT_TRUE(WaitFor([&] { return a.Size() == 50 && b.Size() == 50; }));
    EXPECT_EQ(a.names, expected);
    EXPECT_EQ(b.names, expected);
}

TEST_F(EventBroadcasterTest, FailingListenerIsIsolated) {
    Recorder healthy;
    std::atomic<int> failures{ 0 };
    broadcaster.AddListener("broken", [&failures](const DeviceEvent&) {
        ++failures;
        throw std::runtime_error("listener bug");
    });
    broadcaster.AddListener("healthy", [&healthy](const DeviceEvent& e) { healthy.Add(e); });

    broadcaster.Publish(Event(1));
    broadcaster.Publish(Event(2));

    ASSERT_TRUE(WaitFor([&] { return healthy.Size() == 2 && failures.load() == 2; }));
}

TEST_F(EventBroadcasterTest, SlowListenerDoesNotHoldUpOthers) {
    Recorder fast;
    std::atomic<int> slow_seen{ 0 };
    broadcaster.AddListener("slow", [&slow_seen](const DeviceEvent&) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        ++slow_seen;
    });
    broadcaster.AddListener("fast", [&fast](const DeviceEvent& e) { fast.Add(e); });

    for (int i = 0; i < 5; ++i) broadcaster.Publish(Event(i));

    ASSERT_TRUE(WaitFor([&] { return fast.Size() == 5; }, std::chrono::milliseconds(500)));
    EXPECT_LT(slow_seen.load(), 5);
    ASSERT_TRUE(WaitFor([&] { return slow_seen.load() == 5; }));
}

TEST_F(EventBroadcasterTest, RemovedListenerGetsNothingFurther) {
    Recorder kept, removed;
    broadcaster.AddListener("kept", [&kept](const DeviceEvent& e) { kept.Add(e); });
    auto id = broadcaster.AddListener("removed", [&removed](const DeviceEvent& e) { removed.Add(e); });

    EXPECT_TRUE(broadcaster.RemoveListener(id));
    EXPECT_FALSE(broadcaster.RemoveListener(id));
    broadcaster.Publish(Event(1));

    ASSERT_TRUE(WaitFor([&] { return kept.Size() == 1; }));
    EXPECT_EQ(removed.Size(), 0u);
}
