#include <gtest/gtest.h>

#include "RescanSupervisor.h"
#include "TestDoubles.h"

namespace {

const char* kKitchen = "AA:00:00:00:00:01";

} // namespace

class RescanSupervisorTest : public ::testing::Test {
protected:
    void SetUp() override {
        registry.Register({ "kitchen", kKitchen, "", "" });
    }

    void TearDown() override {
        rt.OnStrand([this] {
            supervisor.Stop();
            slow_supervisor.Stop();
            for (auto& session : registry.Sessions()) session->Stop();
        });
        rt.Shutdown();
    }

    bool KitchenStarted() {
        return rt.OnStrand([this] { return registry.Get("kitchen")->IsStarted(); });
    }

    AsioRuntime rt{ 4 };
    FakePlatform platform;
    FixedClassifier classifier;
    OperationSerializer serializer{ rt.strand };
    EventBroadcaster broadcaster{ rt.io };
    DeviceRegistry registry{ rt.io, rt.strand, serializer, broadcaster, std::chrono::milliseconds(20) };
    DiscoveryScanner discovery{ platform.scanner, rt.strand };
    RescanSupervisor supervisor{ registry, discovery, classifier, platform, rt.strand,
        std::chrono::milliseconds(50), std::chrono::milliseconds(30) };
    // Its scans stay open long enough to race against a manual bind.
    RescanSupervisor slow_supervisor{ registry, discovery, classifier, platform, rt.strand,
        std::chrono::milliseconds(20), std::chrono::milliseconds(2000) };
};

TEST_F(RescanSupervisorTest, BindsDeviceThatShowsUpLater) {
    rt.OnStrand([this] { supervisor.Start(); });
    ASSERT_TRUE(rt.WaitOnStrand([this] { return supervisor.TickCount() >= 2; }));
    EXPECT_FALSE(KitchenStarted());

    platform.scanner.SetAdvertisements({ MakeAdvertisement(kKitchen, "Snooz") });
    ASSERT_TRUE(WaitFor([this] { return KitchenStarted(); }));
    EXPECT_TRUE(rt.OnStrand([this] { return registry.Get("kitchen")->IsConnected(); }));
}

TEST_F(RescanSupervisorTest, DoesNotScanWhenEverythingIsBound) {
    rt.OnStrand([this] {
        ScanResults results;
        results["kitchen"] = MakeAdvertisement(kKitchen, "Snooz");
        supervisor.BindAndStart(results, "test");
    });
    ASSERT_TRUE(WaitFor([this] { return KitchenStarted(); }));

    rt.OnStrand([this] { supervisor.Start(); });
    ASSERT_TRUE(rt.WaitOnStrand([this] { return supervisor.TickCount() >= 3; }));
    EXPECT_EQ(platform.scanner.start_count.load(), 0);
}

TEST_F(RescanSupervisorTest, BoundDeviceWhoseStartFailedIsNotRescanned) {
    platform.default_fail_connect = true;
    platform.scanner.SetAdvertisements({ MakeAdvertisement(kKitchen, "Snooz") });

    rt.OnStrand([this] { supervisor.Start(); });
    ASSERT_TRUE(rt.WaitOnStrand([this] { return registry.Get("kitchen")->IsBound(); }));
    int scans = platform.scanner.start_count.load();

    ASSERT_TRUE(rt.WaitOnStrand([this] { return supervisor.TickCount() >= 4; }));
    EXPECT_EQ(platform.scanner.start_count.load(), scans);
    EXPECT_FALSE(KitchenStarted());
}

TEST_F(RescanSupervisorTest, StopHaltsTheLoop) {
    rt.OnStrand([this] { supervisor.Start(); });
    ASSERT_TRUE(rt.WaitOnStrand([this] { return supervisor.TickCount() >= 1; }));
    rt.OnStrand([this] { supervisor.Stop(); });

    uint64_t ticks = rt.OnStrand([this] { return supervisor.TickCount(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    EXPECT_EQ(rt.OnStrand([this] { return supervisor.TickCount(); }), ticks);
    EXPECT_FALSE(rt.OnStrand([this] { return supervisor.IsRunning(); }));
}

TEST_F(RescanSupervisorTest, SessionBoundDuringARescanIsLeftAlone) {
    rt.OnStrand([this] { slow_supervisor.Start(); });
    ASSERT_TRUE(WaitFor([this] { return platform.scanner.IsScanning(); }));

    std::shared_ptr<IDeviceControl> bound = rt.OnStrand([this] {
        auto session = registry.Get("kitchen");
        EXPECT_TRUE(session->Bind(MakeAdvertisement(kKitchen, "Snooz"), classifier, platform));
        return session->Control();
    });
    ASSERT_TRUE(bound);

    // The in-flight scan now sees the device and finishes early.
    platform.scanner.Emit(MakeAdvertisement(kKitchen, "Snooz"));
    ASSERT_TRUE(WaitFor([this] { return !platform.scanner.IsScanning(); }));
    ASSERT_TRUE(rt.WaitOnStrand([this] { return slow_supervisor.TickCount() >= 2; }));

    EXPECT_EQ(platform.create_count.load(), 1);
    EXPECT_EQ(rt.OnStrand([this] { return registry.Get("kitchen")->Control(); }), bound);
    EXPECT_FALSE(KitchenStarted());
}
