#include <gtest/gtest.h>

#include <algorithm>
#include <future>
#include <map>
#include <mutex>
#include <vector>
#include <nlohmann/json.hpp>

#include "GatewayErrors.h"
#include "GatewayProtocol.h"
#include "Log.h"
#include "TestDoubles.h"

namespace {

const char* kKitchen = "AA:00:00:00:00:01";

ManagerTiming FastTiming() {
    ManagerTiming timing;
    timing.initial_scan_timeout = std::chrono::milliseconds(100);
    timing.rescan_interval = std::chrono::milliseconds(200);
    timing.rescan_timeout = std::chrono::milliseconds(50);
    timing.debounce = std::chrono::milliseconds(20);
    return timing;
}

} // namespace

class GatewayProtocolTest : public ::testing::Test {
protected:
    void SetUp() override {
        platform.scanner.SetAdvertisements({ MakeAdvertisement(kKitchen, "Snooz") });

        auto ready = std::make_shared<std::promise<void>>();
        auto future = ready->get_future();
        rt.OnStrand([this, ready] {
            manager.AddDevice({ "kitchen", kKitchen, "", "" });
            manager.AddDevice({ "x1", "AA:00:00:00:00:99", "", "" });
            manager.Start([ready] { ready->set_value(); });
        });
        ASSERT_EQ(future.wait_for(std::chrono::seconds(2)), std::future_status::ready);
        ASSERT_TRUE(rt.WaitOnStrand([this] { return manager.GetDevice("kitchen")->IsStarted(); }));
    }

    void TearDown() override {
        rt.OnStrand([this] { manager.Stop(); });
        rt.Shutdown();
    }

    // Sends one frame and waits for the reply.
    nlohmann::json Roundtrip(const std::string& frame, uint64_t connection_id = 1) {
        auto promise = std::make_shared<std::promise<std::string>>();
        auto future = promise->get_future();
        protocol.HandleFrame(connection_id, frame, [promise](const std::string& reply) {
            promise->set_value(reply);
        });
        EXPECT_EQ(future.wait_for(std::chrono::seconds(3)), std::future_status::ready);
        return nlohmann::json::parse(future.get());
    }

    nlohmann::json Command(const std::string& command, nlohmann::json args = nlohmann::json::object()) {
        args["type"] = "command";
        args["request_id"] = "r-" + command;
        args["command"] = command;
        return Roundtrip(args.dump());
    }

    // Replies are collected per connection instead of awaited.
    void SendCollecting(uint64_t connection_id, const nlohmann::json& frame) {
        protocol.HandleFrame(connection_id, frame.dump(), [this, connection_id](const std::string& reply) {
            std::lock_guard<std::mutex> lock(replies_mutex);
            replies[connection_id].push_back(nlohmann::json::parse(reply));
        });
    }

    size_t RepliesFor(uint64_t connection_id) {
        std::lock_guard<std::mutex> lock(replies_mutex);
        return replies[connection_id].size();
    }

    AsioRuntime rt{ 4 };
    FakePlatform platform;
    FixedClassifier classifier;
    DeviceManager manager{ rt.io, rt.strand, platform, classifier, FastTiming() };
    GatewayProtocol protocol{ manager, rt.strand };

    std::mutex replies_mutex;
    std::map<uint64_t, std::vector<nlohmann::json>> replies;
};

TEST_F(GatewayProtocolTest, MalformedFrameGetsErrorWithNullRequestId) {
    nlohmann::json reply = Roundtrip("{not json");
    EXPECT_EQ(reply["type"], "response");
    EXPECT_EQ(reply["status"], "error");
    EXPECT_EQ(reply["error"], "invalid_json");
    EXPECT_TRUE(reply["request_id"].is_null());
}

TEST_F(GatewayProtocolTest, NonCommandFramesAreRejected) {
    nlohmann::json reply = Roundtrip(R"({"type":"subscribe","request_id":5})");
    EXPECT_EQ(reply["error"], "type_must_be_command");
    EXPECT_EQ(reply["request_id"], 5);

    reply = Roundtrip("[1,2,3]");
    EXPECT_EQ(reply["error"], "type_must_be_command");
}

TEST_F(GatewayProtocolTest, UnknownCommandIsNamedInTheError) {
    nlohmann::json reply = Command("dance");
    EXPECT_EQ(reply["status"], "error");
    EXPECT_EQ(reply["error"], "unknown_command: dance");
    EXPECT_EQ(reply["request_id"], "r-dance");
}

TEST_F(GatewayProtocolTest, HeartbeatReportsServerTime) {
    double now = std::chrono::duration<double>(std::chrono::system_clock::now().time_since_epoch()).count();
    nlohmann::json reply = Command("heartbeat");
    ASSERT_EQ(reply["status"], "ok");
    EXPECT_NEAR(reply["data"]["server_time"].get<double>(), now, 5.0);
}

TEST_F(GatewayProtocolTest, ListDevicesKeepsConfiguredOrder) {
    nlohmann::json reply = Command("list_devices");
    ASSERT_EQ(reply["status"], "ok");
    EXPECT_EQ(reply["data"]["devices"], nlohmann::json({ "kitchen", "x1" }));
}

TEST_F(GatewayProtocolTest, GetStateOfUndiscoveredDeviceReturnsEmptySnapshot) {
    nlohmann::json reply = Command("get_state", { {"device_name", "x1"} });
    ASSERT_EQ(reply["status"], "ok");
    const nlohmann::json& data = reply["data"];
    EXPECT_EQ(data["device_name"], "x1");
    EXPECT_EQ(data["address"], "AA:00:00:00:00:99");
    EXPECT_EQ(data["connected"], false);
    EXPECT_EQ(data["connection_status"], "UNKNOWN");
    EXPECT_TRUE(data["display_name"].is_null());
    EXPECT_TRUE(data["model"].is_null());
    EXPECT_TRUE(data["firmware_version"].is_null());
    EXPECT_TRUE(data["state"]["volume"].is_null());
}

TEST_F(GatewayProtocolTest, GetStateRequiresAKnownDevice) {
    EXPECT_EQ(Command("get_state")["error"], "device_name is required");
    EXPECT_EQ(Command("get_state", { {"device_name", "ghost"} })["error"], "unknown_device: ghost");
}

TEST_F(GatewayProtocolTest, OutOfRangeVolumeNeverReachesTheDevice) {
    nlohmann::json reply = Command("set_volume", { {"device_name", "kitchen"}, {"volume", 150} });
    EXPECT_EQ(reply["status"], "error");
    EXPECT_EQ(reply["error"], "volume must be 0..100");

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_TRUE(platform.ControlFor(kKitchen)->Commands().empty());
}

TEST_F(GatewayProtocolTest, ArgumentTypesAreChecked) {
    EXPECT_EQ(Command("set_volume", { {"device_name", "kitchen"} })["error"], "volume is required");
    EXPECT_EQ(Command("set_volume", { {"device_name", "kitchen"}, {"volume", "loud"} })["error"], "volume must be an integer");
    EXPECT_EQ(Command("set_volume", { {"device_name", "kitchen"}, {"volume", 12.5} })["error"], "volume must be an integer");
    EXPECT_EQ(Command("noise_off", { {"device_name", "kitchen"}, {"duration_s", -1} })["error"],
        "duration_s must be a non-negative number");
    EXPECT_EQ(Command("set_light_brightness", { {"device_name", "kitchen"} })["error"], "brightness is required");
    EXPECT_EQ(Command("light_on")["error"], "device_name is required");
    EXPECT_TRUE(platform.ControlFor(kKitchen)->Commands().empty());
}

TEST_F(GatewayProtocolTest, DeviceNameIsCheckedBeforeArguments) {
    EXPECT_EQ(Command("set_volume")["error"], "device_name is required");
    EXPECT_EQ(Command("set_light_brightness")["error"], "device_name is required");
    EXPECT_EQ(Command("noise_on", { {"volume", "loud"} })["error"], "device_name is required");
}

TEST_F(GatewayProtocolTest, RejectionIsLoggedWithItsErrorCode) {
    Command("set_volume", { {"device_name", "kitchen"}, {"volume", 101} });

    std::vector<std::string> logs;
    GetLogs(logs);
    bool logged = std::any_of(logs.begin(), logs.end(), [](const std::string& line) {
        return line.find("Command 'set_volume' rejected (ValidationError): volume must be 0..100") != std::string::npos;
    });
    EXPECT_TRUE(logged);
}

TEST_F(GatewayProtocolTest, ConnectionSurvivesAMalformedFrame) {
    EXPECT_EQ(Roundtrip("{oops", 9)["error"], "invalid_json");

    nlohmann::json reply = Roundtrip(R"({"type":"command","request_id":"after","command":"heartbeat"})", 9);
    EXPECT_EQ(reply["status"], "ok");
    EXPECT_EQ(reply["request_id"], "after");
}

TEST_F(GatewayProtocolTest, CommandReplyCarriesTheDeviceResult) {
    nlohmann::json reply = Command("set_volume", { {"device_name", "kitchen"}, {"volume", 30.0} });
    ASSERT_EQ(reply["status"], "ok") << reply.dump();
    EXPECT_EQ(reply["request_id"], "r-set_volume");
    EXPECT_EQ(reply["data"]["status"], "SUCCESSFUL");

    auto commands = platform.ControlFor(kKitchen)->Commands();
    ASSERT_EQ(commands.size(), 1u);
    EXPECT_EQ(commands[0].volume.value_or(-1), 30);
}

TEST_F(GatewayProtocolTest, UndiscoveredDeviceIsUnavailable) {
    EXPECT_EQ(Command("noise_on", { {"device_name", "x1"} })["error"], "device_unavailable");
}

TEST_F(GatewayProtocolTest, ClosingAConnectionCancelsOnlyItsRequests) {
    platform.ControlFor(kKitchen)->latency_ms = 150;

    auto frame = [](int volume) {
        return nlohmann::json{ {"type", "command"}, {"request_id", volume}, {"command", "set_volume"},
            {"device_name", "kitchen"}, {"volume", volume} };
    };
    SendCollecting(1, frame(11));
    SendCollecting(1, frame(12));
    SendCollecting(2, frame(21));
    protocol.OnConnectionClosed(1);

    ASSERT_TRUE(WaitFor([this] { return RepliesFor(2) == 1; }));
    EXPECT_EQ(RepliesFor(1), 0u);
    EXPECT_TRUE(rt.WaitOnStrand([this] { return protocol.PendingCountFor(1) == 0; }));
    EXPECT_TRUE(rt.WaitOnStrand([this] { return protocol.PendingCount() == 0; }));

    std::lock_guard<std::mutex> lock(replies_mutex);
    EXPECT_EQ(replies[2][0]["request_id"], 21);
    EXPECT_EQ(replies[2][0]["status"], "ok");
    for (const auto& cmd : platform.ControlFor(kKitchen)->Commands()) {
        EXPECT_NE(cmd.volume.value_or(-1), 12);
    }
}

TEST(GatewayFramesTest, EventFrameWrapsTheSnapshot) {
    DeviceEvent event;
    event.device_name = "kitchen";
    event.snapshot.device_name = "kitchen";
    event.snapshot.connected = true;
    event.snapshot.connection_status = ConnectionStatus::CONNECTED;
    event.snapshot.state.volume = 42;

    nlohmann::json frame = nlohmann::json::parse(GatewayProtocol::BuildEventFrame(event));
    EXPECT_EQ(frame["type"], "event");
    EXPECT_EQ(frame["event"], "device_state");
    EXPECT_EQ(frame["device_name"], "kitchen");
    EXPECT_EQ(frame["state"]["connection_status"], "CONNECTED");
    EXPECT_EQ(frame["state"]["state"]["volume"], 42);
}

TEST(GatewayAuthTest, RejectionCodeHasAName) {
    EXPECT_STREQ(ErrorCodeName(ErrorCode::AuthRejected), "AuthRejected");
    EXPECT_STREQ(ErrorCodeName(ErrorCode::DeviceUnavailable), "DeviceUnavailable");
}

TEST(GatewayAuthTest, BearerTokenIsCheckedOnUpgrade) {
    EXPECT_EQ(GatewayProtocol::CheckAuthorization("", ""), AuthResult::ACCEPTED);
    EXPECT_EQ(GatewayProtocol::CheckAuthorization("s3cret", ""), AuthResult::UNAUTHORIZED);
    EXPECT_EQ(GatewayProtocol::CheckAuthorization("s3cret", "Basic czNjcmV0"), AuthResult::UNAUTHORIZED);
    EXPECT_EQ(GatewayProtocol::CheckAuthorization("s3cret", "Bearer nope"), AuthResult::FORBIDDEN);
    EXPECT_EQ(GatewayProtocol::CheckAuthorization("s3cret", "Bearer s3cret"), AuthResult::ACCEPTED);
}
