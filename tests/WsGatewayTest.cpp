#include <gtest/gtest.h>

#include <future>
#include <string>
#include <thread>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <nlohmann/json.hpp>

#include "GatewayProtocol.h"
#include "WsGateway.h"
#include "TestDoubles.h"

namespace beast = boost::beast;
namespace websocket = beast::websocket;
using tcp = boost::asio::ip::tcp;

namespace {

const char* kKitchen = "AA:00:00:00:00:01";
const char* kToken = "s3cret";

ManagerTiming FastTiming() {
    ManagerTiming timing;
    timing.initial_scan_timeout = std::chrono::milliseconds(100);
    timing.rescan_interval = std::chrono::milliseconds(200);
    timing.rescan_timeout = std::chrono::milliseconds(50);
    timing.debounce = std::chrono::milliseconds(20);
    return timing;
}

// Blocking WebSocket client.
class TestClient {
public:
    // Returns the handshake error; response holds the server's answer.
    beast::error_code Connect(int port, const std::string& authorization) {
        tcp::resolver resolver(m_io);
        boost::asio::connect(m_ws.next_layer(), resolver.resolve("127.0.0.1", std::to_string(port)));
        m_ws.set_option(websocket::stream_base::decorator([authorization](websocket::request_type& req) {
            if (!authorization.empty()) req.set(beast::http::field::authorization, authorization);
        }));
        beast::error_code ec;
        m_ws.handshake(response, "127.0.0.1", "/", ec);
        return ec;
    }

    void Send(const std::string& frame) {
        m_ws.text(true);
        m_ws.write(boost::asio::buffer(frame));
    }

    // Skips frames of other types.
    nlohmann::json Next(const std::string& type) {
        for (;;) {
            beast::flat_buffer buffer;
            m_ws.read(buffer);
            nlohmann::json frame = nlohmann::json::parse(beast::buffers_to_string(buffer.data()));
            if (frame.value("type", std::string()) == type) return frame;
        }
    }

    beast::error_code ReadUntilClosed() {
        beast::error_code ec;
        while (!ec) {
            beast::flat_buffer buffer;
            m_ws.read(buffer, ec);
        }
        return ec;
    }

    websocket::close_reason Reason() const { return m_ws.reason(); }

    websocket::response_type response;

private:
    boost::asio::io_context m_io;
    websocket::stream<tcp::socket> m_ws{ m_io };
};

} // namespace

class WsGatewayTest : public ::testing::Test {
protected:
    void SetUp() override {
        platform.scanner.SetAdvertisements({ MakeAdvertisement(kKitchen, "Snooz") });

        auto ready = std::make_shared<std::promise<void>>();
        auto future = ready->get_future();
        rt.OnStrand([this, ready] {
            manager.AddDevice({ "kitchen", kKitchen, "", "" });
            manager.Start([ready] { ready->set_value(); });
        });
        ASSERT_EQ(future.wait_for(std::chrono::seconds(2)), std::future_status::ready);
        ASSERT_TRUE(rt.WaitOnStrand([this] { return manager.GetDevice("kitchen")->IsStarted(); }));

        ASSERT_TRUE(gateway.Start());
        ASSERT_GT(gateway.Port(), 0);
    }

    void TearDown() override {
        gateway.Stop();
        rt.OnStrand([this] { manager.Stop(); });
        rt.Shutdown();
    }

    AsioRuntime rt{ 4 };
    FakePlatform platform;
    FixedClassifier classifier;
    DeviceManager manager{ rt.io, rt.strand, platform, classifier, FastTiming() };
    GatewayProtocol protocol{ manager, rt.strand };
    WsGateway gateway{ protocol, manager.Events(), "127.0.0.1", 0, kToken };
};

TEST_F(WsGatewayTest, UpgradeWithoutAuthorizationIsRefusedWith401) {
    TestClient client;
    beast::error_code ec = client.Connect(gateway.Port(), "");
    EXPECT_EQ(ec, websocket::error::upgrade_declined);
    EXPECT_EQ(client.response.result_int(), 401u);
    EXPECT_EQ(std::string(client.response[beast::http::field::www_authenticate]), "Bearer");
    EXPECT_EQ(gateway.ClientCount(), 0u);
}

TEST_F(WsGatewayTest, UpgradeWithWrongTokenIsRefusedWith403) {
    TestClient client;
    beast::error_code ec = client.Connect(gateway.Port(), "Bearer nope");
    EXPECT_EQ(ec, websocket::error::upgrade_declined);
    EXPECT_EQ(client.response.result_int(), 403u);
}

TEST_F(WsGatewayTest, MalformedFrameLeavesTheConnectionUsable) {
    TestClient client;
    ASSERT_FALSE(client.Connect(gateway.Port(), std::string("Bearer ") + kToken));
    ASSERT_TRUE(WaitFor([this] { return gateway.ClientCount() == 1; }));

    client.Send("{oops");
    nlohmann::json reply = client.Next("response");
    EXPECT_EQ(reply["status"], "error");
    EXPECT_EQ(reply["error"], "invalid_json");
    EXPECT_TRUE(reply["request_id"].is_null());

    client.Send(R"({"type":"command","request_id":7,"command":"list_devices"})");
    reply = client.Next("response");
    EXPECT_EQ(reply["status"], "ok");
    EXPECT_EQ(reply["request_id"], 7);
    EXPECT_EQ(reply["data"]["devices"], nlohmann::json::array({ "kitchen" }));
}

TEST_F(WsGatewayTest, StateChangesArePushedToClients) {
    TestClient client;
    ASSERT_FALSE(client.Connect(gateway.Port(), std::string("Bearer ") + kToken));
    ASSERT_TRUE(WaitFor([this] { return gateway.ClientCount() == 1; }));

    DeviceState state;
    state.on = true;
    state.volume = 33;
    platform.ControlFor(kKitchen)->Push(state);

    nlohmann::json event = client.Next("event");
    EXPECT_EQ(event["event"], "device_state");
    EXPECT_EQ(event["device_name"], "kitchen");
    EXPECT_EQ(event["state"]["state"]["volume"], 33);
}

TEST_F(WsGatewayTest, ShutdownClosesClientsWithGoingAway) {
    TestClient client;
    ASSERT_FALSE(client.Connect(gateway.Port(), std::string("Bearer ") + kToken));
    ASSERT_TRUE(WaitFor([this] { return gateway.ClientCount() == 1; }));

    std::thread stopper([this] { gateway.Stop(); });
    beast::error_code ec = client.ReadUntilClosed();
    stopper.join();

    EXPECT_EQ(ec, websocket::error::closed);
    EXPECT_EQ(client.Reason().code, websocket::close_code::going_away);
    websocket::close_reason reason = client.Reason();
    EXPECT_EQ(std::string(reason.reason.data(), reason.reason.size()), "Server shutting down");
    EXPECT_FALSE(gateway.IsRunning());
}
