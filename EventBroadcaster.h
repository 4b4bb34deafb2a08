// EventBroadcaster.h
#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <boost/asio.hpp>

#include "BleTypes.h"

// --- EventBroadcaster ---
// Fans device events out to listeners. Each listener has its own strand: delivery to one
// listener keeps publish order, and a slow or failing listener never holds up the others.
// The broadcaster holds callbacks only; it owns none of the listeners.
class EventBroadcaster {
public:
    using Listener = std::function<void(const DeviceEvent&)>;
    using ListenerId = uint64_t;

    explicit EventBroadcaster(boost::asio::io_context& io_ctx);

    ListenerId AddListener(const std::string& name, Listener listener);
    bool RemoveListener(ListenerId id);
    size_t ListenerCount() const;

    void Publish(const DeviceEvent& event);

private:
    struct ListenerEntry {
        std::string name;
        Listener listener;
        boost::asio::strand<boost::asio::io_context::executor_type> strand;
    };

    boost::asio::io_context& m_io_context;
    std::map<ListenerId, std::shared_ptr<ListenerEntry>> m_listeners;
    mutable std::mutex m_listeners_mutex;
    ListenerId m_next_id = 1;
};
