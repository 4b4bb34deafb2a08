#include "EventBroadcaster.h"

#include <vector>

#include "Log.h"

EventBroadcaster::EventBroadcaster(boost::asio::io_context& io_ctx)
    : m_io_context(io_ctx) {
}

EventBroadcaster::ListenerId EventBroadcaster::AddListener(const std::string& name, Listener listener) {
    std::lock_guard<std::mutex> lock(m_listeners_mutex);
    ListenerId id = m_next_id++;
    m_listeners[id] = std::make_shared<ListenerEntry>(
        ListenerEntry{ name, std::move(listener), boost::asio::make_strand(m_io_context) });
    return id;
}

bool EventBroadcaster::RemoveListener(ListenerId id) {
    std::lock_guard<std::mutex> lock(m_listeners_mutex);
    return m_listeners.erase(id) > 0;
}

size_t EventBroadcaster::ListenerCount() const {
    std::lock_guard<std::mutex> lock(m_listeners_mutex);
    return m_listeners.size();
}

void EventBroadcaster::Publish(const DeviceEvent& event) {
    std::vector<std::shared_ptr<ListenerEntry>> targets;
    {
        std::lock_guard<std::mutex> lock(m_listeners_mutex);
        targets.reserve(m_listeners.size());
        for (const auto& [id, entry] : m_listeners) {
            targets.push_back(entry);
        }
    }
    if (targets.empty()) return;

    auto shared_event = std::make_shared<const DeviceEvent>(event);
    for (auto& entry : targets) {
        boost::asio::post(entry->strand, [entry, shared_event]() {
            try {
                entry->listener(*shared_event);
            }
            catch (const std::exception& e) {
                AddLog("[" + shared_event->device_name + "] Listener '" + entry->name + "' failed: " + e.what());
            }
        });
    }
}
