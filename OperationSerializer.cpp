#include "OperationSerializer.h"

#include <atomic>

#include "GatewayErrors.h"
#include "Log.h"

OperationSerializer::OperationSerializer(CoreStrand strand)
    : m_strand(std::move(strand)) {
}

void OperationSerializer::Enqueue(const std::string& label, Operation op) {
    boost::asio::post(m_strand, [this, label, op = std::move(op)]() mutable {
        m_queue.push_back(PendingOperation{ label, std::move(op) });
        Process();
    });
}

void OperationSerializer::Process() {
    if (m_busy || m_queue.empty()) return;

    PendingOperation next = std::move(m_queue.front());
    m_queue.pop_front();
    m_busy = true;
    m_current_label = next.label;

    if (g_log_show_egress) AddLog("BLE op start: " + m_current_label, LogType::EGRESS);

    auto released = std::make_shared<std::atomic<bool>>(false);
    Release release = [this, released]() {
        if (released->exchange(true)) return;
        boost::asio::post(m_strand, [this]() { Complete(); });
    };

    try {
        next.op(release);
    }
    catch (...) {
        AddLog("BLE op " + next.label + " threw before completing: " + DescribeException(std::current_exception()));
        release();
    }
}

void OperationSerializer::Complete() {
    if (!m_busy) {
        AddLog("OperationSerializer: release with no operation in progress");
        return;
    }
    if (g_log_show_egress) AddLog("BLE op end: " + m_current_label, LogType::EGRESS);
    m_busy = false;
    m_current_label.clear();
    ++m_completed;
    Process();
}
