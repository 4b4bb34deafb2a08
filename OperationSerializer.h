// OperationSerializer.h
#pragma once

// Fleet-wide gate for radio transactions.
//
// The radio stack does not tolerate overlapping transactions, even when they target
// different devices. Every radio transaction therefore passes through one OperationSerializer:
// operations are granted one at a time, in arrival order, and the next one starts only
// after the current one calls its Release.

#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <string>
#include <boost/asio.hpp>

using CoreStrand = boost::asio::strand<boost::asio::io_context::executor_type>;

class OperationSerializer {
public:
    // Must be called exactly once, from any thread. Extra calls are ignored.
    using Release = std::function<void()>;
    // Runs on the core strand once the gate is granted.
    using Operation = std::function<void(Release)>;

    explicit OperationSerializer(CoreStrand strand);

    // Queue an operation; label is used for logging only.
    void Enqueue(const std::string& label, Operation op);

    // --- Inspection (core strand only) ---
    bool IsBusy() const { return m_busy; }
    size_t Depth() const { return m_queue.size(); }
    const std::string& CurrentOperation() const { return m_current_label; }
    uint64_t CompletedCount() const { return m_completed; }

private:
    struct PendingOperation {
        std::string label;
        Operation op;
    };

    void Process();
    void Complete();

    CoreStrand m_strand;
    std::deque<PendingOperation> m_queue;
    bool m_busy = false;
    std::string m_current_label;
    uint64_t m_completed = 0;
};
