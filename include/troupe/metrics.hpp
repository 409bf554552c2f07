#pragma once

#include "troupe/types.hpp"
#include "troupe/envelope.hpp"
#include <atomic>
#include <string>
#include <vector>

namespace troupe {

// Counter metric
class Counter {
public:
    Counter() = default;

    void inc(uint64_t n = 1) { value_.fetch_add(n, std::memory_order_relaxed); }
    uint64_t get() const { return value_.load(std::memory_order_relaxed); }
    void reset() { value_.store(0, std::memory_order_relaxed); }

private:
    std::atomic<uint64_t> value_{0};
};

// Gauge metric (can go up or down)
class Gauge {
public:
    Gauge() = default;

    void set(uint64_t v) { value_.store(v, std::memory_order_relaxed); }
    uint64_t get() const { return value_.load(std::memory_order_relaxed); }

private:
    std::atomic<uint64_t> value_{0};
};

// Counters kept by one cluster server
struct ClusterMetrics {
    Counter poll_notifications;
    Counter joins;
    Counter leaves;
    Counter local_envelopes;     // envelopes handed to us by the executor
    Counter remote_envelopes;    // envelopes received from peers
    Counter status_requests;
    Counter accepted_connections;
    Counter connection_attempts;
    Counter errors;

    Gauge members;
    Gauge established;
    Gauge connections;

    // Snapshot in the shape carried by a MetricsReply
    std::vector<Metric> snapshot() const;

    std::string export_json() const;
};

}  // namespace troupe
