#pragma once

#include "troupe/types.hpp"
#include <variant>
#include <vector>

namespace troupe {

// Opaque application payload
struct UserMsg {
    ByteBuffer data;

    bool operator==(const UserMsg& other) const { return data == other.data; }
};

// Request for a node's cluster metrics, addressed to its cluster server
struct GetMetrics {
    bool operator==(const GetMetrics&) const { return true; }
};

struct Metric {
    enum Kind : uint8_t {
        Counter = 0,
        Gauge = 1,
    };

    std::string name;
    Kind kind = Counter;
    uint64_t value = 0;

    bool operator==(const Metric& other) const {
        return name == other.name && kind == other.kind && value == other.value;
    }
};

struct MetricsReply {
    std::vector<Metric> metrics;

    bool operator==(const MetricsReply& other) const { return metrics == other.metrics; }
};

struct ClusterStatus {
    std::vector<NodeId> members;
    std::vector<NodeId> established;
    uint64_t num_connections = 0;

    bool operator==(const ClusterStatus& other) const {
        return members == other.members && established == other.established &&
               num_connections == other.num_connections;
    }
};

// Envelope body
using Msg = std::variant<
    UserMsg,
    GetMetrics,
    MetricsReply,
    ClusterStatus
>;

// Unit of inter-actor communication, routable locally and across nodes
struct Envelope {
    Pid to;
    Pid from;
    std::optional<CorrelationId> correlation_id;
    Msg body;

    bool operator==(const Envelope& other) const {
        return to == other.to && from == other.from &&
               correlation_id == other.correlation_id && body == other.body;
    }
};

}  // namespace troupe
