#pragma once

#include "troupe/types.hpp"
#include <string>
#include <vector>
#include <optional>
#include <filesystem>

namespace troupe {

// Identity of this node
struct NodeConfig {
    std::string name;                          // Unique node name
    std::string address = "127.0.0.1:7946";    // host:port to bind and advertise
};

// Cluster server configuration
struct ClusterConfig {
    std::vector<std::string> seed_nodes;  // "name@host:port", joined at start-up

    std::chrono::milliseconds tick_interval = DEFAULT_TICK_INTERVAL;
    std::chrono::milliseconds request_timeout = DEFAULT_REQUEST_TIMEOUT;
    std::chrono::milliseconds executor_tick_interval = DEFAULT_EXECUTOR_TICK_INTERVAL;
    uint32_t max_frame_size = DEFAULT_MAX_FRAME_SIZE;

    // Number of ticks a silent connection survives
    size_t timeout_ticks() const {
        if (tick_interval.count() <= 0) return 1;
        auto n = request_timeout / tick_interval;
        return n > 0 ? static_cast<size_t>(n) : 1;
    }
};

// Runtime tuning
struct RuntimeConfig {
    size_t worker_threads = 0;  // 0 = auto (based on CPU count)
};

struct LogConfig {
    std::string level = "info";
};

// Main configuration
struct Config {
    NodeConfig node;
    ClusterConfig cluster;
    RuntimeConfig runtime;
    LogConfig log;

    // Load from file
    static Config load(const std::filesystem::path& path);
    static Config load_json(const std::string& json);

    // Save to file
    void save(const std::filesystem::path& path) const;
    std::string to_json() const;

    // Validation
    Status validate() const;

    // Local identity built from node.name and node.address
    NodeId node_id() const { return NodeId(node.name, node.address); }
};

}  // namespace troupe
