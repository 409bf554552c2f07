#include "troupe/metrics.hpp"
#include <sstream>

namespace troupe {

std::vector<Metric> ClusterMetrics::snapshot() const {
    return {
        {"cluster_server:poll_notifications", Metric::Counter, poll_notifications.get()},
        {"cluster_server:joins", Metric::Counter, joins.get()},
        {"cluster_server:leaves", Metric::Counter, leaves.get()},
        {"cluster_server:local_envelopes", Metric::Counter, local_envelopes.get()},
        {"cluster_server:remote_envelopes", Metric::Counter, remote_envelopes.get()},
        {"cluster_server:status_requests", Metric::Counter, status_requests.get()},
        {"cluster_server:accepted_connections", Metric::Counter, accepted_connections.get()},
        {"cluster_server:connection_attempts", Metric::Counter, connection_attempts.get()},
        {"cluster_server:errors", Metric::Counter, errors.get()},
        {"cluster_server:members", Metric::Gauge, members.get()},
        {"cluster_server:established", Metric::Gauge, established.get()},
        {"cluster_server:connections", Metric::Gauge, connections.get()},
    };
}

std::string ClusterMetrics::export_json() const {
    std::ostringstream oss;
    oss << "{\n";

    auto metrics = snapshot();
    for (size_t i = 0; i < metrics.size(); ++i) {
        const auto& m = metrics[i];
        oss << "  \"" << m.name << "\": {\"type\": \""
            << (m.kind == Metric::Counter ? "counter" : "gauge")
            << "\", \"value\": " << m.value << "}";
        if (i + 1 < metrics.size()) oss << ",";
        oss << "\n";
    }

    oss << "}\n";
    return oss.str();
}

}  // namespace troupe
