/*
 * Troupe Basic Usage Example
 *
 * This example demonstrates:
 * - Starting two nodes in one process
 * - Forming a cluster with a join
 * - Sending an envelope to a service on the other node
 * - Asking a cluster server for its status
 */

#include "troupe/troupe.hpp"
#include <chrono>
#include <iostream>
#include <string>
#include <thread>

int main() {
    using namespace troupe;
    using namespace std::chrono_literals;

    std::cout << "Troupe Basic Usage Example\n";
    std::cout << "==========================\n\n";

    // Two nodes on loopback with a fast tick
    Config config1;
    config1.node.name = "node1";
    config1.node.address = "127.0.0.1:17946";
    config1.cluster.tick_interval = 100ms;
    config1.cluster.request_timeout = 500ms;
    config1.runtime.worker_threads = 1;

    Config config2 = config1;
    config2.node.name = "node2";
    config2.node.address = "127.0.0.1:17947";

    Node node1(config1);
    Node node2(config2);

    for (auto* node : {&node1, &node2}) {
        auto status = node->start();
        if (!status) {
            std::cerr << "Failed to start " << node->id().to_string() << ": "
                      << status.to_string() << "\n";
            return 1;
        }
    }

    // Services that receive envelopes
    auto echo_pid = node2.pid("echo");
    auto echo = node2.register_service(echo_pid);

    auto client_pid = node1.pid("client");
    auto client = node1.register_service(client_pid);

    node1.join(node2.id());
    std::cout << node1.id().to_string() << " joined " << node2.id().to_string() << "\n";

    // Wait for the handshake, then ask node1's cluster server for its view
    std::this_thread::sleep_for(300ms);
    node1.cluster_status(CorrelationId::for_pid(client_pid));

    if (auto reply = client.recv_for(2s)) {
        if (auto* status = std::get_if<ClusterStatus>(&reply->body)) {
            std::cout << "Cluster status:\n";
            std::cout << "  Members:";
            for (const auto& m : status->members) std::cout << " " << m.to_string();
            std::cout << "\n  Established:";
            for (const auto& e : status->established) std::cout << " " << e.to_string();
            std::cout << "\n  Connections: " << status->num_connections << "\n\n";
        }
    }

    // Send a user message across the cluster
    Envelope envelope;
    envelope.to = echo_pid;
    envelope.from = client_pid;
    std::string text = "hello from node1";
    envelope.body = UserMsg{ByteBuffer(text.begin(), text.end())};
    node1.send(envelope);

    if (auto received = echo.recv_for(2s)) {
        const auto& data = std::get<UserMsg>(received->body).data;
        std::cout << echo_pid.to_string() << " received: "
                  << std::string(data.begin(), data.end()) << "\n";
    } else {
        std::cout << "No envelope arrived\n";
    }

    node1.shutdown();
    node2.shutdown();

    std::cout << "\nExample completed!\n";
    return 0;
}
