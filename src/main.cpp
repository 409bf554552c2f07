#include "troupe/troupe.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

namespace {

std::atomic<bool> g_running{true};

void signal_handler(int) {
    g_running = false;
}

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " [options]\n"
              << "Options:\n"
              << "  -c, --config <file>      Configuration file path\n"
              << "  -n, --name <name>        Node name\n"
              << "  -a, --address <addr>     Address to bind and advertise (host:port)\n"
              << "  -s, --seed <node>        Seed node (name@host:port), repeatable\n"
              << "  -l, --log-level <level>  trace, debug, info, warn, error or off\n"
              << "  -h, --help               Show this help\n"
              << "  -v, --version            Show version\n";
}

void print_version() {
    std::cout << "Troupe version " << troupe::Version::string() << "\n"
              << "Cluster membership and inter-node transport\n";
}

}  // namespace

int main(int argc, char* argv[]) {
    troupe::Config config;
    std::string config_file;

    // Command line values override the config file
    std::optional<std::string> name;
    std::optional<std::string> address;
    std::optional<std::string> log_level;
    std::vector<std::string> seeds;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        }

        if (arg == "-v" || arg == "--version") {
            print_version();
            return 0;
        }

        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            config_file = argv[++i];
        }
        else if ((arg == "-n" || arg == "--name") && i + 1 < argc) {
            name = argv[++i];
        }
        else if ((arg == "-a" || arg == "--address") && i + 1 < argc) {
            address = argv[++i];
        }
        else if ((arg == "-s" || arg == "--seed") && i + 1 < argc) {
            seeds.push_back(argv[++i]);
        }
        else if ((arg == "-l" || arg == "--log-level") && i + 1 < argc) {
            log_level = argv[++i];
        }
        else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    // Load config file if specified
    if (!config_file.empty()) {
        try {
            config = troupe::Config::load(config_file);
        } catch (const std::exception& e) {
            std::cerr << "Failed to load config: " << e.what() << "\n";
            return 1;
        }
    }

    if (name) config.node.name = *name;
    if (address) config.node.address = *address;
    if (log_level) config.log.level = *log_level;
    config.cluster.seed_nodes.insert(config.cluster.seed_nodes.end(), seeds.begin(), seeds.end());

    // Validate config
    auto status = config.validate();
    if (!status) {
        std::cerr << "Invalid configuration: " << status.message() << "\n";
        return 1;
    }

    troupe::log::set_level(*troupe::log::parse_level(config.log.level));

    // Setup signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // Print startup info
    std::cout << "Starting Troupe " << troupe::Version::string() << "\n";
    std::cout << "  Node: " << config.node_id().to_string() << "\n";
    std::cout << "  Tick: " << config.cluster.tick_interval.count() << " ms, timeout: "
              << config.cluster.request_timeout.count() << " ms\n";

    if (!config.cluster.seed_nodes.empty()) {
        std::cout << "  Seed nodes:";
        for (const auto& seed : config.cluster.seed_nodes) {
            std::cout << " " << seed;
        }
        std::cout << "\n";
    }

    troupe::Node node(config);
    status = node.start();
    if (!status) {
        std::cerr << "Failed to start node: " << status.to_string() << "\n";
        return 1;
    }

    std::cout << "Troupe node started\n";
    std::cout << "Press Ctrl+C to stop\n";

    while (g_running && node.is_running()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    std::cout << "Shutting down...\n";
    node.shutdown();
    std::cout << "Troupe node stopped\n";

    return 0;
}
