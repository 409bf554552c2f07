#include <catch2/catch_test_macros.hpp>
#include "troupe/config.hpp"
#include <filesystem>
#include <unistd.h>

using namespace troupe;

namespace {

Config valid_config() {
    Config config;
    config.node.name = "node1";
    config.node.address = "127.0.0.1:7001";
    return config;
}

}  // namespace

TEST_CASE("Config defaults", "[config]") {
    Config config;

    REQUIRE(config.node.name.empty());
    REQUIRE(config.node.address == "127.0.0.1:7946");
    REQUIRE(config.cluster.seed_nodes.empty());
    REQUIRE(config.cluster.tick_interval == std::chrono::milliseconds(1000));
    REQUIRE(config.cluster.request_timeout == std::chrono::milliseconds(5000));
    REQUIRE(config.cluster.executor_tick_interval == std::chrono::milliseconds(100));
    REQUIRE(config.cluster.max_frame_size == DEFAULT_MAX_FRAME_SIZE);
    REQUIRE(config.cluster.timeout_ticks() == 5);
    REQUIRE(config.runtime.worker_threads == 0);
    REQUIRE(config.log.level == "info");

    // The default has no node name
    REQUIRE(config.validate().code() == ErrorCode::InvalidArgument);
}

TEST_CASE("Config from JSON", "[config]") {
    const std::string json = R"({
        "node": {
            "name": "alpha",
            "address": "10.0.0.1:9000"
        },
        "cluster": {
            "seed_nodes": ["beta@10.0.0.2:9000", "gamma@10.0.0.3:9000"],
            "tick_interval_ms": 200,
            "request_timeout_ms": 1000,
            "executor_tick_interval_ms": 50,
            "max_frame_size": 4096
        },
        "runtime": {
            "worker_threads": 2
        },
        "log": {
            "level": "debug"
        }
    })";

    auto config = Config::load_json(json);

    REQUIRE(config.node.name == "alpha");
    REQUIRE(config.node.address == "10.0.0.1:9000");
    REQUIRE(config.cluster.seed_nodes.size() == 2);
    REQUIRE(config.cluster.seed_nodes[1] == "gamma@10.0.0.3:9000");
    REQUIRE(config.cluster.tick_interval == std::chrono::milliseconds(200));
    REQUIRE(config.cluster.request_timeout == std::chrono::milliseconds(1000));
    REQUIRE(config.cluster.executor_tick_interval == std::chrono::milliseconds(50));
    REQUIRE(config.cluster.max_frame_size == 4096);
    REQUIRE(config.cluster.timeout_ticks() == 5);
    REQUIRE(config.runtime.worker_threads == 2);
    REQUIRE(config.log.level == "debug");
    REQUIRE(config.validate().ok());
    REQUIRE(config.node_id() == NodeId("alpha", "10.0.0.1:9000"));

    SECTION("Missing keys keep defaults") {
        auto partial = Config::load_json(R"({"node": {"name": "solo"}})");
        REQUIRE(partial.node.name == "solo");
        REQUIRE(partial.node.address == "127.0.0.1:7946");
        REQUIRE(partial.cluster.tick_interval == DEFAULT_TICK_INTERVAL);
        REQUIRE(partial.validate().ok());
    }

    SECTION("to_json round trip") {
        auto again = Config::load_json(config.to_json());
        REQUIRE(again.node.name == config.node.name);
        REQUIRE(again.node.address == config.node.address);
        REQUIRE(again.cluster.seed_nodes == config.cluster.seed_nodes);
        REQUIRE(again.cluster.tick_interval == config.cluster.tick_interval);
        REQUIRE(again.cluster.request_timeout == config.cluster.request_timeout);
        REQUIRE(again.cluster.executor_tick_interval == config.cluster.executor_tick_interval);
        REQUIRE(again.cluster.max_frame_size == config.cluster.max_frame_size);
        REQUIRE(again.runtime.worker_threads == config.runtime.worker_threads);
        REQUIRE(again.log.level == config.log.level);
    }

    SECTION("Save and load a file") {
        auto path = std::filesystem::temp_directory_path() /
                    ("troupe_config_" + std::to_string(::getpid()) + ".json");
        config.save(path);
        auto loaded = Config::load(path);
        std::filesystem::remove(path);

        REQUIRE(loaded.node.name == "alpha");
        REQUIRE(loaded.cluster.seed_nodes == config.cluster.seed_nodes);
    }
}

TEST_CASE("Config load of a missing file throws", "[config]") {
    REQUIRE_THROWS(Config::load("/nonexistent/troupe/config.json"));
}

TEST_CASE("Config validation", "[config]") {
    auto config = valid_config();
    REQUIRE(config.validate().ok());

    SECTION("Name containing @") {
        config.node.name = "a@b";
        REQUIRE_FALSE(config.validate().ok());
    }

    SECTION("Address without port") {
        config.node.address = "127.0.0.1";
        REQUIRE_FALSE(config.validate().ok());
    }

    SECTION("Address with a bad port") {
        config.node.address = "127.0.0.1:99999";
        REQUIRE_FALSE(config.validate().ok());
    }

    SECTION("Malformed seed node") {
        config.cluster.seed_nodes = {"127.0.0.1:7002"};
        REQUIRE_FALSE(config.validate().ok());
    }

    SECTION("Zero tick interval") {
        config.cluster.tick_interval = std::chrono::milliseconds(0);
        REQUIRE_FALSE(config.validate().ok());
    }

    SECTION("Timeout not a multiple of the tick") {
        config.cluster.tick_interval = std::chrono::milliseconds(300);
        config.cluster.request_timeout = std::chrono::milliseconds(1000);
        REQUIRE_FALSE(config.validate().ok());
    }

    SECTION("Timeout shorter than the tick") {
        config.cluster.request_timeout = std::chrono::milliseconds(500);
        REQUIRE_FALSE(config.validate().ok());
    }

    SECTION("Frame limit not above the header size") {
        config.cluster.max_frame_size = 12;
        REQUIRE_FALSE(config.validate().ok());
    }

    SECTION("Unknown log level") {
        config.log.level = "verbose";
        REQUIRE_FALSE(config.validate().ok());
        config.log.level = "warning";
        REQUIRE(config.validate().ok());
    }
}
