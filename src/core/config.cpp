#include "troupe/config.hpp"
#include "troupe/log.hpp"
#include "troupe/protocol.hpp"
#include "troupe/socket.hpp"
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace troupe {

// Minimal JSON value extraction, enough for the flat config layout

namespace {

class SimpleJson {
public:
    explicit SimpleJson(const std::string& json) : json_(json) {}

    std::string get_string(const std::string& key, const std::string& def = "") const {
        auto pos = json_.find("\"" + key + "\"");
        if (pos == std::string::npos) return def;

        pos = json_.find(':', pos);
        if (pos == std::string::npos) return def;

        pos = json_.find('"', pos);
        if (pos == std::string::npos) return def;

        auto end = json_.find('"', pos + 1);
        if (end == std::string::npos) return def;

        return json_.substr(pos + 1, end - pos - 1);
    }

    int64_t get_int(const std::string& key, int64_t def = 0) const {
        auto pos = json_.find("\"" + key + "\"");
        if (pos == std::string::npos) return def;

        pos = json_.find(':', pos);
        if (pos == std::string::npos) return def;

        // Skip whitespace
        ++pos;
        while (pos < json_.size() && std::isspace(static_cast<unsigned char>(json_[pos]))) ++pos;

        auto end = pos;
        while (end < json_.size() &&
               (std::isdigit(static_cast<unsigned char>(json_[end])) || json_[end] == '-')) ++end;

        if (end == pos) return def;
        return std::stoll(json_.substr(pos, end - pos));
    }

    std::vector<std::string> get_string_array(const std::string& key) const {
        std::vector<std::string> result;
        auto pos = json_.find("\"" + key + "\"");
        if (pos == std::string::npos) return result;

        pos = json_.find('[', pos);
        if (pos == std::string::npos) return result;

        auto end = json_.find(']', pos);
        if (end == std::string::npos) return result;

        std::string arr = json_.substr(pos + 1, end - pos - 1);
        size_t start = 0;
        while ((start = arr.find('"', start)) != std::string::npos) {
            auto str_end = arr.find('"', start + 1);
            if (str_end == std::string::npos) break;
            result.push_back(arr.substr(start + 1, str_end - start - 1));
            start = str_end + 1;
        }

        return result;
    }

    SimpleJson get_object(const std::string& key) const {
        auto pos = json_.find("\"" + key + "\"");
        if (pos == std::string::npos) return SimpleJson("{}");

        pos = json_.find('{', pos);
        if (pos == std::string::npos) return SimpleJson("{}");

        int depth = 1;
        size_t end = pos + 1;
        while (end < json_.size() && depth > 0) {
            if (json_[end] == '{') ++depth;
            else if (json_[end] == '}') --depth;
            ++end;
        }

        return SimpleJson(json_.substr(pos, end - pos));
    }

private:
    std::string json_;
};

}  // namespace

Config Config::load(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Failed to open config file: " + path.string());
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return load_json(buffer.str());
}

Config Config::load_json(const std::string& json) {
    Config config;
    SimpleJson j(json);

    // Node identity
    auto node = j.get_object("node");
    config.node.name = node.get_string("name", config.node.name);
    config.node.address = node.get_string("address", config.node.address);

    // Cluster config
    auto cluster = j.get_object("cluster");
    config.cluster.seed_nodes = cluster.get_string_array("seed_nodes");
    config.cluster.tick_interval = std::chrono::milliseconds(
        cluster.get_int("tick_interval_ms", config.cluster.tick_interval.count()));
    config.cluster.request_timeout = std::chrono::milliseconds(
        cluster.get_int("request_timeout_ms", config.cluster.request_timeout.count()));
    config.cluster.executor_tick_interval = std::chrono::milliseconds(
        cluster.get_int("executor_tick_interval_ms", config.cluster.executor_tick_interval.count()));
    config.cluster.max_frame_size = static_cast<uint32_t>(
        cluster.get_int("max_frame_size", config.cluster.max_frame_size));

    // Runtime config
    auto runtime = j.get_object("runtime");
    config.runtime.worker_threads = runtime.get_int("worker_threads", 0);

    // Logging
    auto log = j.get_object("log");
    config.log.level = log.get_string("level", config.log.level);

    return config;
}

void Config::save(const std::filesystem::path& path) const {
    std::ofstream file(path);
    if (!file) {
        throw std::runtime_error("Failed to open config file for writing: " + path.string());
    }
    file << to_json();
}

std::string Config::to_json() const {
    std::ostringstream oss;
    oss << "{\n";

    // Node
    oss << "  \"node\": {\n";
    oss << "    \"name\": \"" << node.name << "\",\n";
    oss << "    \"address\": \"" << node.address << "\"\n";
    oss << "  },\n";

    // Cluster
    oss << "  \"cluster\": {\n";
    oss << "    \"seed_nodes\": [";
    for (size_t i = 0; i < cluster.seed_nodes.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << "\"" << cluster.seed_nodes[i] << "\"";
    }
    oss << "],\n";
    oss << "    \"tick_interval_ms\": " << cluster.tick_interval.count() << ",\n";
    oss << "    \"request_timeout_ms\": " << cluster.request_timeout.count() << ",\n";
    oss << "    \"executor_tick_interval_ms\": " << cluster.executor_tick_interval.count() << ",\n";
    oss << "    \"max_frame_size\": " << cluster.max_frame_size << "\n";
    oss << "  },\n";

    // Runtime
    oss << "  \"runtime\": {\n";
    oss << "    \"worker_threads\": " << runtime.worker_threads << "\n";
    oss << "  },\n";

    // Log
    oss << "  \"log\": {\n";
    oss << "    \"level\": \"" << log.level << "\"\n";
    oss << "  }\n";

    oss << "}\n";
    return oss.str();
}

Status Config::validate() const {
    if (node.name.empty()) {
        return Status::error(ErrorCode::InvalidArgument, "Node name must not be empty");
    }

    if (node.name.find('@') != std::string::npos) {
        return Status::error(ErrorCode::InvalidArgument, "Node name must not contain '@'");
    }

    if (!SocketAddress::parse(node.address)) {
        return Status::error(ErrorCode::InvalidArgument,
                            "Node address must be host:port, got '" + node.address + "'");
    }

    for (const auto& seed : cluster.seed_nodes) {
        if (!NodeId::parse(seed)) {
            return Status::error(ErrorCode::InvalidArgument,
                                "Seed node must be name@host:port, got '" + seed + "'");
        }
    }

    if (cluster.tick_interval.count() <= 0 || cluster.executor_tick_interval.count() <= 0) {
        return Status::error(ErrorCode::InvalidArgument, "Tick intervals must be positive");
    }

    if (cluster.request_timeout < cluster.tick_interval ||
        cluster.request_timeout % cluster.tick_interval != std::chrono::milliseconds(0)) {
        return Status::error(ErrorCode::InvalidArgument,
                            "request_timeout must be a positive multiple of tick_interval");
    }

    if (cluster.max_frame_size <= protocol::MessageHeader::SIZE) {
        return Status::error(ErrorCode::InvalidArgument,
                            "max_frame_size must be larger than the frame header");
    }

    if (!troupe::log::parse_level(log.level)) {
        return Status::error(ErrorCode::InvalidArgument, "Unknown log level '" + log.level + "'");
    }

    return Status::make_ok();
}

}  // namespace troupe
