#pragma once

#include "troupe/types.hpp"
#include "troupe/envelope.hpp"
#include "troupe/registrar.hpp"
#include "troupe/channel.hpp"
#include <variant>
#include <vector>

namespace troupe {

// Address of the cluster server of `node`
inline Pid cluster_server_pid(const NodeId& node) {
    Pid pid;
    pid.name = "cluster_server";
    pid.group = "troupe";
    pid.node = node;
    return pid;
}

// Control messages consumed by the cluster server loop
struct PollNotifications {
    std::vector<Notification> notifications;
};

struct Join {
    NodeId node;
};

struct Leave {
    NodeId node;
};

struct GetStatus {
    CorrelationId correlation_id;
};

struct Shutdown {};

using ClusterMsg = std::variant<
    PollNotifications,
    Join,
    Leave,
    Envelope,
    GetStatus,
    Shutdown
>;

// Messages consumed by the executor
struct Tick {};

// Route envelopes addressed to `pid` into `mailbox`
struct RegisterService {
    Pid pid;
    Sender<Envelope> mailbox;
};

using ExecutorMsg = std::variant<
    Envelope,
    Tick,
    RegisterService,
    Shutdown
>;

}  // namespace troupe
