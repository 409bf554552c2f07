#pragma once

// Main include file for Troupe

#include "types.hpp"
#include "config.hpp"
#include "log.hpp"
#include "metrics.hpp"
#include "envelope.hpp"
#include "orset.hpp"
#include "members.hpp"
#include "timing_wheel.hpp"
#include "protocol.hpp"
#include "framing.hpp"
#include "socket.hpp"
#include "registrar.hpp"
#include "poller.hpp"
#include "channel.hpp"
#include "messages.hpp"
#include "handshake.hpp"
#include "reconcile.hpp"
#include "cluster_server.hpp"
#include "executor.hpp"
#include "node.hpp"

namespace troupe {

// Version information
struct Version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;
    static const char* string() { return "0.1.0"; }
};

}  // namespace troupe
