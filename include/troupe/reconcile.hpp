#pragma once

#include "troupe/types.hpp"
#include <set>

namespace troupe {

// Actions that move the connection set toward the membership set
struct ReconcilePlan {
    bool evicted = false;          // local node is no longer a member
    std::set<NodeId> to_connect;
    std::set<NodeId> to_disconnect;

    bool empty() const noexcept {
        return !evicted && to_connect.empty() && to_disconnect.empty();
    }
};

// `connected` holds the peers of every pending or established connection.
// When local is absent from `desired` the plan is eviction only.
ReconcilePlan plan_reconciliation(const std::set<NodeId>& desired,
                                  const std::set<NodeId>& connected,
                                  const NodeId& local);

}  // namespace troupe
