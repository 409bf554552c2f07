#include "troupe/reconcile.hpp"
#include <algorithm>
#include <iterator>

namespace troupe {

ReconcilePlan plan_reconciliation(const std::set<NodeId>& desired,
                                  const std::set<NodeId>& connected,
                                  const NodeId& local) {
    ReconcilePlan plan;

    if (desired.count(local) == 0) {
        plan.evicted = true;
        return plan;
    }

    std::set_difference(desired.begin(), desired.end(),
                        connected.begin(), connected.end(),
                        std::inserter(plan.to_connect, plan.to_connect.end()));
    plan.to_connect.erase(local);

    std::set_difference(connected.begin(), connected.end(),
                        desired.begin(), desired.end(),
                        std::inserter(plan.to_disconnect, plan.to_disconnect.end()));

    return plan;
}

}  // namespace troupe
