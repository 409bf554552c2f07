#pragma once

#include "troupe/types.hpp"
#include "troupe/channel.hpp"
#include "troupe/messages.hpp"
#include <atomic>
#include <map>

namespace troupe {

// Local message relay. Envelopes for this node go to the mailbox of the
// registered service; envelopes for other nodes, and requests for the local
// cluster server, go to the cluster server channel.
class Executor {
public:
    Executor(NodeId local, Receiver<ExecutorMsg> rx, Sender<ClusterMsg> cluster);

    Executor(const Executor&) = delete;
    Executor& operator=(const Executor&) = delete;

    // Process messages until Shutdown or the channel disconnects
    void run();

    // Process one message. SendError (cluster server gone) and Shutdown
    // mean the loop must stop.
    Status handle(ExecutorMsg msg);

    uint64_t ticks() const noexcept { return ticks_.load(std::memory_order_relaxed); }
    size_t services() const noexcept { return services_.size(); }

private:
    Status route(Envelope envelope);

    NodeId local_;
    Receiver<ExecutorMsg> rx_;
    Sender<ClusterMsg> cluster_;
    std::map<Pid, Sender<Envelope>> services_;
    std::atomic<uint64_t> ticks_{0};
};

}  // namespace troupe
