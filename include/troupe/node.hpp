#pragma once

#include "troupe/types.hpp"
#include "troupe/config.hpp"
#include "troupe/channel.hpp"
#include "troupe/cluster_server.hpp"
#include "troupe/executor.hpp"
#include "troupe/messages.hpp"
#include "troupe/poller.hpp"
#include <elio/io/io_context.hpp>
#include <elio/runtime/scheduler.hpp>
#include <atomic>
#include <memory>
#include <string>
#include <thread>

namespace troupe {

// One cluster member: the elio runtime, the epoll poller, the cluster
// server loop and the executor, wired together by channels.
class Node {
public:
    explicit Node(Config config);
    ~Node();

    Node(const Node&) = delete;
    Node& operator=(const Node&) = delete;

    // Bind, start every thread and join the configured seed nodes
    Status start();

    // Stop all loops and release sockets. Safe to call more than once.
    void shutdown();

    // Control surface. Each returns false once the target loop is gone.
    bool join(const NodeId& node);
    bool leave(const NodeId& node);
    bool send(Envelope envelope);
    bool cluster_status(const CorrelationId& correlation_id);

    // Mailbox for envelopes addressed to `pid` on this node
    Receiver<Envelope> register_service(const Pid& pid);

    // Pid of a service on this node
    Pid pid(std::string name, std::optional<std::string> group = std::nullopt) const;

    const NodeId& id() const noexcept { return id_; }
    const Config& config() const noexcept { return config_; }
    bool is_running() const noexcept { return running_; }
    uint64_t executor_ticks() const { return executor_ ? executor_->ticks() : 0; }

    elio::io::io_context& io_context() { return io_ctx_; }

private:
    Config config_;
    NodeId id_;

    elio::io::io_context io_ctx_;
    std::unique_ptr<elio::runtime::scheduler> sched_;

    Sender<ClusterMsg> cluster_tx_;
    Receiver<ClusterMsg> cluster_rx_;
    Sender<ExecutorMsg> executor_tx_;
    Receiver<ExecutorMsg> executor_rx_;

    std::unique_ptr<Poller> poller_;
    std::unique_ptr<ClusterServer> server_;
    std::unique_ptr<Executor> executor_;
    std::thread server_thread_;
    std::thread executor_thread_;

    std::atomic<bool> running_{false};
    bool stopped_ = false;
};

}  // namespace troupe
