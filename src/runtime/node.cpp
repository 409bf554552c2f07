#include "troupe/node.hpp"
#include "troupe/log.hpp"

namespace troupe {

namespace {

constexpr const char* COMPONENT = "node";

}  // namespace

Node::Node(Config config)
    : config_(std::move(config))
    , id_(config_.node_id())
{
    auto [cluster_tx, cluster_rx] = make_channel<ClusterMsg>();
    cluster_tx_ = std::move(cluster_tx);
    cluster_rx_ = std::move(cluster_rx);

    auto [executor_tx, executor_rx] = make_channel<ExecutorMsg>();
    executor_tx_ = std::move(executor_tx);
    executor_rx_ = std::move(executor_rx);
}

Node::~Node() {
    shutdown();
}

Status Node::start() {
    if (running_) {
        return Status::make_ok();
    }

    auto status = config_.validate();
    if (!status) return status;

    // Readiness batches and timer ticks feed the cluster server channel
    poller_ = std::make_unique<Poller>(io_ctx_,
        [tx = cluster_tx_](std::vector<Notification> batch) {
            return tx.send(PollNotifications{std::move(batch)});
        });
    status = poller_->open();
    if (!status) return status;

    server_ = std::make_unique<ClusterServer>(id_, config_.cluster, executor_tx_, *poller_);
    status = server_->start();
    if (!status) return status;

    executor_ = std::make_unique<Executor>(id_, std::move(executor_rx_), cluster_tx_);

    // Determine number of worker threads
    size_t num_threads = config_.runtime.worker_threads;
    if (num_threads == 0) {
        num_threads = std::thread::hardware_concurrency();
        if (num_threads == 0) num_threads = 4;
    }

    sched_ = std::make_unique<elio::runtime::scheduler>(num_threads);
    sched_->set_io_context(&io_ctx_);
    sched_->start();

    poller_->start(*sched_);

    server_thread_ = std::thread([this] { server_->run(cluster_rx_); });
    executor_thread_ = std::thread([this] { executor_->run(); });
    running_ = true;

    TROUPE_LOG_INFO(COMPONENT, "Node " << id_.to_string() << " started with "
                    << num_threads << " worker threads");

    for (const auto& seed : config_.cluster.seed_nodes) {
        auto node = NodeId::parse(seed);
        if (node && *node != id_) {
            join(*node);
        }
    }

    return Status::make_ok();
}

void Node::shutdown() {
    if (stopped_) {
        return;
    }
    stopped_ = true;
    running_ = false;

    // Both loops exit on Shutdown; a loop that already stopped ignores it
    if (!cluster_tx_.send(Shutdown{})) {
        TROUPE_LOG_DEBUG(COMPONENT, "Cluster server already stopped");
    }
    if (!executor_tx_.send(Shutdown{})) {
        TROUPE_LOG_DEBUG(COMPONENT, "Executor already stopped");
    }

    if (server_thread_.joinable()) server_thread_.join();
    if (executor_thread_.joinable()) executor_thread_.join();

    if (poller_) poller_->stop();
    if (sched_) {
        sched_->shutdown();
    }

    server_.reset();
    executor_.reset();
    poller_.reset();
    sched_.reset();

    TROUPE_LOG_INFO(COMPONENT, "Node " << id_.to_string() << " stopped");
}

bool Node::join(const NodeId& node) {
    return cluster_tx_.send(Join{node});
}

bool Node::leave(const NodeId& node) {
    return cluster_tx_.send(Leave{node});
}

bool Node::send(Envelope envelope) {
    return executor_tx_.send(std::move(envelope));
}

bool Node::cluster_status(const CorrelationId& correlation_id) {
    return cluster_tx_.send(GetStatus{correlation_id});
}

Receiver<Envelope> Node::register_service(const Pid& pid) {
    auto [tx, rx] = make_channel<Envelope>();
    if (!executor_tx_.send(RegisterService{pid, std::move(tx)})) {
        TROUPE_LOG_WARN(COMPONENT, "Executor stopped, service " << pid.to_string()
                        << " will receive nothing");
    }
    return std::move(rx);
}

Pid Node::pid(std::string name, std::optional<std::string> group) const {
    Pid p;
    p.name = std::move(name);
    p.group = std::move(group);
    p.node = id_;
    return p;
}

}  // namespace troupe
