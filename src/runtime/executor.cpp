#include "troupe/executor.hpp"
#include "troupe/log.hpp"

namespace troupe {

namespace {

constexpr const char* COMPONENT = "executor";

}  // namespace

Executor::Executor(NodeId local, Receiver<ExecutorMsg> rx, Sender<ClusterMsg> cluster)
    : local_(std::move(local))
    , rx_(std::move(rx))
    , cluster_(std::move(cluster))
{}

void Executor::run() {
    TROUPE_LOG_INFO(COMPONENT, "Starting on " << local_.to_string());

    while (auto msg = rx_.recv()) {
        auto status = handle(std::move(*msg));
        if (status) continue;

        if (status.code() == ErrorCode::Shutdown) {
            TROUPE_LOG_INFO(COMPONENT, status.to_string());
        } else {
            TROUPE_LOG_ERROR(COMPONENT, status.to_string());
        }
        return;
    }

    TROUPE_LOG_INFO(COMPONENT, "Channel closed, stopping");
}

Status Executor::handle(ExecutorMsg msg) {
    if (auto* envelope = std::get_if<Envelope>(&msg)) {
        return route(std::move(*envelope));
    }

    if (std::holds_alternative<Tick>(msg)) {
        ticks_.fetch_add(1, std::memory_order_relaxed);
        return Status::make_ok();
    }

    if (auto* reg = std::get_if<RegisterService>(&msg)) {
        TROUPE_LOG_DEBUG(COMPONENT, "Registered service " << reg->pid.to_string());
        services_[reg->pid] = std::move(reg->mailbox);
        return Status::make_ok();
    }

    return Status::error(ErrorCode::Shutdown, "Executor shutdown requested");
}

Status Executor::route(Envelope envelope) {
    if (envelope.to.node != local_ || envelope.to == cluster_server_pid(local_)) {
        if (!cluster_.send(std::move(envelope))) {
            return Status::error(ErrorCode::SendError, "Cluster server channel closed");
        }
        return Status::make_ok();
    }

    auto it = services_.find(envelope.to);
    if (it == services_.end()) {
        TROUPE_LOG_WARN(COMPONENT, "No local service " << envelope.to.to_string()
                        << ", dropping envelope from " << envelope.from.to_string());
        return Status::make_ok();
    }

    if (!it->second.send(std::move(envelope))) {
        TROUPE_LOG_WARN(COMPONENT, "Service " << it->first.to_string()
                        << " is gone, unregistering");
        services_.erase(it);
    }
    return Status::make_ok();
}

}  // namespace troupe
