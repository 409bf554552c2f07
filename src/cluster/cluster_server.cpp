#include "troupe/cluster_server.hpp"
#include "troupe/handshake.hpp"
#include "troupe/log.hpp"
#include "troupe/reconcile.hpp"
#include <algorithm>
#include <sstream>

namespace troupe {

namespace {

constexpr const char* COMPONENT = "cluster_server";

// Visitor helper for std::visit over the message variants
template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

}  // namespace

ClusterServer::ClusterServer(NodeId local, ClusterConfig config,
                             Sender<ExecutorMsg> executor, Registrar& registrar)
    : local_(std::move(local))
    , config_(std::move(config))
    , executor_(std::move(executor))
    , registrar_(registrar)
    , members_(local_)
    , timer_wheel_(config_.timeout_ticks())
{
    pid_ = cluster_server_pid(local_);
}

ClusterServer::~ClusterServer() {
    close_all();
    if (listener_.valid()) {
        auto status = registrar_.deregister(listener_.fd());
        if (!status) {
            TROUPE_LOG_DEBUG(COMPONENT, "Listener deregister: " << status.to_string());
        }
    }
}

Status ClusterServer::start() {
    auto addr = SocketAddress::parse(local_.address());
    if (!addr) {
        return Status::error(ErrorCode::InvalidArgument,
                            "Invalid node address: " + local_.address());
    }

    auto status = TcpListener::bind(*addr, listener_);
    if (!status) return status;

    auto listener_id = registrar_.register_socket(listener_.fd(), Event::Read);
    if (!listener_id) {
        return Status::error(ErrorCode::RegistrarError, "Failed to register listener");
    }
    listener_id_ = *listener_id;

    auto tick_id = registrar_.set_interval(config_.tick_interval);
    auto executor_tick_id = registrar_.set_interval(config_.executor_tick_interval);
    if (!tick_id || !executor_tick_id) {
        return Status::error(ErrorCode::RegistrarError, "Failed to set up timers");
    }
    tick_timer_id_ = *tick_id;
    executor_timer_id_ = *executor_tick_id;

    TROUPE_LOG_INFO(COMPONENT, "Listening on " << addr->to_string()
                    << " as " << local_.to_string());
    return Status::make_ok();
}

void ClusterServer::run(Receiver<ClusterMsg>& rx) {
    TROUPE_LOG_INFO(COMPONENT, "Starting");

    while (auto msg = rx.recv()) {
        auto status = handle(std::move(*msg));
        if (status) continue;

        switch (status.code()) {
            case ErrorCode::Shutdown:
                TROUPE_LOG_INFO(COMPONENT, status.to_string());
                return;
            case ErrorCode::SendError:
                TROUPE_LOG_ERROR(COMPONENT, status.to_string());
                return;
            default:
                TROUPE_LOG_WARN(COMPONENT, status.to_string());
                break;
        }
    }

    TROUPE_LOG_INFO(COMPONENT, "Control channel closed, stopping");
}

Status ClusterServer::handle(ClusterMsg msg) {
    errors_.clear();
    fatal_ = Status::make_ok();

    bool shutdown = false;
    std::visit(overloaded{
        [&](PollNotifications& m) {
            metrics_.poll_notifications.inc();
            handle_poll_notifications(m.notifications);
        },
        [&](Join& m) {
            metrics_.joins.inc();
            join(m.node);
        },
        [&](Leave& m) {
            metrics_.leaves.inc();
            leave(m.node);
        },
        [&](Envelope& m) {
            metrics_.local_envelopes.inc();
            route_envelope(std::move(m));
        },
        [&](GetStatus& m) {
            metrics_.status_requests.inc();
            get_status(m.correlation_id);
        },
        [&](Shutdown&) {
            shutdown = true;
        },
    }, msg);

    update_gauges();

    if (!fatal_) {
        return fatal_;
    }
    if (shutdown) {
        return Status::error(ErrorCode::Shutdown, "Shutdown requested for " + pid_.to_string());
    }
    if (!errors_.empty()) {
        std::ostringstream oss;
        oss << errors_.size() << " error(s):";
        for (const auto& e : errors_) {
            oss << " [" << e << "]";
        }
        errors_.clear();
        return Status::error(ErrorCode::NetworkError, oss.str());
    }
    return Status::make_ok();
}

// Control messages

void ClusterServer::handle_poll_notifications(const std::vector<Notification>& notifications) {
    TROUPE_LOG_TRACE(COMPONENT, "Poll notifications: " << notifications.size());

    for (const auto& n : notifications) {
        if (!fatal_) break;

        if (n.id == listener_id_) {
            accept_connections();
        } else if (n.id == tick_timer_id_) {
            tick();
        } else if (n.id == executor_timer_id_) {
            tick_executor();
        } else {
            socket_io(n.id, n.event);
        }
    }
}

void ClusterServer::join(const NodeId& node) {
    TROUPE_LOG_INFO(COMPONENT, "Join " << node.to_string());
    broadcast(protocol::DeltaMessage{members_.add(node)});

    metrics_.connection_attempts.inc();
    auto status = connect(node);
    if (!status) {
        note_error(status);
    }
}

void ClusterServer::leave(const NodeId& node) {
    TROUPE_LOG_INFO(COMPONENT, "Leave " << node.to_string());
    if (auto delta = members_.leave(node)) {
        broadcast(protocol::DeltaMessage{std::move(*delta)});
    }
}

void ClusterServer::route_envelope(Envelope envelope) {
    if (envelope.to == pid_) {
        send_metrics(envelope);
        return;
    }

    auto it = established_.find(envelope.to.node);
    auto conn_it = it == established_.end() ? connections_.end() : connections_.find(it->second);
    if (conn_it == connections_.end()) {
        TROUPE_LOG_TRACE(COMPONENT, "No connection to " << envelope.to.node.to_string()
                         << ", dropping envelope for " << envelope.to.to_string());
        return;
    }

    RegistrationId id = conn_it->first;
    auto& conn = conn_it->second;
    TROUPE_LOG_TRACE(COMPONENT, "Send remote to " << envelope.to.to_string());

    auto status = conn.writer.push(protocol::EnvelopeMessage{std::move(envelope)});
    if (!status) {
        fail(id, status);
        return;
    }
    status = write(id);
    if (!status) {
        fail(id, status);
    }
}

void ClusterServer::get_status(const CorrelationId& correlation_id) {
    if (!correlation_id.pid) {
        TROUPE_LOG_WARN(COMPONENT, "Status request without a reply pid, dropping");
        return;
    }

    Envelope reply;
    reply.to = *correlation_id.pid;
    reply.from = pid_;
    reply.correlation_id = correlation_id;
    reply.body = status();
    send_to_executor(std::move(reply));
}

void ClusterServer::send_metrics(const Envelope& request) {
    if (!std::holds_alternative<GetMetrics>(request.body)) {
        TROUPE_LOG_ERROR(COMPONENT, "Received unknown message from " << request.from.to_string());
        return;
    }

    update_gauges();

    Envelope reply;
    reply.to = request.from;
    reply.from = pid_;
    reply.correlation_id = request.correlation_id;
    reply.body = MetricsReply{metrics_.snapshot()};
    send_to_executor(std::move(reply));
}

// Readiness

void ClusterServer::accept_connections() {
    while (true) {
        std::optional<TcpSocket> sock;
        auto status = listener_.accept(sock);
        if (!status) {
            note_error(status);
            return;
        }
        if (!sock) {
            return;
        }

        metrics_.accepted_connections.inc();
        auto id = add_connection(std::move(*sock), std::nullopt, Event::Read);
        if (!id) {
            note_error(Status::error(ErrorCode::RegistrarError,
                                     "Failed to register accepted connection"));
            continue;
        }

        TROUPE_LOG_DEBUG(COMPONENT, "Accepted connection " << *id);
        status = send_members(*id);
        if (!status) {
            fail(*id, status);
        }
    }
}

void ClusterServer::tick() {
    TROUPE_LOG_TRACE(COMPONENT, "Tick");

    for (auto id : timer_wheel_.expire()) {
        if (connections_.count(id)) {
            TROUPE_LOG_WARN(COMPONENT, "Connection timeout: " << describe(id));
            close(id);
        }
    }

    broadcast(protocol::PingMessage{});
    reconcile();
}

void ClusterServer::tick_executor() {
    send_to_executor(Tick{});
}

void ClusterServer::socket_io(RegistrationId id, Event event) {
    if (!connections_.count(id)) {
        return;
    }

    if (has_read(event)) {
        auto status = on_readable(id);
        if (!status) {
            fail(id, status);
            return;
        }
    }

    if (has_write(event) && connections_.count(id)) {
        auto status = on_writable(id);
        if (!status) {
            fail(id, status);
        }
    }
}

Status ClusterServer::on_readable(RegistrationId id) {
    {
        auto& conn = connections_.at(id);
        if (!conn.members_sent) {
            auto status = send_members(id);
            if (!status) return status;
        }
    }

    std::vector<protocol::PeerMessage> messages;
    auto read_status = connections_.at(id).reader.read(connections_.at(id).socket.fd(), messages);

    for (auto& msg : messages) {
        // A duplicate-link resolution or a fatal error may end this connection
        if (!connections_.count(id) || !fatal_) {
            return Status::make_ok();
        }
        reset_timer(id);
        handle_peer_message(id, std::move(msg));
    }

    if (!connections_.count(id)) {
        return Status::make_ok();
    }
    return read_status;
}

Status ClusterServer::on_writable(RegistrationId id) {
    auto& conn = connections_.at(id);

    if (!conn.connected) {
        auto status = conn.socket.take_error();
        if (!status) return status;
        conn.connected = true;
        TROUPE_LOG_DEBUG(COMPONENT, "Connected " << describe(id));
    }

    if (!conn.members_sent) {
        return send_members(id);
    }
    return write(id);
}

// Peer messages

void ClusterServer::handle_peer_message(RegistrationId id, protocol::PeerMessage msg) {
    std::visit(overloaded{
        [&](protocol::MembersMessage& m) {
            handle_members(id, m);
        },
        [&](protocol::PingMessage&) {
            TROUPE_LOG_TRACE(COMPONENT, "Ping from " << describe(id));
        },
        [&](protocol::EnvelopeMessage& m) {
            metrics_.remote_envelopes.inc();
            TROUPE_LOG_DEBUG(COMPONENT, "Envelope from " << m.envelope.from.to_string()
                             << " to " << m.envelope.to.to_string());
            send_to_executor(std::move(m.envelope));
        },
        [&](protocol::DeltaMessage& m) {
            TROUPE_LOG_DEBUG(COMPONENT, "Delta from " << describe(id));
            merge_and_gossip(m.delta, id);
        },
    }, msg);
}

void ClusterServer::handle_members(RegistrationId id, const protocol::MembersMessage& msg) {
    const NodeId& from = msg.from;
    TROUPE_LOG_INFO(COMPONENT, "Members from " << from.to_string() << " on connection " << id);

    if (from == local_) {
        fail(id, Status::error(ErrorCode::InvalidArgument, "Peer claims the local identity"));
        return;
    }

    {
        auto& conn = connections_.at(id);
        if (conn.handshake_complete && conn.peer && *conn.peer != from) {
            fail(id, Status::error(ErrorCode::InvalidArgument,
                                   "Peer " + conn.peer->to_string() + " changed identity to "
                                   + from.to_string()));
            return;
        }
        if (conn.peer && *conn.peer != from) {
            TROUPE_LOG_WARN(COMPONENT, "Connection " << id << " to " << conn.peer->to_string()
                            << " answered as " << from.to_string());
        }
    }

    merge_and_gossip(msg.state, id);

    auto existing = established_.find(from);
    if (existing != established_.end() && existing->second != id) {
        RegistrationId saved_id = existing->second;
        const auto& saved = connections_.at(saved_id);
        auto resolution = resolve_duplicate_link(local_, from, saved.is_initiator);

        TROUPE_LOG_DEBUG(COMPONENT, "Duplicate link to " << from.to_string()
                         << ": saved=" << saved_id << " new=" << id
                         << " -> " << link_resolution_string(resolution));

        if (resolution == LinkResolution::KeepExisting) {
            close(id);
            return;
        }
        close(saved_id);
    }

    auto& conn = connections_.at(id);
    conn.peer = from;
    conn.handshake_complete = true;
    reset_timer(id);
    established_[from] = id;
    TROUPE_LOG_INFO(COMPONENT, "Established connection " << id << " to " << from.to_string());

    reconcile();
}

void ClusterServer::merge_and_gossip(const MemberState& state, RegistrationId source) {
    auto novel = members_.join_novel(state);
    if (!novel.empty()) {
        broadcast(protocol::DeltaMessage{std::move(novel)}, source);
    }
}

// Connections

Status ClusterServer::connect(const NodeId& node) {
    if (node == local_) {
        return Status::make_ok();
    }
    for (const auto& [id, conn] : connections_) {
        if (conn.peer && *conn.peer == node) {
            return Status::make_ok();
        }
    }

    auto addr = SocketAddress::parse(node.address());
    if (!addr) {
        return Status::error(ErrorCode::ConnectError,
                            "Invalid address for " + node.to_string());
    }

    TcpSocket sock;
    auto status = TcpSocket::connect(*addr, sock);
    if (!status) {
        return Status::error(ErrorCode::ConnectError,
                            node.to_string() + ": " + status.message());
    }

    auto id = add_connection(std::move(sock), node, Event::Both);
    if (!id) {
        return Status::error(ErrorCode::RegistrarError,
                            "Failed to register connection to " + node.to_string());
    }

    TROUPE_LOG_DEBUG(COMPONENT, "Connecting to " << node.to_string() << " on connection " << *id);
    return Status::make_ok();
}

std::optional<RegistrationId> ClusterServer::add_connection(TcpSocket sock,
                                                            std::optional<NodeId> peer,
                                                            Event interest) {
    auto id = registrar_.register_socket(sock.fd(), interest);
    if (!id) {
        return std::nullopt;
    }

    Connection conn(std::move(sock), std::move(peer), config_.max_frame_size);
    conn.write_armed = has_write(interest);
    conn.timer_slot = timer_wheel_.insert(*id);
    connections_.emplace(*id, std::move(conn));
    return id;
}

Status ClusterServer::send_members(RegistrationId id) {
    auto& conn = connections_.at(id);
    auto status = conn.writer.push(protocol::MembersMessage{local_, members_.snapshot()});
    if (!status) return status;

    conn.members_sent = true;
    TROUPE_LOG_DEBUG(COMPONENT, "Sent members on connection " << id);
    return write(id);
}

// Flush pending output and keep write interest armed only while some remains
Status ClusterServer::write(RegistrationId id) {
    auto& conn = connections_.at(id);

    if (conn.connected) {
        auto status = conn.writer.flush(conn.socket.fd());
        if (!status) return status;
    }

    bool want_write = !conn.connected || conn.writer.pending();
    if (want_write != conn.write_armed) {
        auto status = registrar_.reregister(id, conn.socket.fd(),
                                            want_write ? Event::Both : Event::Read);
        if (!status) return status;
        conn.write_armed = want_write;
    }
    return Status::make_ok();
}

void ClusterServer::broadcast(const protocol::PeerMessage& msg, RegistrationId except) {
    ByteBuffer frame;
    try {
        frame = protocol::Codec::encode(msg);
    } catch (const std::exception& e) {
        note_error(Status::error(ErrorCode::EncodeError, e.what()));
        return;
    }

    std::vector<RegistrationId> targets;
    for (const auto& [id, conn] : connections_) {
        if (conn.members_sent && id != except) {
            targets.push_back(id);
        }
    }

    for (auto id : targets) {
        if (!connections_.count(id)) continue;
        connections_.at(id).writer.push_frame(frame);
        auto status = write(id);
        if (!status) {
            fail(id, status);
        }
    }
}

void ClusterServer::reset_timer(RegistrationId id) {
    auto it = connections_.find(id);
    if (it != connections_.end()) {
        it->second.timer_slot = timer_wheel_.reset(id, it->second.timer_slot);
    }
}

void ClusterServer::close(RegistrationId id) {
    auto it = connections_.find(id);
    if (it == connections_.end()) {
        return;
    }

    auto& conn = it->second;
    auto status = registrar_.deregister(conn.socket.fd());
    if (!status) {
        TROUPE_LOG_WARN(COMPONENT, "Failed to deregister connection " << id << ": "
                        << status.to_string());
    }
    timer_wheel_.remove(id, conn.timer_slot);

    bool was_established = false;
    for (auto est = established_.begin(); est != established_.end();) {
        if (est->second == id) {
            est = established_.erase(est);
            was_established = true;
        } else {
            ++est;
        }
    }

    TROUPE_LOG_INFO(COMPONENT, "Closing " << (was_established ? "established" : "unestablished")
                    << " connection " << describe(id));
    connections_.erase(it);
}

void ClusterServer::close_all() {
    std::vector<RegistrationId> ids;
    for (const auto& [id, conn] : connections_) {
        ids.push_back(id);
    }
    for (auto id : ids) {
        close(id);
    }
}

void ClusterServer::reconcile() {
    std::set<NodeId> connected;
    for (const auto& [id, conn] : connections_) {
        if (conn.peer) {
            connected.insert(*conn.peer);
        }
    }

    auto plan = plan_reconciliation(members_.all(), connected, local_);

    if (plan.evicted) {
        if (!connections_.empty()) {
            TROUPE_LOG_WARN(COMPONENT, local_.to_string()
                            << " is no longer a member, closing all connections");
            close_all();
        }
        return;
    }

    for (const auto& node : plan.to_connect) {
        metrics_.connection_attempts.inc();
        auto status = connect(node);
        if (!status) {
            TROUPE_LOG_WARN(COMPONENT, status.to_string());
        }
    }

    if (!plan.to_disconnect.empty()) {
        std::vector<RegistrationId> ids;
        for (const auto& [id, conn] : connections_) {
            if (conn.peer && plan.to_disconnect.count(*conn.peer)) {
                ids.push_back(id);
            }
        }
        for (auto id : ids) {
            TROUPE_LOG_INFO(COMPONENT, "Disconnecting non-member " << describe(id));
            close(id);
        }
    }
}

// Errors

void ClusterServer::fail(RegistrationId id, const Status& status) {
    metrics_.errors.inc();
    errors_.push_back(describe(id) + ": " + status.to_string());
    close(id);
}

void ClusterServer::note_error(const Status& status) {
    metrics_.errors.inc();
    errors_.push_back(status.to_string());
}

bool ClusterServer::send_to_executor(ExecutorMsg msg) {
    if (executor_.send(std::move(msg))) {
        return true;
    }
    fatal_ = Status::error(ErrorCode::SendError, "Executor channel closed");
    return false;
}

ClusterStatus ClusterServer::status() const {
    ClusterStatus s;
    auto all = members_.all();
    s.members.assign(all.begin(), all.end());
    for (const auto& [node, id] : established_) {
        s.established.push_back(node);
    }
    std::sort(s.established.begin(), s.established.end());
    s.num_connections = connections_.size();
    return s;
}

std::optional<ConnectionView> ClusterServer::established_connection(const NodeId& node) const {
    auto it = established_.find(node);
    if (it == established_.end()) {
        return std::nullopt;
    }
    const auto& conn = connections_.at(it->second);
    return ConnectionView{it->second, conn.peer, conn.is_initiator,
                          conn.handshake_complete, conn.members_sent};
}

std::vector<ConnectionView> ClusterServer::connections() const {
    std::vector<ConnectionView> result;
    for (const auto& [id, conn] : connections_) {
        result.push_back(ConnectionView{id, conn.peer, conn.is_initiator,
                                        conn.handshake_complete, conn.members_sent});
    }
    return result;
}

std::string ClusterServer::describe(RegistrationId id) const {
    std::string s = "conn " + std::to_string(id);
    auto it = connections_.find(id);
    if (it != connections_.end() && it->second.peer) {
        s += " (" + it->second.peer->to_string() + ")";
    }
    return s;
}

void ClusterServer::update_gauges() {
    metrics_.members.set(members_.all().size());
    metrics_.established.set(established_.size());
    metrics_.connections.set(connections_.size());
}

}  // namespace troupe
