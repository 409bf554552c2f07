#pragma once

#include "troupe/types.hpp"
#include "troupe/config.hpp"
#include "troupe/channel.hpp"
#include "troupe/framing.hpp"
#include "troupe/members.hpp"
#include "troupe/messages.hpp"
#include "troupe/metrics.hpp"
#include "troupe/registrar.hpp"
#include "troupe/socket.hpp"
#include "troupe/timing_wheel.hpp"
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace troupe {

// One TCP link to a peer (or to a node that has not identified itself yet)
struct Connection {
    TcpSocket socket;
    std::optional<NodeId> peer;     // known up front for outgoing links
    bool is_initiator = false;
    bool connected = true;          // false while an outgoing connect is in flight
    bool handshake_complete = false;
    bool members_sent = false;
    bool write_armed = false;       // registered for write readiness
    size_t timer_slot = 0;
    FrameReader reader;
    FrameWriter writer;

    Connection(TcpSocket sock, std::optional<NodeId> peer_node, uint32_t max_frame_size)
        : socket(std::move(sock))
        , peer(std::move(peer_node))
        , is_initiator(peer.has_value())
        , connected(!is_initiator)
        , reader(max_frame_size)
    {}
};

// Read-only view of a connection, for status and tests
struct ConnectionView {
    RegistrationId id = 0;
    std::optional<NodeId> peer;
    bool is_initiator = false;
    bool handshake_complete = false;
    bool members_sent = false;
};

// Owns cluster membership and every peer connection of one node.
//
// Single-threaded: all state is touched only from handle(), which run()
// calls for each control message. Socket readiness and timer ticks arrive
// as PollNotifications batches from the Registrar.
class ClusterServer {
public:
    ClusterServer(NodeId local, ClusterConfig config,
                  Sender<ExecutorMsg> executor, Registrar& registrar);
    ~ClusterServer();

    ClusterServer(const ClusterServer&) = delete;
    ClusterServer& operator=(const ClusterServer&) = delete;

    // Bind the listener and set up the cluster and executor timers
    Status start();

    // Process control messages until Shutdown, a fatal error, or the
    // channel disconnects
    void run(Receiver<ClusterMsg>& rx);

    // Process one control message. Per-connection failures close the
    // affected connections and come back as one aggregated NetworkError.
    // Shutdown and SendError mean the loop must stop.
    Status handle(ClusterMsg msg);

    const NodeId& local() const noexcept { return local_; }
    const Pid& pid() const noexcept { return pid_; }
    const Members& members() const noexcept { return members_; }
    const ClusterMetrics& metrics() const noexcept { return metrics_; }

    ClusterStatus status() const;
    std::optional<ConnectionView> established_connection(const NodeId& node) const;
    std::vector<ConnectionView> connections() const;

    RegistrationId listener_id() const noexcept { return listener_id_; }
    RegistrationId tick_timer_id() const noexcept { return tick_timer_id_; }
    RegistrationId executor_timer_id() const noexcept { return executor_timer_id_; }

private:
    // Control messages
    void handle_poll_notifications(const std::vector<Notification>& notifications);
    void join(const NodeId& node);
    void leave(const NodeId& node);
    void route_envelope(Envelope envelope);
    void get_status(const CorrelationId& correlation_id);
    void send_metrics(const Envelope& request);

    // Readiness
    void accept_connections();
    void tick();
    void tick_executor();
    void socket_io(RegistrationId id, Event event);
    Status on_readable(RegistrationId id);
    Status on_writable(RegistrationId id);

    // Peer messages
    void handle_peer_message(RegistrationId id, protocol::PeerMessage msg);
    void handle_members(RegistrationId id, const protocol::MembersMessage& msg);
    void merge_and_gossip(const MemberState& state, RegistrationId source);

    // Connections
    Status connect(const NodeId& node);
    std::optional<RegistrationId> add_connection(TcpSocket sock, std::optional<NodeId> peer,
                                                 Event interest);
    Status send_members(RegistrationId id);
    Status write(RegistrationId id);
    void broadcast(const protocol::PeerMessage& msg, RegistrationId except = 0);
    void reset_timer(RegistrationId id);
    void close(RegistrationId id);
    void close_all();
    void reconcile();

    // Errors
    void fail(RegistrationId id, const Status& status);
    void note_error(const Status& status);
    bool send_to_executor(ExecutorMsg msg);

    std::string describe(RegistrationId id) const;
    void update_gauges();

    NodeId local_;
    Pid pid_;
    ClusterConfig config_;
    Sender<ExecutorMsg> executor_;
    Registrar& registrar_;

    TcpListener listener_;
    RegistrationId listener_id_ = 0;
    RegistrationId tick_timer_id_ = 0;
    RegistrationId executor_timer_id_ = 0;

    Members members_;
    TimingWheel<RegistrationId> timer_wheel_;
    std::unordered_map<RegistrationId, Connection> connections_;
    std::unordered_map<NodeId, RegistrationId> established_;

    ClusterMetrics metrics_;

    // Filled while handling one control message
    std::vector<std::string> errors_;
    Status fatal_;
};

}  // namespace troupe
