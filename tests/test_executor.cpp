#include <catch2/catch_test_macros.hpp>
#include "troupe/executor.hpp"
#include <thread>

using namespace troupe;

namespace {

struct ExecutorFixture {
    NodeId local{"node1", "127.0.0.1:7001"};
    NodeId remote{"node2", "127.0.0.1:7002"};

    Sender<ExecutorMsg> tx;
    Receiver<ClusterMsg> cluster_rx;
    std::unique_ptr<Executor> executor;

    ExecutorFixture() {
        auto [exec_tx, exec_rx] = make_channel<ExecutorMsg>();
        auto [cluster_tx, crx] = make_channel<ClusterMsg>();
        tx = exec_tx;
        cluster_rx = std::move(crx);
        executor = std::make_unique<Executor>(local, std::move(exec_rx), cluster_tx);
    }

    Envelope envelope_to(const Pid& to) const {
        Envelope env;
        env.to = to;
        env.from = Pid{"client", std::nullopt, local};
        env.body = UserMsg{ByteBuffer{42}};
        return env;
    }
};

}  // namespace

TEST_CASE("Executor routes envelopes", "[executor]") {
    ExecutorFixture f;
    Pid echo{"echo", std::nullopt, f.local};

    SECTION("Local delivery to a registered service") {
        auto [mailbox_tx, mailbox_rx] = make_channel<Envelope>();
        REQUIRE(f.executor->handle(RegisterService{echo, mailbox_tx}).ok());
        REQUIRE(f.executor->services() == 1);

        auto env = f.envelope_to(echo);
        REQUIRE(f.executor->handle(env).ok());

        auto delivered = mailbox_rx.try_recv();
        REQUIRE(delivered.has_value());
        REQUIRE(*delivered == env);
        REQUIRE_FALSE(f.cluster_rx.try_recv().has_value());
    }

    SECTION("Envelope for another node goes to the cluster server") {
        auto env = f.envelope_to(Pid{"echo", std::nullopt, f.remote});
        REQUIRE(f.executor->handle(env).ok());

        auto forwarded = f.cluster_rx.try_recv();
        REQUIRE(forwarded.has_value());
        REQUIRE(std::get<Envelope>(*forwarded) == env);
    }

    SECTION("Envelope for the local cluster server goes to the cluster server") {
        auto env = f.envelope_to(cluster_server_pid(f.local));
        env.body = GetMetrics{};
        REQUIRE(f.executor->handle(env).ok());

        auto forwarded = f.cluster_rx.try_recv();
        REQUIRE(forwarded.has_value());
        REQUIRE(std::get<Envelope>(*forwarded).to == cluster_server_pid(f.local));
    }

    SECTION("Unknown local pid is dropped") {
        REQUIRE(f.executor->handle(f.envelope_to(echo)).ok());
        REQUIRE_FALSE(f.cluster_rx.try_recv().has_value());
    }

    SECTION("Dead mailbox is unregistered") {
        auto [mailbox_tx, mailbox_rx] = make_channel<Envelope>();
        f.executor->handle(RegisterService{echo, mailbox_tx});
        mailbox_rx.close();

        REQUIRE(f.executor->handle(f.envelope_to(echo)).ok());
        REQUIRE(f.executor->services() == 0);
    }

    SECTION("Closed cluster channel is fatal") {
        f.cluster_rx.close();
        auto env = f.envelope_to(Pid{"echo", std::nullopt, f.remote});
        REQUIRE(f.executor->handle(env).code() == ErrorCode::SendError);
    }
}

TEST_CASE("Executor control messages", "[executor]") {
    ExecutorFixture f;

    SECTION("Ticks are counted") {
        REQUIRE(f.executor->handle(Tick{}).ok());
        REQUIRE(f.executor->handle(Tick{}).ok());
        REQUIRE(f.executor->ticks() == 2);
    }

    SECTION("Shutdown stops the executor") {
        REQUIRE(f.executor->handle(Shutdown{}).code() == ErrorCode::Shutdown);
    }

    SECTION("run returns on Shutdown") {
        std::thread worker([&] { f.executor->run(); });
        f.tx.send(Tick{});
        f.tx.send(Shutdown{});
        worker.join();
        REQUIRE(f.executor->ticks() == 1);
    }
}
