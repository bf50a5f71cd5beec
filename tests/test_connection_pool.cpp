#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <mutex>
#include <vector>

#include "conduit/connection/connection_pool.hpp"
#include "support/fake_transport.hpp"

using namespace conduit;
using namespace conduit::testing;
using namespace std::chrono_literals;

namespace {

    ConnectionPoolConfiguration default_cfg() {
        ConnectionPoolConfiguration cfg;
        cfg.max_idle_connections = 2;
        cfg.keep_alive = std::chrono::milliseconds(100);
        cfg.close_on_shutdown = true;
        return cfg;
    }

    class ConnectionPoolTest : public ::testing::Test {
       protected:
        /// @brief A connected, idle connection put into the pool.
        std::shared_ptr<PhysicalConnection> put_idle(
            ConnectionPool& pool, const char* ip,
            PhysicalConnection::clock_type::time_point idle_at) {
            auto address = make_address("example.com");
            auto c = std::make_shared<PhysicalConnection>(
                make_route(address, ip), connector_.make_connected());
            std::lock_guard<std::mutex> lk(pool.mutex());
            c->set_idle_at_locked(idle_at);
            auto evicted = pool.put_locked(c);
            for (auto& e : evicted) e->close();
            return c;
        }

        FakeConnector connector_;
    };

    TEST_F(ConnectionPoolTest, PutAndCount) {
        ConnectionPool pool(default_cfg());
        const auto now = PhysicalConnection::clock_type::now();
        put_idle(pool, "10.0.0.1", now);
        put_idle(pool, "10.0.0.2", now);

        EXPECT_EQ(pool.connection_count(), 2u);
        EXPECT_EQ(pool.idle_connection_count(), 2u);
        EXPECT_EQ(pool.metrics().connection_created.load(), 2u);
        EXPECT_EQ(pool.metrics().total_idle.load(), 2u);
    }

    TEST_F(ConnectionPoolTest, IdleLimitEvictsLongestIdle) {
        ConnectionPool pool(default_cfg());
        const auto now = PhysicalConnection::clock_type::now();
        auto oldest = put_idle(pool, "10.0.0.1", now - 30ms);
        auto middle = put_idle(pool, "10.0.0.2", now - 20ms);
        auto newest = put_idle(pool, "10.0.0.3", now - 10ms);

        EXPECT_EQ(pool.connection_count(), 2u);
        EXPECT_TRUE(connector_.carriers[0]->closed);
        EXPECT_FALSE(connector_.carriers[1]->closed);
        EXPECT_FALSE(connector_.carriers[2]->closed);
        EXPECT_EQ(pool.metrics().connection_pruned.load(), 1u);
    }

    TEST_F(ConnectionPoolTest, PruneRemovesExpired) {
        ConnectionPool pool(default_cfg());
        const auto now = PhysicalConnection::clock_type::now();
        put_idle(pool, "10.0.0.1", now);

        EXPECT_EQ(pool.prune(now + 50ms), 0u);
        EXPECT_EQ(pool.connection_count(), 1u);

        EXPECT_EQ(pool.prune(now + 100ms), 1u);
        EXPECT_EQ(pool.connection_count(), 0u);
        EXPECT_TRUE(connector_.carriers[0]->closed);
    }

    TEST_F(ConnectionPoolTest, PruneSparesConnectionsInUse) {
        ConnectionPool pool(default_cfg());
        const auto now = PhysicalConnection::clock_type::now();
        auto c = put_idle(pool, "10.0.0.1", now);
        {
            std::lock_guard<std::mutex> lk(pool.mutex());
            c->bind_locked(42);
        }

        EXPECT_EQ(pool.prune(now + 1h), 0u);
        EXPECT_EQ(pool.connection_count(), 1u);
        EXPECT_EQ(pool.idle_connection_count(), 0u);
    }

    TEST_F(ConnectionPoolTest, IdleConnectionMarkedNoNewStreamsLeaves) {
        ConnectionPool pool(default_cfg());
        auto c = put_idle(pool, "10.0.0.1",
                          PhysicalConnection::clock_type::now());

        std::lock_guard<std::mutex> lk(pool.mutex());
        EXPECT_FALSE(pool.connection_became_idle_locked(*c));
        c->mark_no_new_streams_locked();
        EXPECT_TRUE(pool.connection_became_idle_locked(*c));
        EXPECT_EQ(pool.metrics().connection_retired.load(), 1u);
        EXPECT_EQ(pool.metrics().total_connections.load(), 0u);
    }

    TEST_F(ConnectionPoolTest, ZeroIdleLimitDropsEveryIdleConnection) {
        auto cfg = default_cfg();
        cfg.max_idle_connections = 0;
        ConnectionPool pool(cfg);
        put_idle(pool, "10.0.0.1", PhysicalConnection::clock_type::now());

        EXPECT_EQ(pool.connection_count(), 0u);
        EXPECT_TRUE(connector_.carriers[0]->closed);
    }

    TEST_F(ConnectionPoolTest, EvictAllRetiresBusyConnections) {
        ConnectionPool pool(default_cfg());
        const auto now = PhysicalConnection::clock_type::now();
        put_idle(pool, "10.0.0.1", now);
        auto busy = put_idle(pool, "10.0.0.2", now);
        {
            std::lock_guard<std::mutex> lk(pool.mutex());
            busy->bind_locked(7);
        }

        pool.evict_all();
        EXPECT_EQ(pool.connection_count(), 1u);
        EXPECT_TRUE(connector_.carriers[0]->closed);
        EXPECT_FALSE(connector_.carriers[1]->closed);

        std::lock_guard<std::mutex> lk(pool.mutex());
        EXPECT_TRUE(busy->no_new_streams_locked());
        EXPECT_FALSE(busy->is_eligible_locked(make_address("example.com"),
                                              std::nullopt));
    }

    TEST_F(ConnectionPoolTest, ShutdownClosesIdleConnections) {
        {
            ConnectionPool pool(default_cfg());
            put_idle(pool, "10.0.0.1", PhysicalConnection::clock_type::now());
        }
        EXPECT_TRUE(connector_.carriers[0]->closed);
    }

    TEST_F(ConnectionPoolTest, ShutdownCanLeaveConnectionsOpen) {
        auto cfg = default_cfg();
        cfg.close_on_shutdown = false;
        std::shared_ptr<PhysicalConnection> kept;
        {
            ConnectionPool pool(cfg);
            kept = put_idle(pool, "10.0.0.1",
                            PhysicalConnection::clock_type::now());
        }
        EXPECT_FALSE(connector_.carriers[0]->closed);
    }

    TEST_F(ConnectionPoolTest, AllocationIdsAreDistinct) {
        ConnectionPool pool;
        const auto a = pool.next_allocation_id();
        const auto b = pool.next_allocation_id();
        EXPECT_NE(a, b);
        EXPECT_EQ(pool.options().max_idle_connections, 5u);
        EXPECT_EQ(pool.options().keep_alive, std::chrono::minutes(5));
    }

    // --- eligibility ---

    TEST_F(ConnectionPoolTest, EligibilityRequiresMatchingNonHostFields) {
        auto address = make_address("example.com");
        PhysicalConnection c(make_route(address, "10.0.0.1"),
                             connector_.make_connected());

        EXPECT_TRUE(c.is_eligible_locked(address, std::nullopt));

        auto other_port = address;
        other_port.port = "8443";
        EXPECT_FALSE(c.is_eligible_locked(other_port, std::nullopt));

        auto cleartext = make_address("example.com", false);
        EXPECT_FALSE(c.is_eligible_locked(cleartext, std::nullopt));

        auto proxied = address;
        proxied.proxy = Proxy{Proxy::Type::Http, "proxy", "3128"};
        EXPECT_FALSE(c.is_eligible_locked(proxied, std::nullopt));

        auto restricted = address;
        restricted.security_profiles = {
            ConnectionSecurityProfile::restricted_tls()};
        EXPECT_FALSE(c.is_eligible_locked(restricted, std::nullopt));
    }

    TEST_F(ConnectionPoolTest, Http1ConnectionCarriesOneAllocation) {
        auto address = make_address("example.com");
        PhysicalConnection c(make_route(address, "10.0.0.1"),
                             connector_.make_connected());
        EXPECT_EQ(c.allocation_limit(), 1u);

        c.bind_locked(1);
        EXPECT_FALSE(c.is_eligible_locked(address, std::nullopt));
        EXPECT_TRUE(c.unbind_locked(1));
        EXPECT_FALSE(c.unbind_locked(1));
        EXPECT_TRUE(c.is_eligible_locked(address, std::nullopt));
    }

    TEST_F(ConnectionPoolTest, Http1NeverCoalesces) {
        Handshake h;
        h.peer_names = {"*.example.com"};
        connector_.handshake = h;

        auto a = make_address("a.example.com");
        auto b = make_address("b.example.com");
        PhysicalConnection c(make_route(a, "10.0.0.1"),
                             connector_.make_connected());
        EXPECT_FALSE(c.is_eligible_locked(b, make_route(b, "10.0.0.1")));
    }

    TEST_F(ConnectionPoolTest, CoalescingNeedsDirectRoute) {
        Handshake h;
        h.peer_names = {"*.example.com"};
        connector_.handshake = h;
        connector_.protocol = Protocol::Http2;
        connector_.max_streams = 10;

        auto a = make_address("a.example.com");
        auto b = make_address("b.example.com");
        PhysicalConnection c(make_route(a, "10.0.0.1"),
                             connector_.make_connected());

        auto direct = make_route(b, "10.0.0.1");
        EXPECT_TRUE(c.is_eligible_locked(b, direct));
        EXPECT_FALSE(c.is_eligible_locked(b, std::nullopt));

        auto proxied = direct;
        proxied.proxy = Proxy{Proxy::Type::Http, "proxy", "3128"};
        EXPECT_FALSE(c.is_eligible_locked(b, proxied));
    }

    TEST(HandshakeTest, WildcardCoversOneLabel) {
        Handshake h;
        h.peer_names = {"*.example.com", "exact.org"};
        EXPECT_TRUE(h.covers_host("a.example.com"));
        EXPECT_TRUE(h.covers_host("A.Example.COM"));
        EXPECT_FALSE(h.covers_host("a.b.example.com"));
        EXPECT_FALSE(h.covers_host("example.com"));
        EXPECT_TRUE(h.covers_host("exact.org"));
        EXPECT_FALSE(h.covers_host("sub.exact.org"));
    }

    TEST(ProtocolTest, AlpnNames) {
        EXPECT_EQ(protocol_from_alpn("h2"), Protocol::Http2);
        EXPECT_EQ(protocol_from_alpn("http/1.1"), Protocol::Http11);
        EXPECT_EQ(protocol_from_alpn("h2_prior_knowledge"),
                  Protocol::H2PriorKnowledge);
        EXPECT_FALSE(protocol_from_alpn("h2c").has_value());
        EXPECT_FALSE(protocol_from_alpn("spdy/3.1").has_value());
        EXPECT_TRUE(is_multiplexed(Protocol::Http2));
        EXPECT_FALSE(is_multiplexed(Protocol::Http11));
        EXPECT_STREQ(to_string(Protocol::Http10), "http/1.0");
    }

}  // namespace
