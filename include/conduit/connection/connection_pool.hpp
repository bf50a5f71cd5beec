#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "../config.hpp"
#include "../route_selector.hpp"
#include "connection_pool_types.hpp"
#include "physical_connection.hpp"

namespace conduit {

    class StreamAllocation;

    /**
     * Pool of physical connections shared by all stream allocations.
     *
     * LOCKING:
     * - mutex() is the one lock guarding pool membership, every pooled
     *   connection's allocation set and every allocation's binding state.
     * - Methods suffixed _locked expect the caller to hold it. The others
     *   take it themselves.
     * - Nothing here blocks on the network. Connections to close are handed
     *   back so the caller closes them after unlocking.
     *
     * INVARIANTS:
     * 1. Every pooled connection is connected
     * 2. A connection appears at most once
     * 3. A pooled connection with no allocations has a finite idle_at
     *
     * EVICTION:
     * - Idle connections older than keep_alive are pruned
     * - At most max_idle_connections idle connections are kept, longest idle
     *   evicted first
     * - A connection that becomes idle while marked no-new-streams leaves the
     *   pool immediately
     */
    class ConnectionPool {
       public:
        using clock_type = std::chrono::steady_clock;
        using connection_ptr = std::shared_ptr<PhysicalConnection>;

        explicit ConnectionPool(ConnectionPoolConfiguration cfg = {});

        ConnectionPool(const ConnectionPool&) = delete;
        ConnectionPool& operator=(const ConnectionPool&) = delete;

        /// @brief Closes idle connections when close_on_shutdown is set.
        ~ConnectionPool();

        std::mutex& mutex() noexcept { return mu_; }

        /**
         * @brief Find a pooled connection for @p address and bind
         * @p allocation to it.
         * @param route When set, also accept a connection to another host that
         * this route can coalesce onto.
         * @return The bound connection, or nullptr when none is eligible.
         */
        connection_ptr acquire_locked(const Address& address,
                                      StreamAllocation& allocation,
                                      const std::optional<Route>& route);

        /// @brief Pool a freshly connected connection.
        /// @return Idle connections evicted to make room, to be closed.
        std::vector<connection_ptr> put_locked(connection_ptr connection);

        /**
         * @brief Called when @p connection lost its last allocation.
         * @return True when the pool dropped it and the caller must close it.
         */
        bool connection_became_idle_locked(PhysicalConnection& connection);

        /**
         * @brief If another multiplexed connection to @p address exists, move
         * @p allocation onto it.
         * @return The allocation's previous connection, to be closed, or
         * nullptr when there was nothing to deduplicate.
         */
        connection_ptr deduplicate_locked(const Address& address,
                                          StreamAllocation& allocation);

        /// @brief Close idle connections past keep_alive or over the idle
        /// limit.
        /// @return Number of connections closed.
        std::size_t prune(clock_type::time_point now = clock_type::now());

        /// @brief Close every idle connection and retire the rest.
        void evict_all();

        std::size_t connection_count() const;
        std::size_t idle_connection_count() const;

        RouteDatabase& route_database() noexcept { return route_database_; }

        /// @brief Stable id for a new allocation.
        std::uint64_t next_allocation_id() noexcept {
            return next_allocation_id_.fetch_add(1, std::memory_order_relaxed);
        }

        ConnectionPoolMetrics const& metrics() const { return metrics_; }

        ConnectionPoolConfiguration const& options() const noexcept {
            return cfg_;
        }

       private:
        /// @brief Remove expired and surplus idle connections under lock
        std::vector<connection_ptr> cleanup_locked_(clock_type::time_point now);

        std::size_t idle_count_locked_() const;

        void update_gauges_locked_();

        /// @brief Check internal invariants, only in debug builds
        void check_invariants_locked_() const;

        static void close_all(std::vector<connection_ptr>& connections) noexcept;

        ConnectionPoolConfiguration cfg_;
        mutable std::mutex mu_;
        std::deque<connection_ptr> connections_;
        RouteDatabase route_database_;
        std::atomic<std::uint64_t> next_allocation_id_{1};
        ConnectionPoolMetrics metrics_;
    };

}  // namespace conduit
