#include "conduit/connection/connection_pool.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cassert>
#include <unordered_set>

#include "conduit/stream_allocation.hpp"

namespace conduit {

    ConnectionPool::ConnectionPool(ConnectionPoolConfiguration cfg)
        : cfg_(std::move(cfg)) {}

    ConnectionPool::~ConnectionPool() {
        if (cfg_.close_on_shutdown) evict_all();
    }

    ConnectionPool::connection_ptr ConnectionPool::acquire_locked(
        const Address& address, StreamAllocation& allocation,
        const std::optional<Route>& route) {
        for (auto const& c : connections_) {
            if (!c->is_eligible_locked(address, route)) continue;

            allocation.acquire_locked(c, true);
            metrics_.connection_reused.fetch_add(1, std::memory_order_relaxed);
            if (c->route().address.host != address.host) {
                metrics_.connection_coalesced.fetch_add(
                    1, std::memory_order_relaxed);
            }
            update_gauges_locked_();
            SPDLOG_DEBUG("reusing {} for {}", c->to_string(),
                         address.to_string());
            return c;
        }
        return nullptr;
    }

    std::vector<ConnectionPool::connection_ptr> ConnectionPool::put_locked(
        connection_ptr connection) {
        connections_.push_back(std::move(connection));
        metrics_.connection_created.fetch_add(1, std::memory_order_relaxed);

        auto evicted = cleanup_locked_(clock_type::now());
        update_gauges_locked_();
        check_invariants_locked_();
        return evicted;
    }

    bool ConnectionPool::connection_became_idle_locked(
        PhysicalConnection& connection) {
        if (connection.no_new_streams_locked() ||
            cfg_.max_idle_connections == 0) {
            auto it = std::find_if(
                connections_.begin(), connections_.end(),
                [&](connection_ptr const& c) { return c.get() == &connection; });
            if (it != connections_.end()) {
                connections_.erase(it);
                metrics_.connection_retired.fetch_add(
                    1, std::memory_order_relaxed);
            }
            update_gauges_locked_();
            return true;
        }
        update_gauges_locked_();
        return false;
    }

    ConnectionPool::connection_ptr ConnectionPool::deduplicate_locked(
        const Address& address, StreamAllocation& allocation) {
        auto const& own = allocation.connection_locked();
        for (auto const& c : connections_) {
            if (c == own || !c->is_multiplexed()) continue;
            if (!c->is_eligible_locked(address, std::nullopt)) continue;

            metrics_.connection_deduplicated.fetch_add(
                1, std::memory_order_relaxed);
            SPDLOG_DEBUG("deduplicating onto {}", c->to_string());
            auto to_close = allocation.release_and_acquire_locked(c);
            update_gauges_locked_();
            return to_close;
        }
        return nullptr;
    }

    std::size_t ConnectionPool::prune(clock_type::time_point now) {
        std::vector<connection_ptr> evicted;
        {
            std::lock_guard<std::mutex> lk(mu_);
            evicted = cleanup_locked_(now);
            update_gauges_locked_();
            check_invariants_locked_();
        }
        const std::size_t n = evicted.size();
        close_all(evicted);
        return n;
    }

    void ConnectionPool::evict_all() {
        std::vector<connection_ptr> evicted;
        {
            std::lock_guard<std::mutex> lk(mu_);
            for (auto it = connections_.begin(); it != connections_.end();) {
                auto& c = *it;
                c->mark_no_new_streams_locked();
                if (c->allocations_locked().empty()) {
                    evicted.push_back(std::move(c));
                    it = connections_.erase(it);
                } else {
                    ++it;
                }
            }
            metrics_.connection_pruned.fetch_add(evicted.size(),
                                                 std::memory_order_relaxed);
            update_gauges_locked_();
        }
        close_all(evicted);
    }

    std::size_t ConnectionPool::connection_count() const {
        std::lock_guard<std::mutex> lk(mu_);
        return connections_.size();
    }

    std::size_t ConnectionPool::idle_connection_count() const {
        std::lock_guard<std::mutex> lk(mu_);
        return idle_count_locked_();
    }

    std::vector<ConnectionPool::connection_ptr>
    ConnectionPool::cleanup_locked_(clock_type::time_point now) {
        std::vector<connection_ptr> evicted;

        auto is_idle = [](connection_ptr const& c) {
            return c->allocations_locked().empty();
        };
        auto expired = [&](connection_ptr const& c) {
            const auto idle_at = c->idle_at_locked();
            return idle_at != clock_type::time_point::max() &&
                   now - idle_at >= cfg_.keep_alive;
        };

        // Expired first.
        for (auto it = connections_.begin(); it != connections_.end();) {
            auto const& c = *it;
            if (is_idle(c) && expired(c)) {
                evicted.push_back(*it);
                it = connections_.erase(it);
            } else {
                ++it;
            }
        }

        // Then the longest idle until under the limit.
        while (idle_count_locked_() > cfg_.max_idle_connections) {
            auto oldest = connections_.end();
            for (auto it = connections_.begin(); it != connections_.end();
                 ++it) {
                if (!is_idle(*it)) continue;
                if (oldest == connections_.end() ||
                    (*it)->idle_at_locked() < (*oldest)->idle_at_locked()) {
                    oldest = it;
                }
            }
            evicted.push_back(*oldest);
            connections_.erase(oldest);
        }

        if (!evicted.empty()) {
            metrics_.connection_pruned.fetch_add(evicted.size(),
                                                 std::memory_order_relaxed);
            SPDLOG_DEBUG("pruned {} idle connections", evicted.size());
        }
        return evicted;
    }

    std::size_t ConnectionPool::idle_count_locked_() const {
        return static_cast<std::size_t>(
            std::count_if(connections_.begin(), connections_.end(),
                          [](connection_ptr const& c) {
                              return c->allocations_locked().empty();
                          }));
    }

    void ConnectionPool::update_gauges_locked_() {
        metrics_.total_connections.store(connections_.size(),
                                         std::memory_order_relaxed);
        metrics_.total_idle.store(idle_count_locked_(),
                                  std::memory_order_relaxed);
    }

    void ConnectionPool::check_invariants_locked_() const {
#ifndef NDEBUG
        std::unordered_set<PhysicalConnection const*> seen;
        for (auto const& c : connections_) {
            assert(c && "pooled connection is null");
            assert(c->is_connected() && "pooled connection is not connected");
            assert(seen.insert(c.get()).second && "connection pooled twice");
            assert((!c->allocations_locked().empty() ||
                    c->idle_at_locked() != clock_type::time_point::max()) &&
                   "idle connection without idle_at");
        }
#else
        return;
#endif
    }

    void ConnectionPool::close_all(
        std::vector<connection_ptr>& connections) noexcept {
        for (auto& c : connections) {
            if (c) c->close();
        }
        connections.clear();
    }

}  // namespace conduit
