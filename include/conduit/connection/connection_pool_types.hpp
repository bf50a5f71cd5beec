#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>

namespace conduit {

    /// @brief Metrics for monitoring connection pool behavior
    struct ConnectionPoolMetrics {
        // Gauges (current state)
        std::atomic<std::size_t> total_connections{0};  ///< Pooled, any state
        std::atomic<std::size_t> total_idle{0};  ///< Pooled with no allocation

        // Counters (cumulative)
        std::atomic<std::uint64_t> connection_created{0};  ///< Handshakes done
        std::atomic<std::uint64_t> connection_reused{0};   ///< Pool hits
        std::atomic<std::uint64_t> connection_coalesced{
            0};  ///< Pool hits for another host
        std::atomic<std::uint64_t> connection_pruned{0};  ///< Idle evictions
        std::atomic<std::uint64_t> connection_retired{
            0};  ///< Removed when idle and no longer eligible
        std::atomic<std::uint64_t> connection_deduplicated{
            0};  ///< Dropped in favour of a concurrent multiplexed one
    };

}  // namespace conduit
