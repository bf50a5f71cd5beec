#pragma once
#include <chrono>
#include <cstddef>
#include <string>

#include <spdlog/common.h>

namespace conduit {
    /**
     * @brief Per-stream settings forwarded to the connector and codecs.
     */
    struct StreamSettings {
        /** @brief Timeout for the TCP connect and the TLS handshake. */
        std::chrono::milliseconds connect_timeout{10000};

        /** @brief Timeout for reading a response. */
        std::chrono::milliseconds read_timeout{10000};

        /** @brief Timeout for writing a request. */
        std::chrono::milliseconds write_timeout{10000};

        /** @brief Keep-alive ping interval for multiplexed connections. Zero
         * disables pings. */
        std::chrono::milliseconds ping_interval{0};

        /** @brief Whether a failed connection may be retried on another route
         * or security profile. */
        bool retry_on_connection_failure{true};

        /** @brief Whether reused connections get the extensive health check
         * before carrying a new stream. */
        bool do_extensive_health_checks{true};
    };

    /**
     * @brief Configuration for the connection pool.
     */
    struct ConnectionPoolConfiguration {
        /** @brief Idle connections kept for reuse. Zero disables pooling. */
        std::size_t max_idle_connections{5};

        /** @brief How long an idle connection is kept before pruning. */
        std::chrono::milliseconds keep_alive{std::chrono::minutes(5)};

        /** @brief Whether to close idle connections when the pool is
         * destroyed. */
        bool close_on_shutdown{true};
    };

    /**
     * @brief Configuration for the synchronous Client.
     */
    struct ClientConfiguration {
        /** @brief User-Agent sent when the request has none. */
        std::string user_agent{"conduit/1.0"};

        StreamSettings stream{};

        ConnectionPoolConfiguration pool{};

        /** @brief Whether to verify peer certificates. */
        bool verify_tls{true};

        /** @brief Attempts per call, counting the first. */
        std::size_t max_attempts{5};

        /**
         * @brief Level of the client's own logger. The client clones the
         * spdlog default logger and leaves the global level alone.
         */
        spdlog::level::level_enum log_level{spdlog::level::info};
    };
}  // namespace conduit
