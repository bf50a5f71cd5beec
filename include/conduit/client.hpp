#pragma once
#include <atomic>
#include <cstdint>
#include <memory>

#include <spdlog/logger.h>

#include "config.hpp"
#include "connection/carrier.hpp"
#include "connection/connection_pool.hpp"
#include "event_listener.hpp"
#include "result.hpp"
#include "route_selector.hpp"

namespace conduit {

    /**
     * @brief A synchronous HTTP client over a shared connection pool.
     *
     * Each execute() call drives one StreamAllocation: it opens a stream,
     * runs the exchange and retries on another stream when the failure
     * allows it. execute() may be called from several threads at once; the
     * pool is shared between them.
     */
    class Client {
       public:
        /**
         * @brief Constructs a Client that connects with Boost.Asio and
         * resolves through the system resolver.
         * @param config The configuration for the client.
         * @param listener Receives connection events. Must outlive the
         * client.
         */
        explicit Client(ClientConfiguration config,
                        EventListener& listener = EventListener::none());

        /**
         * @brief Constructs a Client over a custom connector and resolver.
         * @throws std::invalid_argument when either is null.
         */
        Client(ClientConfiguration config, std::unique_ptr<Connector> connector,
               std::unique_ptr<Dns> dns,
               EventListener& listener = EventListener::none());

        ~Client() noexcept;

        Client(const Client&) = delete;
        Client& operator=(const Client&) = delete;

        Client(Client&&) = delete;
        Client& operator=(Client&&) = delete;

        /**
         * @brief Returns the client's configuration.
         * @return A constant reference to the configuration.
         */
        [[nodiscard]] const ClientConfiguration& config() const noexcept {
            return m_config;
        }

        /**
         * @brief Sends @p request to @p address and reads the response.
         *
         * Host and User-Agent are filled in when the request has none.
         * Connection failures are retried on further routes while
         * retry_on_connection_failure holds, up to max_attempts.
         * @return The response, or the last error.
         */
        [[nodiscard]] Result<HttpResponse> execute(const Address& address,
                                                   HttpRequest request);

        ConnectionPool& pool() noexcept { return m_pool; }

        /// @brief The client's own logger, at ClientConfiguration::log_level.
        const std::shared_ptr<spdlog::logger>& logger() const noexcept {
            return m_logger;
        }

       private:
        ClientConfiguration m_config;
        std::unique_ptr<Connector> m_connector;
        std::unique_ptr<Dns> m_dns;
        EventListener& m_listener;
        // After the connector so that pooled carriers go first.
        ConnectionPool m_pool;
        std::shared_ptr<spdlog::logger> m_logger;
        std::atomic<std::uint64_t> m_next_call_id{1};
    };

}  // namespace conduit
