#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "config.hpp"
#include "connection/carrier.hpp"
#include "connection/connection_pool.hpp"
#include "connection/physical_connection.hpp"
#include "event_listener.hpp"
#include "result.hpp"
#include "route.hpp"
#include "stream_failure.hpp"

namespace conduit {

    /**
     * Binds one call to a sequence of physical connections and streams.
     *
     * A call drives its allocation from one thread: new_stream() to get a
     * codec, then stream_finished() or stream_failed(), possibly several
     * times, then release(). cancel() may come from any thread.
     *
     * Connections are shared. A multiplexed connection carries several
     * allocations at once, an HTTP/1 connection carries one at a time.
     * An allocation holds at most one connection and at most one open
     * codec.
     *
     * LOCKING:
     * - Binding state is guarded by the pool's mutex. Members suffixed
     *   _locked expect it held and are called back by the pool.
     * - Route selection, the TCP/TLS handshake, health probes and listener
     *   callbacks run without it.
     *
     * ERRORS:
     * - IllegalState: new_stream() after release() or while a codec is open
     * - Canceled: cancel() was called, whatever stage acquisition reached
     * - ConnectionFailed / TlsHandshakeFailed: connect or route exhaustion
     */
    class StreamAllocation {
       public:
        using connection_ptr = std::shared_ptr<PhysicalConnection>;
        using codec_ptr = std::shared_ptr<Codec>;

        /**
         * @param routes Route source for @p address. Owned.
         * @param listener Must outlive the allocation.
         * @param call_id Identifies the call in listener events.
         */
        StreamAllocation(ConnectionPool& pool, Connector& connector,
                         Address address, std::unique_ptr<RouteSource> routes,
                         EventListener& listener = EventListener::none(),
                         std::uint64_t call_id = 0);

        StreamAllocation(const StreamAllocation&) = delete;
        StreamAllocation& operator=(const StreamAllocation&) = delete;

        /// @brief Unbinds any connection still held. A codec still open at
        /// this point leaves its connection closed to new streams.
        ~StreamAllocation();

        /**
         * @brief Find a healthy connection and open a stream on it.
         *
         * Reuses the held connection, then the pool, then connects a new
         * route. Pooled connections that served a stream before are health
         * checked, extensively when settings ask for it; unhealthy ones are
         * retired and the search starts over.
         */
        Result<codec_ptr> new_stream(const StreamSettings& settings);

        /**
         * @brief The stream opened by new_stream() completed.
         * @param no_new_streams The exchange left the connection unusable
         * (e.g. "Connection: close").
         * @return IllegalState when @p codec is not the open codec.
         */
        Status stream_finished(bool no_new_streams, const codec_ptr& codec,
                               std::uint64_t bytes_read,
                               const std::optional<Error>& error);

        /**
         * @brief The stream, or the connect that preceded it, failed.
         *
         * A first REFUSED_STREAM retries on the same connection, a second
         * retires it. A CANCEL reset keeps it. Other resets and I/O errors
         * retire it, and an I/O failure on a connection that never carried a
         * stream is reported to the route source. Passing nullopt retires a
         * non-multiplexed connection without blaming its route.
         */
        void stream_failed(const std::optional<StreamFailure>& failure);

        /// @brief End of call. Unbinds the connection once no codec is open.
        void release();

        /// @brief Keep the held connection from carrying new streams.
        void no_new_streams();

        /// @brief Cancel the open codec, or when there is none the held
        /// connection (a pending handshake). Any thread.
        void cancel();

        bool has_more_routes() const;

        connection_ptr connection() const;
        codec_ptr codec() const;
        std::optional<Route> route() const;

        const Address& address() const noexcept { return m_address; }
        std::uint64_t id() const noexcept { return m_id; }
        std::uint64_t call_id() const noexcept { return m_call_id; }

        std::string to_string() const;

        // --- pool lock held ---

        const connection_ptr& connection_locked() const noexcept {
            return m_connection;
        }

        /// @brief Bind @p connection. Throws std::logic_error when a
        /// connection is already held.
        void acquire_locked(connection_ptr connection, bool reported_acquired);

        /**
         * @brief Move this allocation from its connection onto
         * @p replacement. Only valid with no codec open and when this
         * allocation is the connection's only user.
         * @return The old connection when it must be closed.
         */
        connection_ptr release_and_acquire_locked(connection_ptr replacement);

       private:
        Result<connection_ptr> find_healthy_connection(
            const StreamSettings& settings);

        Result<connection_ptr> find_connection(const StreamSettings& settings);

        connection_ptr release_if_no_new_streams_locked();

        /// @brief Drop codec and/or connection bindings.
        /// @return A connection the pool dropped, to close after unlocking.
        connection_ptr deallocate_locked(bool no_new_streams, bool released,
                                         bool stream_finished);

        void unbind_locked(PhysicalConnection& connection);

        ConnectionPool& m_pool;
        Connector& m_connector;
        const Address m_address;
        std::unique_ptr<RouteSource> m_routes;
        EventListener& m_listener;
        const std::uint64_t m_call_id;
        const std::uint64_t m_id;

        // Guarded by the pool lock.
        std::optional<Route> m_route;
        std::optional<RouteSelection> m_selection;
        connection_ptr m_connection;
        codec_ptr m_codec;
        int m_refused_stream_count{0};
        bool m_released{false};
        bool m_canceled{false};
        bool m_reported_acquired{false};
    };

}  // namespace conduit
