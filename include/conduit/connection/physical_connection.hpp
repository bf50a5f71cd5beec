#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_set>

#include "carrier.hpp"

namespace conduit {

    /**
     * @brief A physical connection to one route, shared by the stream
     * allocations bound to it.
     *
     * Created unconnected and bound to its first allocation before connect()
     * runs, so that a cancel can reach the pending handshake.
     *
     * LOCKING:
     * - Members suffixed _locked, and the allocation set, require the pool
     *   lock.
     * - connect(), cancel() and the health checks run without it.
     */
    class PhysicalConnection {
       public:
        using clock_type = std::chrono::steady_clock;

        explicit PhysicalConnection(Route route);

        /// @brief Adopt an already connected carrier.
        PhysicalConnection(Route route, ConnectedCarrier connected);

        PhysicalConnection(const PhysicalConnection&) = delete;
        PhysicalConnection& operator=(const PhysicalConnection&) = delete;

        ~PhysicalConnection() noexcept;

        /// @brief TCP and TLS handshakes through @p connector. Blocks.
        Status connect(Connector& connector, const StreamSettings& settings);

        /// @brief Interrupt the handshake or the carrier. Any thread.
        void cancel();

        bool canceled() const { return m_cancel.canceled(); }

        void close() noexcept;

        /// @brief Health check before reuse. Runs without the pool lock.
        bool is_healthy(bool extensive) const;

        Result<std::shared_ptr<Codec>> new_codec(const StreamSettings& settings);

        std::uint64_t id() const noexcept { return m_id; }
        const Route& route() const noexcept { return m_route; }
        bool is_connected() const noexcept { return m_carrier != nullptr; }
        Protocol protocol() const noexcept { return m_protocol; }
        bool is_multiplexed() const noexcept {
            return conduit::is_multiplexed(m_protocol);
        }
        const std::optional<Handshake>& handshake() const noexcept {
            return m_handshake;
        }

        /// @brief Streams allowed at once: 1 for HTTP/1, the carrier's limit
        /// otherwise.
        std::size_t allocation_limit() const noexcept;

        /**
         * @brief Whether an allocation for @p address may use this connection.
         * @param route Route the caller resolved, needed for coalescing onto
         * a connection to another host.
         */
        bool is_eligible_locked(const Address& address,
                                const std::optional<Route>& route) const;

        bool no_new_streams_locked() const noexcept { return m_no_new_streams; }
        void mark_no_new_streams_locked() noexcept { m_no_new_streams = true; }

        std::size_t success_count_locked() const noexcept {
            return m_success_count;
        }
        void record_success_locked() noexcept { ++m_success_count; }

        const std::unordered_set<std::uint64_t>& allocations_locked()
            const noexcept {
            return m_allocations;
        }
        void bind_locked(std::uint64_t allocation_id) {
            m_allocations.insert(allocation_id);
        }
        /// @brief False when @p allocation_id was not bound.
        bool unbind_locked(std::uint64_t allocation_id) {
            return m_allocations.erase(allocation_id) != 0;
        }

        clock_type::time_point idle_at_locked() const noexcept {
            return m_idle_at;
        }
        void set_idle_at_locked(clock_type::time_point t) noexcept {
            m_idle_at = t;
        }

        std::string to_string() const;

       private:
        void install_cancel_hook();

        const std::uint64_t m_id;
        const Route m_route;

        std::shared_ptr<Carrier> m_carrier;
        Protocol m_protocol{Protocol::Http11};
        std::optional<Handshake> m_handshake;
        CancelSignal m_cancel;

        // Guarded by the pool lock.
        bool m_no_new_streams{false};
        std::size_t m_success_count{0};
        std::unordered_set<std::uint64_t> m_allocations;
        clock_type::time_point m_idle_at{clock_type::time_point::max()};
    };

}  // namespace conduit
