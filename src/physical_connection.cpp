#include "conduit/connection/physical_connection.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <stdexcept>

namespace conduit {

    namespace {

        std::uint64_t next_connection_id() {
            static std::atomic<std::uint64_t> next{1};
            return next.fetch_add(1, std::memory_order_relaxed);
        }

    }  // namespace

    PhysicalConnection::PhysicalConnection(Route route)
        : m_id(next_connection_id()), m_route(std::move(route)) {}

    PhysicalConnection::PhysicalConnection(Route route,
                                           ConnectedCarrier connected)
        : m_id(next_connection_id()),
          m_route(std::move(route)),
          m_carrier(std::move(connected.carrier)),
          m_protocol(connected.protocol),
          m_handshake(std::move(connected.handshake)) {
        if (!m_carrier) {
            throw std::invalid_argument("connected carrier must not be null");
        }
        install_cancel_hook();
    }

    PhysicalConnection::~PhysicalConnection() noexcept {
        m_cancel.clear_hook();
        close();
    }

    Status PhysicalConnection::connect(Connector& connector,
                                       const StreamSettings& settings) {
        if (m_carrier) {
            return Status::err(Error::Code::IllegalState, "already connected");
        }

        auto connected = connector.connect(m_route, settings, m_cancel);
        if (!connected)
            return std::move(connected).forward_error<std::monostate>();

        ConnectedCarrier c = std::move(connected).value();
        if (!c.carrier) {
            return Status::err(Error::Code::ConnectionFailed,
                               "connector returned no carrier");
        }
        m_carrier = std::move(c.carrier);
        m_protocol = c.protocol;
        m_handshake = std::move(c.handshake);
        install_cancel_hook();

        SPDLOG_DEBUG("connection {} connected to {} ({})", m_id,
                     m_route.to_string(), conduit::to_string(m_protocol));
        return ok_status();
    }

    void PhysicalConnection::install_cancel_hook() {
        m_cancel.set_hook([carrier = m_carrier] { carrier->cancel(); });
    }

    void PhysicalConnection::cancel() { m_cancel.cancel(); }

    void PhysicalConnection::close() noexcept {
        if (m_carrier) m_carrier->close();
    }

    bool PhysicalConnection::is_healthy(bool extensive) const {
        if (!m_carrier || m_cancel.canceled()) return false;
        if (!m_carrier->is_open()) return false;
        if (extensive) return m_carrier->probe();
        return true;
    }

    Result<std::shared_ptr<Codec>> PhysicalConnection::new_codec(
        const StreamSettings& settings) {
        if (!m_carrier) {
            return Result<std::shared_ptr<Codec>>::err(
                Error::Code::IllegalState, "connection is not connected");
        }
        return m_carrier->new_codec(settings);
    }

    std::size_t PhysicalConnection::allocation_limit() const noexcept {
        if (!m_carrier || !is_multiplexed()) return 1;
        return m_carrier->max_concurrent_streams();
    }

    bool PhysicalConnection::is_eligible_locked(
        const Address& address, const std::optional<Route>& route) const {
        if (m_allocations.size() >= allocation_limit() || m_no_new_streams)
            return false;

        if (!m_route.address.equals_non_host(address)) return false;

        if (address.host == m_route.address.host) return true;

        // Another host: only a multiplexed connection reached directly at the
        // same IP, whose certificate also covers the new host, can serve it.
        if (!is_multiplexed() || !route) return false;
        if (!route->proxy.is_direct() || !m_route.proxy.is_direct())
            return false;
        if (route->socket_address != m_route.socket_address) return false;
        if (!m_handshake || !m_handshake->covers_host(address.host))
            return false;
        return true;
    }

    std::string PhysicalConnection::to_string() const {
        std::string out = "Connection{" + std::to_string(m_id) + " " +
                          m_route.to_string() + " protocol=" +
                          conduit::to_string(m_protocol);
        if (m_handshake) out += " cipherSuite=" + m_handshake->cipher_suite;
        out += "}";
        return out;
    }

}  // namespace conduit
