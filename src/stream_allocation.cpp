#include "conduit/stream_allocation.hpp"

#include <spdlog/spdlog.h>

#include <sstream>
#include <stdexcept>
#include <vector>

namespace conduit {

    namespace {

        using connection_ptr = StreamAllocation::connection_ptr;

        Address normalized(Address address) {
            address.normalize_default_port();
            address.normalize_host();
            return address;
        }

        void close_quietly(const connection_ptr& connection) noexcept {
            if (connection) connection->close();
        }

        std::string describe(const Codec* codec) {
            if (!codec) return "null";
            std::ostringstream os;
            os << "codec@" << static_cast<const void*>(codec);
            return os.str();
        }

        template <typename T>
        Result<T> canceled_error() {
            return Result<T>::err(Error::Code::Canceled, "Canceled");
        }

    }  // namespace

    StreamAllocation::StreamAllocation(ConnectionPool& pool,
                                       Connector& connector, Address address,
                                       std::unique_ptr<RouteSource> routes,
                                       EventListener& listener,
                                       std::uint64_t call_id)
        : m_pool(pool),
          m_connector(connector),
          m_address(normalized(std::move(address))),
          m_routes(std::move(routes)),
          m_listener(listener),
          m_call_id(call_id),
          m_id(pool.next_allocation_id()) {
        if (!m_routes) {
            throw std::invalid_argument("route source must not be null");
        }
    }

    StreamAllocation::~StreamAllocation() {
        connection_ptr to_close;
        {
            std::lock_guard<std::mutex> lk(m_pool.mutex());
            // An exchange abandoned mid-stream leaves HTTP/1 framing unknown.
            const bool abandoned = m_codec != nullptr;
            to_close = deallocate_locked(abandoned, true, true);
        }
        close_quietly(to_close);
    }

    Result<StreamAllocation::codec_ptr> StreamAllocation::new_stream(
        const StreamSettings& settings) {
        auto connection = find_healthy_connection(settings);
        if (!connection)
            return std::move(connection).forward_error<codec_ptr>();

        auto codec = connection.value()->new_codec(settings);
        if (!codec) return codec;

        {
            std::lock_guard<std::mutex> lk(m_pool.mutex());
            if (!m_canceled) {
                m_codec = codec.value();
                return codec;
            }
        }
        codec.value()->cancel();
        return canceled_error<codec_ptr>();
    }

    Result<connection_ptr> StreamAllocation::find_healthy_connection(
        const StreamSettings& settings) {
        while (true) {
            auto candidate = find_connection(settings);
            if (!candidate) return candidate;

            // A brand new connection needs no check.
            {
                std::lock_guard<std::mutex> lk(m_pool.mutex());
                if (candidate.value()->success_count_locked() == 0)
                    return candidate;
            }

            if (!candidate.value()->is_healthy(
                    settings.do_extensive_health_checks)) {
                SPDLOG_DEBUG("{} failed its health check",
                             candidate.value()->to_string());
                no_new_streams();
                continue;
            }

            return candidate;
        }
    }

    Result<connection_ptr> StreamAllocation::find_connection(
        const StreamSettings& settings) {
        bool found_pooled = false;
        connection_ptr result;
        std::optional<Route> selected_route;
        connection_ptr released_connection;
        connection_ptr to_close;

        {
            std::lock_guard<std::mutex> lk(m_pool.mutex());
            if (m_released) {
                return Result<connection_ptr>::err(Error::Code::IllegalState,
                                                   "released");
            }
            if (m_codec) {
                return Result<connection_ptr>::err(Error::Code::IllegalState,
                                                   "codec != null");
            }
            if (m_canceled) return canceled_error<connection_ptr>();

            // The held connection may have been closed to new streams since
            // the last exchange.
            released_connection = m_connection;
            to_close = release_if_no_new_streams_locked();
            if (m_connection) {
                result = m_connection;
                released_connection = nullptr;
            }
            // Never report a release for a connection never reported
            // acquired.
            if (!m_reported_acquired) released_connection = nullptr;

            if (!result) {
                result = m_pool.acquire_locked(m_address, *this, std::nullopt);
                if (result) {
                    found_pooled = true;
                } else {
                    selected_route = m_route;
                }
            }
        }
        close_quietly(to_close);

        if (released_connection) {
            m_listener.connection_released(m_call_id, *released_connection);
        }
        if (found_pooled) m_listener.connection_acquired(m_call_id, *result);
        if (result) return Result<connection_ptr>::ok(std::move(result));

        // Route selection may block on DNS. Only this thread touches
        // m_selection outside the lock.
        bool new_route_selection = false;
        std::optional<RouteSelection> next_selection;
        if (!selected_route && (!m_selection || !m_selection->has_next())) {
            auto next = m_routes->next();
            if (!next) return std::move(next).forward_error<connection_ptr>();
            next_selection.emplace(std::move(next).value());
            new_route_selection = true;
        }

        {
            std::lock_guard<std::mutex> lk(m_pool.mutex());
            if (new_route_selection) m_selection = std::move(next_selection);
            if (m_canceled) return canceled_error<connection_ptr>();

            if (new_route_selection) {
                // With IPs in hand, a pooled connection to another host may
                // now be coalesced onto.
                for (const Route& route : m_selection->all()) {
                    result = m_pool.acquire_locked(m_address, *this, route);
                    if (result) {
                        found_pooled = true;
                        m_route = route;
                        break;
                    }
                }
            }

            if (!found_pooled) {
                if (!selected_route) {
                    if (!m_selection || !m_selection->has_next()) {
                        return Result<connection_ptr>::err(
                            Error::Code::ConnectionFailed,
                            "no route to " + m_address.to_string());
                    }
                    selected_route = m_selection->next();
                }

                // Bind before connecting so cancel() can reach the handshake.
                m_route = selected_route;
                m_refused_stream_count = 0;
                result = std::make_shared<PhysicalConnection>(*selected_route);
                acquire_locked(result, false);
            }
        }

        if (found_pooled) {
            m_listener.connection_acquired(m_call_id, *result);
            return Result<connection_ptr>::ok(std::move(result));
        }

        // TCP and TLS handshakes. Blocks.
        m_listener.connect_start(m_call_id, result->route());
        if (auto st = result->connect(m_connector, settings); !st) {
            m_listener.connect_failed(m_call_id, result->route(), st.error());
            return std::move(st).forward_error<connection_ptr>();
        }
        m_pool.route_database().connected(result->route());
        m_listener.connect_end(m_call_id, *result);

        connection_ptr duplicate;
        std::vector<connection_ptr> evicted;
        {
            std::lock_guard<std::mutex> lk(m_pool.mutex());
            if (m_canceled) {
                // cancel() already interrupted the carrier; keep it out of
                // the pool.
                result->mark_no_new_streams_locked();
                return canceled_error<connection_ptr>();
            }

            m_reported_acquired = true;
            evicted = m_pool.put_locked(result);

            // Another thread may have raced us to a multiplexed connection
            // for the same address. Prefer that one.
            if (result->is_multiplexed()) {
                duplicate = m_pool.deduplicate_locked(m_address, *this);
                result = m_connection;
            }
        }
        close_quietly(duplicate);
        for (auto const& c : evicted) close_quietly(c);

        m_listener.connection_acquired(m_call_id, *result);
        return Result<connection_ptr>::ok(std::move(result));
    }

    Status StreamAllocation::stream_finished(bool no_new_streams,
                                             const codec_ptr& codec,
                                             std::uint64_t bytes_read,
                                             const std::optional<Error>& error) {
        m_listener.response_body_end(m_call_id, bytes_read);

        connection_ptr to_close;
        connection_ptr released_connection;
        bool call_end = false;
        {
            std::lock_guard<std::mutex> lk(m_pool.mutex());
            if (!codec || codec != m_codec) {
                return Status::err(Error::Code::IllegalState,
                                   "expected " + describe(m_codec.get()) +
                                       " but was " + describe(codec.get()));
            }
            if (!no_new_streams && m_connection) {
                m_connection->record_success_locked();
            }
            released_connection = m_connection;
            to_close = deallocate_locked(no_new_streams, false, true);
            if (m_connection) released_connection = nullptr;
            call_end = m_released;
        }
        close_quietly(to_close);

        if (released_connection) {
            m_listener.connection_released(m_call_id, *released_connection);
        }
        if (error) {
            m_listener.call_failed(m_call_id, *error);
        } else if (call_end) {
            m_listener.call_end(m_call_id);
        }
        return ok_status();
    }

    void StreamAllocation::stream_failed(
        const std::optional<StreamFailure>& failure) {
        connection_ptr to_close;
        connection_ptr released_connection;
        bool no_new_streams = false;

        {
            std::lock_guard<std::mutex> lk(m_pool.mutex());
            if (failure && failure->kind == StreamFailure::Kind::Refused) {
                // Retry REFUSED_STREAM once on the same connection.
                ++m_refused_stream_count;
                if (m_refused_stream_count > 1) {
                    no_new_streams = true;
                    m_route.reset();
                }
            } else if (failure &&
                       failure->kind == StreamFailure::Kind::Reset) {
                // CANCEL says nothing about the connection.
                if (failure->reset_code != Http2ErrorCode::Cancel) {
                    no_new_streams = true;
                    m_route.reset();
                }
            } else if (m_connection &&
                       (!m_connection->is_multiplexed() || failure)) {
                no_new_streams = true;

                // A route that never completed a call is avoided next time.
                if (m_connection->success_count_locked() == 0) {
                    if (m_route && failure) {
                        m_routes->connect_failed(*m_route, failure->error);
                    }
                    m_route.reset();
                }
            }

            if (failure) {
                SPDLOG_DEBUG("allocation {}: stream failed: {}{}", m_id,
                             failure->error.message,
                             no_new_streams ? ", retiring connection" : "");
            }

            released_connection = m_connection;
            to_close = deallocate_locked(no_new_streams, false, true);
            if (m_connection || !m_reported_acquired)
                released_connection = nullptr;
        }
        close_quietly(to_close);

        if (released_connection) {
            m_listener.connection_released(m_call_id, *released_connection);
        }
    }

    void StreamAllocation::release() {
        connection_ptr to_close;
        connection_ptr released_connection;
        {
            std::lock_guard<std::mutex> lk(m_pool.mutex());
            released_connection = m_connection;
            to_close = deallocate_locked(false, true, false);
            if (m_connection) released_connection = nullptr;
        }
        close_quietly(to_close);

        if (released_connection) {
            m_listener.connection_released(m_call_id, *released_connection);
            m_listener.call_end(m_call_id);
        }
    }

    void StreamAllocation::no_new_streams() {
        connection_ptr to_close;
        connection_ptr released_connection;
        {
            std::lock_guard<std::mutex> lk(m_pool.mutex());
            released_connection = m_connection;
            to_close = deallocate_locked(true, false, false);
            if (m_connection) released_connection = nullptr;
        }
        close_quietly(to_close);

        if (released_connection) {
            m_listener.connection_released(m_call_id, *released_connection);
        }
    }

    void StreamAllocation::cancel() {
        codec_ptr codec_to_cancel;
        connection_ptr connection_to_cancel;
        {
            std::lock_guard<std::mutex> lk(m_pool.mutex());
            m_canceled = true;
            codec_to_cancel = m_codec;
            connection_to_cancel = m_connection;
        }
        if (codec_to_cancel) {
            codec_to_cancel->cancel();
        } else if (connection_to_cancel) {
            connection_to_cancel->cancel();
        }
    }

    bool StreamAllocation::has_more_routes() const {
        std::lock_guard<std::mutex> lk(m_pool.mutex());
        return m_route.has_value() ||
               (m_selection && m_selection->has_next()) ||
               m_routes->has_next();
    }

    StreamAllocation::connection_ptr StreamAllocation::connection() const {
        std::lock_guard<std::mutex> lk(m_pool.mutex());
        return m_connection;
    }

    StreamAllocation::codec_ptr StreamAllocation::codec() const {
        std::lock_guard<std::mutex> lk(m_pool.mutex());
        return m_codec;
    }

    std::optional<Route> StreamAllocation::route() const {
        std::lock_guard<std::mutex> lk(m_pool.mutex());
        return m_route;
    }

    std::string StreamAllocation::to_string() const {
        auto c = connection();
        return c ? c->to_string() : m_address.to_string();
    }

    void StreamAllocation::acquire_locked(connection_ptr connection,
                                          bool reported_acquired) {
        if (m_connection) {
            throw std::logic_error("allocation already holds a connection");
        }
        connection->bind_locked(m_id);
        m_connection = std::move(connection);
        m_reported_acquired = reported_acquired;
    }

    StreamAllocation::connection_ptr
    StreamAllocation::release_and_acquire_locked(connection_ptr replacement) {
        if (m_codec || !m_connection ||
            m_connection->allocations_locked().size() != 1) {
            throw std::logic_error(
                "release_and_acquire needs a sole, idle binding");
        }

        auto to_close = deallocate_locked(true, false, false);

        replacement->bind_locked(m_id);
        m_connection = std::move(replacement);
        return to_close;
    }

    StreamAllocation::connection_ptr
    StreamAllocation::release_if_no_new_streams_locked() {
        if (m_connection && m_connection->no_new_streams_locked()) {
            return deallocate_locked(false, false, true);
        }
        return nullptr;
    }

    StreamAllocation::connection_ptr StreamAllocation::deallocate_locked(
        bool no_new_streams, bool released, bool stream_finished) {
        if (stream_finished) m_codec.reset();
        if (released) m_released = true;

        connection_ptr to_close;
        if (!m_connection) return to_close;

        if (no_new_streams) m_connection->mark_no_new_streams_locked();
        if (!m_codec &&
            (m_released || m_connection->no_new_streams_locked())) {
            unbind_locked(*m_connection);
            if (m_connection->allocations_locked().empty()) {
                m_connection->set_idle_at_locked(
                    PhysicalConnection::clock_type::now());
                if (m_pool.connection_became_idle_locked(*m_connection)) {
                    to_close = m_connection;
                }
            }
            m_connection.reset();
        }
        return to_close;
    }

    void StreamAllocation::unbind_locked(PhysicalConnection& connection) {
        if (!connection.unbind_locked(m_id)) {
            throw std::logic_error("allocation " + std::to_string(m_id) +
                                   " is not bound to " +
                                   connection.to_string());
        }
    }

}  // namespace conduit
