#include "conduit/event_listener.hpp"

#include <spdlog/spdlog.h>

#include "conduit/connection/physical_connection.hpp"

namespace conduit {

    EventListener& EventListener::none() {
        static EventListener listener;
        return listener;
    }

    LoggingEventListener::LoggingEventListener(
        std::shared_ptr<spdlog::logger> logger)
        : m_logger(std::move(logger)) {}

    spdlog::logger& LoggingEventListener::log() const {
        return m_logger ? *m_logger : *spdlog::default_logger_raw();
    }

    void LoggingEventListener::connect_start(std::uint64_t call_id,
                                             const Route& route) {
        log().debug("call {}: connect start {}", call_id, route.to_string());
    }

    void LoggingEventListener::connect_end(
        std::uint64_t call_id, const PhysicalConnection& connection) {
        log().debug("call {}: connect end {}", call_id, connection.to_string());
    }

    void LoggingEventListener::connect_failed(std::uint64_t call_id,
                                              const Route& route,
                                              const Error& error) {
        log().warn("call {}: connect to {} failed: {} ({})", call_id,
                   route.to_string(), error.message, to_string(error.code));
    }

    void LoggingEventListener::connection_acquired(
        std::uint64_t call_id, const PhysicalConnection& connection) {
        log().debug("call {}: acquired {}", call_id, connection.to_string());
    }

    void LoggingEventListener::connection_released(
        std::uint64_t call_id, const PhysicalConnection& connection) {
        log().debug("call {}: released {}", call_id, connection.to_string());
    }

    void LoggingEventListener::response_body_end(std::uint64_t call_id,
                                                 std::uint64_t bytes_read) {
        log().debug("call {}: response body end, {} bytes", call_id,
                    bytes_read);
    }

    void LoggingEventListener::call_end(std::uint64_t call_id) {
        log().debug("call {}: end", call_id);
    }

    void LoggingEventListener::call_failed(std::uint64_t call_id,
                                           const Error& error) {
        log().warn("call {}: failed: {} ({})", call_id, error.message,
                   to_string(error.code));
    }

}  // namespace conduit
