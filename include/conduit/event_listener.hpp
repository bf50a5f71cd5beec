#pragma once

#include <cstdint>
#include <memory>

#include "error.hpp"
#include "route.hpp"

namespace spdlog {
    class logger;
}

namespace conduit {

    class PhysicalConnection;

    /**
     * @brief Observer of a call's connection lifecycle.
     *
     * Every method defaults to a no-op. Calls are identified by the id the
     * caller gave the StreamAllocation. Methods are invoked without the pool
     * lock held, possibly from several threads at once.
     */
    class EventListener {
       public:
        virtual ~EventListener() = default;

        virtual void connect_start(std::uint64_t /*call_id*/,
                                   const Route& /*route*/) {}
        virtual void connect_end(std::uint64_t /*call_id*/,
                                 const PhysicalConnection& /*connection*/) {}
        virtual void connect_failed(std::uint64_t /*call_id*/,
                                    const Route& /*route*/,
                                    const Error& /*error*/) {}

        virtual void connection_acquired(
            std::uint64_t /*call_id*/,
            const PhysicalConnection& /*connection*/) {}
        virtual void connection_released(
            std::uint64_t /*call_id*/,
            const PhysicalConnection& /*connection*/) {}

        virtual void response_body_end(std::uint64_t /*call_id*/,
                                       std::uint64_t /*bytes_read*/) {}

        virtual void call_end(std::uint64_t /*call_id*/) {}
        virtual void call_failed(std::uint64_t /*call_id*/,
                                 const Error& /*error*/) {}

        /// @brief Shared listener that ignores everything.
        static EventListener& none();
    };

    /// @brief Logs every event through spdlog at debug level, failures at
    /// warn.
    class LoggingEventListener final : public EventListener {
       public:
        /// @param logger Target logger; the spdlog default logger when null.
        explicit LoggingEventListener(
            std::shared_ptr<spdlog::logger> logger = nullptr);

        void connect_start(std::uint64_t call_id, const Route& route) override;
        void connect_end(std::uint64_t call_id,
                         const PhysicalConnection& connection) override;
        void connect_failed(std::uint64_t call_id, const Route& route,
                            const Error& error) override;
        void connection_acquired(std::uint64_t call_id,
                                 const PhysicalConnection& connection) override;
        void connection_released(std::uint64_t call_id,
                                 const PhysicalConnection& connection) override;
        void response_body_end(std::uint64_t call_id,
                               std::uint64_t bytes_read) override;
        void call_end(std::uint64_t call_id) override;
        void call_failed(std::uint64_t call_id, const Error& error) override;

       private:
        spdlog::logger& log() const;

        std::shared_ptr<spdlog::logger> m_logger;
    };

}  // namespace conduit
