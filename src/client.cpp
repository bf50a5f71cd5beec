#include "conduit/client.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

#include "conduit/connection/asio_connector.hpp"
#include "conduit/stream_allocation.hpp"

namespace http = boost::beast::http;

namespace conduit {

    namespace {

        /// @brief Errors another stream could not fix.
        bool is_recoverable(const Error& error) noexcept {
            switch (error.code) {
                case Error::Code::Canceled:
                case Error::Code::IllegalState:
                case Error::Code::InvalidArgument:
                    return false;
                default:
                    return true;
            }
        }

        void prepare_request(HttpRequest& request, const Address& address,
                             const std::string& user_agent) {
            if (request.find(http::field::host) == request.end()) {
                const bool default_port =
                    address.port == (address.https ? "443" : "80");
                request.set(http::field::host,
                            default_port ? address.host
                                         : address.host + ":" + address.port);
            }
            if (request.find(http::field::user_agent) == request.end()) {
                request.set(http::field::user_agent, user_agent);
            }
            if (request.target().empty()) request.target("/");
            request.prepare_payload();
        }

    }  // namespace

    Client::Client(ClientConfiguration config, EventListener& listener)
        : Client(config, std::make_unique<AsioConnector>(config.verify_tls),
                 std::make_unique<SystemDns>(), listener) {}

    Client::Client(ClientConfiguration config,
                   std::unique_ptr<Connector> connector,
                   std::unique_ptr<Dns> dns, EventListener& listener)
        : m_config(std::move(config)),
          m_connector(std::move(connector)),
          m_dns(std::move(dns)),
          m_listener(listener),
          m_pool(m_config.pool),
          m_logger(spdlog::default_logger()->clone("conduit.client")) {
        if (!m_connector) throw std::invalid_argument("connector is null");
        if (!m_dns) throw std::invalid_argument("dns is null");
        if (m_config.max_attempts == 0) {
            throw std::invalid_argument("max_attempts must be positive");
        }
        m_logger->set_level(m_config.log_level);
    }

    Client::~Client() noexcept = default;

    Result<HttpResponse> Client::execute(const Address& address,
                                         HttpRequest request) {
        const std::uint64_t call_id =
            m_next_call_id.fetch_add(1, std::memory_order_relaxed);

        Address target = address;
        target.normalize_default_port();
        target.normalize_host();
        prepare_request(request, target, m_config.user_agent);

        StreamAllocation allocation(
            m_pool, *m_connector, target,
            std::make_unique<RouteSelector>(target, *m_dns,
                                            m_pool.route_database()),
            m_listener, call_id);

        auto give_up = [&](Error error) {
            m_listener.call_failed(call_id, error);
            allocation.release();
            return Result<HttpResponse>::err(std::move(error));
        };
        auto may_retry = [&](std::size_t attempt) {
            return m_config.stream.retry_on_connection_failure &&
                   attempt < m_config.max_attempts &&
                   allocation.has_more_routes();
        };

        for (std::size_t attempt = 1;; ++attempt) {
            auto codec = allocation.new_stream(m_config.stream);
            if (!codec) {
                Error error = std::move(codec).error();
                if (!is_recoverable(error)) return give_up(std::move(error));

                allocation.stream_failed(StreamFailure::io(error));
                if (!may_retry(attempt)) return give_up(std::move(error));
                SPDLOG_LOGGER_DEBUG(m_logger,
                                    "call {}: attempt {} failed to connect: {}",
                                    call_id, attempt, error.message);
                continue;
            }

            auto response = codec.value()->exchange(request);
            if (!response) {
                Error error = std::move(response).error();
                allocation.stream_failed(codec.value()->classify(error));
                if (!is_recoverable(error) || !may_retry(attempt)) {
                    return give_up(std::move(error));
                }
                SPDLOG_LOGGER_DEBUG(m_logger, "call {}: attempt {} failed: {}",
                                    call_id, attempt, error.message);
                continue;
            }

            HttpResponse out = std::move(response).value();
            const bool close = !out.keep_alive();
            if (close) allocation.no_new_streams();

            // End of call. The connection goes back once the stream is
            // finished below.
            allocation.release();
            auto finished = allocation.stream_finished(
                close, codec.value(), out.body().size(), std::nullopt);
            if (!finished) {
                return std::move(finished).forward_error<HttpResponse>();
            }
            return Result<HttpResponse>::ok(std::move(out));
        }
    }

}  // namespace conduit
