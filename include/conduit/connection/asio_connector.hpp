#pragma once

#include <atomic>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/ssl/ssl_stream.hpp>
#include <boost/system/error_code.hpp>
#include <chrono>
#include <memory>
#include <string>
#include <utility>
#include <variant>

#include "../address.hpp"
#include "carrier.hpp"

namespace conduit {

    /// @brief Map an Asio/Beast error code into an Error with @p code,
    /// keeping timeouts and cancellation distinguishable.
    Error error_from_ec(const boost::system::error_code& ec, Error::Code code,
                        const std::string& what);

    /**
     * @brief Carrier over a Boost.Beast TCP or TLS stream.
     *
     * Each carrier owns its io_context. Blocking steps start one async
     * operation, bounded by the stream's expiry, and run the context until it
     * completes. cancel() posts a close onto the context, so it interrupts
     * whatever step is running, or the next one.
     *
     * Must be owned by a std::shared_ptr: codecs share ownership of their
     * carrier.
     */
    class AsioCarrier final : public Carrier,
                              public std::enable_shared_from_this<AsioCarrier> {
       public:
        using tcp = boost::asio::ip::tcp;
        using HttpStream = boost::beast::tcp_stream;
        using HttpsStream = boost::beast::ssl_stream<boost::beast::tcp_stream>;
        using Stream = std::variant<std::monostate,  // "not connected yet"
                                    HttpStream, HttpsStream>;

        AsioCarrier();

        AsioCarrier(const AsioCarrier&) = delete;
        AsioCarrier& operator=(const AsioCarrier&) = delete;

        ~AsioCarrier() noexcept override;

        /// @brief Open a plain TCP connection to @p endpoint.
        boost::system::error_code connect(const tcp::endpoint& endpoint,
                                          std::chrono::milliseconds timeout);

        /**
         * @brief Wrap the connected TCP stream in TLS. The TLS handshake is
         * not started; configure native_ssl() first.
         */
        void begin_tls(boost::asio::ssl::context& ssl_ctx);

        /// @brief Run the client TLS handshake.
        boost::system::error_code handshake(std::chrono::milliseconds timeout);

        /// @brief OpenSSL handle of the TLS stream, or nullptr for plain TCP.
        SSL* native_ssl() noexcept;

        HttpsStream* tls_stream() noexcept {
            return std::get_if<HttpsStream>(&m_stream);
        }

        Stream& stream() noexcept { return m_stream; }

        /// @brief Requests go to an HTTP proxy in absolute form, prefixed
        /// with @p origin (e.g. "http://example.com:80").
        void set_proxy_origin(std::string origin) {
            m_proxy_origin = std::move(origin);
        }

        /// @brief Set the expiry of the lowest layer for the next operation.
        void expires_after(std::chrono::milliseconds timeout);

        /**
         * @brief Start an async operation through @p initiate and run the
         * io_context until it completes.
         * @param initiate Called with a completion handler taking an error
         * code and any extra arguments.
         */
        template <typename Initiate>
        boost::system::error_code run(Initiate&& initiate) {
            boost::system::error_code result =
                boost::asio::error::operation_aborted;
            bool done = false;
            std::forward<Initiate>(initiate)(
                [&result, &done](boost::system::error_code ec, auto&&...) {
                    result = ec;
                    done = true;
                });
            m_io->restart();
            m_io->run();
            if (!done) return boost::asio::error::operation_aborted;
            if (m_canceled.load(std::memory_order_acquire) && result)
                return boost::asio::error::operation_aborted;
            return result;
        }

        bool canceled() const noexcept {
            return m_canceled.load(std::memory_order_acquire);
        }

        bool is_open() const override;
        bool probe() override;
        Result<std::shared_ptr<Codec>> new_codec(
            const StreamSettings& settings) override;
        void cancel() override;
        void close() noexcept override;

       private:
        /// @brief Close HTTP connection if open (best-effort).
        void close_http() noexcept;

        /// @brief Close HTTPS connection if open (best-effort).
        /// @note No TLS shutdown is performed
        void close_https() noexcept;

        tcp::socket* lowest_socket() noexcept;
        const tcp::socket* lowest_socket() const noexcept;

        // Declared first so that it outlives the stream.
        std::unique_ptr<boost::asio::io_context> m_io;
        Stream m_stream;
        std::string m_proxy_origin;
        std::atomic<bool> m_canceled{false};
    };

    /**
     * @brief Connector over Boost.Asio and OpenSSL.
     *
     * For https routes it tries the address's security profiles in order.
     * After a TLS negotiation failure it moves, on a fresh TCP connection, to
     * the next profile the socket is compatible with, flagging the attempt as
     * a fallback. Certificate failures, timeouts and TCP failures are not
     * retried here.
     */
    class AsioConnector final : public Connector {
       public:
        /// @param verify_tls Verify the peer chain and host name.
        explicit AsioConnector(bool verify_tls = true);

        Result<ConnectedCarrier> connect(const Route& route,
                                         const StreamSettings& settings,
                                         CancelSignal& cancel) override;

        boost::asio::ssl::context& ssl_context() noexcept { return m_ssl_ctx; }

       private:
        Result<ConnectedCarrier> connect_tls(const Route& route,
                                             const StreamSettings& settings,
                                             CancelSignal& cancel);

        /// @brief Open an HTTP CONNECT tunnel through the route's proxy.
        Status tunnel(AsioCarrier& carrier, const Route& route,
                      const StreamSettings& settings);

        boost::asio::ssl::context m_ssl_ctx;
        bool m_verify_tls;
    };

}  // namespace conduit
