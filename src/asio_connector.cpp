#include "conduit/connection/asio_connector.hpp"

#include <openssl/ssl.h>
#include <openssl/x509v3.h>
#include <spdlog/spdlog.h>

#include <boost/asio/post.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/http/empty_body.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/parser.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/write.hpp>

#include "conduit/connection/http1_codec.hpp"
#include "conduit/tls/openssl_tls_socket.hpp"

namespace conduit {

    namespace {

        constexpr unsigned char kAlpnHttp11[] = {8,   'h', 't', 't', 'p',
                                                 '/', '1', '.', '1'};

        /// @brief Routes @p signal's hook to @p carrier for the scope's
        /// lifetime.
        class CancelHookScope {
           public:
            CancelHookScope(CancelSignal& signal, AsioCarrier& carrier)
                : m_signal(signal) {
                m_signal.set_hook([&carrier] { carrier.cancel(); });
            }
            ~CancelHookScope() { m_signal.clear_hook(); }

            CancelHookScope(const CancelHookScope&) = delete;
            CancelHookScope& operator=(const CancelHookScope&) = delete;

           private:
            CancelSignal& m_signal;
        };

        std::vector<std::string> peer_dns_names(SSL* ssl) {
            std::vector<std::string> names;
            X509* cert = ::SSL_get1_peer_certificate(ssl);
            if (!cert) return names;

            auto* sans = static_cast<GENERAL_NAMES*>(::X509_get_ext_d2i(
                cert, NID_subject_alt_name, nullptr, nullptr));
            if (sans) {
                const int n = sk_GENERAL_NAME_num(sans);
                for (int i = 0; i < n; ++i) {
                    const GENERAL_NAME* name = sk_GENERAL_NAME_value(sans, i);
                    if (name->type != GEN_DNS) continue;
                    const auto* data = ::ASN1_STRING_get0_data(name->d.dNSName);
                    const int len = ::ASN1_STRING_length(name->d.dNSName);
                    names.emplace_back(reinterpret_cast<const char*>(data),
                                       static_cast<std::size_t>(len));
                }
                GENERAL_NAMES_free(sans);
            }
            ::X509_free(cert);
            return names;
        }

        Handshake read_handshake(SSL* ssl) {
            Handshake h;
            h.tls_version = ::SSL_get_version(ssl);
            if (const SSL_CIPHER* c = ::SSL_get_current_cipher(ssl)) {
                if (const char* name = ::SSL_CIPHER_standard_name(c))
                    h.cipher_suite = name;
            }
            h.peer_names = peer_dns_names(ssl);
            return h;
        }

        std::string join_profiles(
            const std::vector<ConnectionSecurityProfile>& profiles) {
            std::string out = "[";
            for (std::size_t i = 0; i < profiles.size(); ++i) {
                if (i) out += ", ";
                out += profiles[i].to_string();
            }
            return out + "]";
        }

        std::string join_versions(const std::vector<TlsVersion>& versions) {
            std::string out = "[";
            for (std::size_t i = 0; i < versions.size(); ++i) {
                if (i) out += ", ";
                out += to_string(versions[i]);
            }
            return out + "]";
        }

    }  // namespace

    Error error_from_ec(const boost::system::error_code& ec, Error::Code code,
                        const std::string& what) {
        if (ec == boost::beast::error::timeout) {
            return Error{Error::Code::Timeout, what + ": timed out"};
        }
        if (ec == boost::asio::error::operation_aborted) {
            return Error{Error::Code::Canceled, "Canceled"};
        }
        return Error{code, what + ": " + ec.message()};
    }

    // ---------------------------------------------------------------------
    // AsioCarrier
    // ---------------------------------------------------------------------

    AsioCarrier::AsioCarrier()
        : m_io(std::make_unique<boost::asio::io_context>(1)) {}

    AsioCarrier::~AsioCarrier() noexcept {
        close_http();
        close_https();
    }

    boost::system::error_code AsioCarrier::connect(
        const tcp::endpoint& endpoint, std::chrono::milliseconds timeout) {
        close();
        auto& s = m_stream.emplace<HttpStream>(m_io->get_executor());
        s.expires_after(timeout);
        return run([&](auto handler) {
            s.async_connect(endpoint, std::move(handler));
        });
    }

    void AsioCarrier::begin_tls(boost::asio::ssl::context& ssl_ctx) {
        auto* plain = std::get_if<HttpStream>(&m_stream);
        if (!plain) return;
        HttpStream tcp_stream = std::move(*plain);
        m_stream.emplace<HttpsStream>(std::move(tcp_stream), ssl_ctx);
    }

    boost::system::error_code AsioCarrier::handshake(
        std::chrono::milliseconds timeout) {
        auto* s = tls_stream();
        if (!s) return boost::asio::error::not_connected;
        boost::beast::get_lowest_layer(*s).expires_after(timeout);
        return run([&](auto handler) {
            s->async_handshake(boost::asio::ssl::stream_base::client,
                               std::move(handler));
        });
    }

    SSL* AsioCarrier::native_ssl() noexcept {
        auto* s = tls_stream();
        return s ? s->native_handle() : nullptr;
    }

    void AsioCarrier::expires_after(std::chrono::milliseconds timeout) {
        if (auto* s = std::get_if<HttpStream>(&m_stream)) {
            s->expires_after(timeout);
        } else if (auto* s = tls_stream()) {
            boost::beast::get_lowest_layer(*s).expires_after(timeout);
        }
    }

    AsioCarrier::tcp::socket* AsioCarrier::lowest_socket() noexcept {
        if (auto* s = std::get_if<HttpStream>(&m_stream)) return &s->socket();
        if (auto* s = std::get_if<HttpsStream>(&m_stream))
            return &boost::beast::get_lowest_layer(*s).socket();
        return nullptr;
    }

    const AsioCarrier::tcp::socket* AsioCarrier::lowest_socket()
        const noexcept {
        return const_cast<AsioCarrier*>(this)->lowest_socket();
    }

    bool AsioCarrier::is_open() const {
        if (canceled()) return false;
        const auto* s = lowest_socket();
        return s && s->is_open();
    }

    bool AsioCarrier::probe() {
        auto* s = lowest_socket();
        if (!s || !s->is_open()) return false;

        // Decrypted bytes nobody asked for.
        if (auto* tls = tls_stream(); tls && ::SSL_pending(tls->native_handle()))
            return false;

        boost::system::error_code ec;
        s->non_blocking(true, ec);
        if (ec) return false;

        char byte = 0;
        const std::size_t n = s->receive(boost::asio::buffer(&byte, 1),
                                         tcp::socket::message_peek, ec);
        boost::system::error_code restore_ec;
        s->non_blocking(false, restore_ec);
        if (restore_ec) return false;

        // Idle and alive means nothing to read yet. EOF, an error or stray
        // bytes all mean the connection cannot carry another exchange.
        if (ec == boost::asio::error::would_block) return true;
        SPDLOG_DEBUG("probe failed: {} byte(s), {}", n, ec.message());
        return false;
    }

    Result<std::shared_ptr<Codec>> AsioCarrier::new_codec(
        const StreamSettings& settings) {
        if (!is_open()) {
            return Result<std::shared_ptr<Codec>>::err(
                Error::Code::IllegalState, "carrier is closed");
        }
        return Result<std::shared_ptr<Codec>>::ok(
            std::make_shared<Http1Codec>(shared_from_this(), settings,
                                         m_proxy_origin));
    }

    void AsioCarrier::cancel() {
        if (m_canceled.exchange(true, std::memory_order_acq_rel)) return;
        boost::asio::post(*m_io, [this] { close(); });
    }

    void AsioCarrier::close() noexcept {
        close_http();
        close_https();
    }

    void AsioCarrier::close_http() noexcept {
        boost::system::error_code ec;

        if (std::holds_alternative<HttpStream>(m_stream)) {
            auto& s = std::get<HttpStream>(m_stream);
            auto shutdown_result =
                s.socket().shutdown(tcp::socket::shutdown_both, ec);
            auto close_result = s.socket().close(ec);
            (void)shutdown_result;
            (void)close_result;
        }
    }

    void AsioCarrier::close_https() noexcept {
        boost::system::error_code ec;

        if (std::holds_alternative<HttpsStream>(m_stream)) {
            auto& s = std::get<HttpsStream>(m_stream);
            // No TLS shutdown, just close the underlying TCP socket.
            auto& socket = boost::beast::get_lowest_layer(s).socket();
            auto shutdown_result =
                socket.shutdown(tcp::socket::shutdown_both, ec);
            auto close_result = socket.close(ec);
            (void)shutdown_result;
            (void)close_result;
        }
    }

    // ---------------------------------------------------------------------
    // AsioConnector
    // ---------------------------------------------------------------------

    AsioConnector::AsioConnector(bool verify_tls)
        : m_ssl_ctx(boost::asio::ssl::context::tls_client),
          m_verify_tls(verify_tls) {
        init_tls_on_ssl_context(m_ssl_ctx, verify_tls);
    }

    Result<ConnectedCarrier> AsioConnector::connect(
        const Route& route, const StreamSettings& settings,
        CancelSignal& cancel) {
        if (route.proxy.type == Proxy::Type::Socks) {
            return Result<ConnectedCarrier>::err(
                Error::Code::InvalidArgument, "SOCKS proxies are not supported");
        }
        if (route.address.https) return connect_tls(route, settings, cancel);

        if (cancel.canceled()) {
            return Result<ConnectedCarrier>::err(Error::Code::Canceled,
                                                 "Canceled");
        }

        auto carrier = std::make_shared<AsioCarrier>();
        CancelHookScope hook(cancel, *carrier);

        auto ec = carrier->connect(route.socket_address,
                                   settings.connect_timeout);
        if (ec) {
            return Result<ConnectedCarrier>::err(error_from_ec(
                ec, Error::Code::ConnectionFailed,
                "failed to connect to " + route.to_string()));
        }
        if (route.proxy.type == Proxy::Type::Http) {
            carrier->set_proxy_origin("http://" + route.address.host + ":" +
                                      route.address.port);
        }

        return Result<ConnectedCarrier>::ok(
            ConnectedCarrier{std::move(carrier), Protocol::Http11, std::nullopt});
    }

    Result<ConnectedCarrier> AsioConnector::connect_tls(
        const Route& route, const StreamSettings& settings,
        CancelSignal& cancel) {
        const auto profiles = route.address.effective_security_profiles();
        const std::string& host = route.address.host;

        bool is_fallback = false;
        std::size_t next = 0;

        while (true) {
            if (cancel.canceled()) {
                return Result<ConnectedCarrier>::err(Error::Code::Canceled,
                                                     "Canceled");
            }

            auto carrier = std::make_shared<AsioCarrier>();
            CancelHookScope hook(cancel, *carrier);

            auto ec = carrier->connect(route.socket_address,
                                       settings.connect_timeout);
            if (ec) {
                return Result<ConnectedCarrier>::err(error_from_ec(
                    ec, Error::Code::ConnectionFailed,
                    "failed to connect to " + route.to_string()));
            }
            if (route.proxy.type == Proxy::Type::Http) {
                if (auto st = tunnel(*carrier, route, settings); !st)
                    return std::move(st).forward_error<ConnectedCarrier>();
            }

            carrier->begin_tls(m_ssl_ctx);
            SSL* ssl = carrier->native_ssl();
            OpenSslTlsSocket socket(ssl);

            std::size_t index = next;
            while (index < profiles.size() &&
                   !profiles[index].is_compatible(socket))
                ++index;
            if (index == profiles.size()) {
                return Result<ConnectedCarrier>::err(
                    Error::Code::TlsHandshakeFailed,
                    "Unable to find acceptable protocols. isFallback=" +
                        std::string(is_fallback ? "true" : "false") +
                        ", profiles=" + join_profiles(profiles) +
                        ", supported protocols=" +
                        join_versions(socket.enabled_protocols()));
            }
            const ConnectionSecurityProfile& profile = profiles[index];

            if (auto st = profile.negotiate(socket, is_fallback); !st)
                return std::move(st).forward_error<ConnectedCarrier>();

            if (profile.supports_tls_extensions()) {
                if (!set_sni(*carrier->tls_stream(), host, ec)) {
                    return Result<ConnectedCarrier>::err(error_from_ec(
                        ec, Error::Code::TlsHandshakeFailed, "SNI"));
                }
                if (::SSL_set_alpn_protos(ssl, kAlpnHttp11,
                                          sizeof(kAlpnHttp11)) != 0) {
                    return Result<ConnectedCarrier>::err(
                        Error::Code::TlsHandshakeFailed, "failed to set ALPN");
                }
            }
            if (m_verify_tls) {
                carrier->tls_stream()->set_verify_callback(
                    boost::asio::ssl::host_name_verification(host));
            }

            ec = carrier->handshake(settings.connect_timeout);
            if (!ec) {
                Protocol protocol = Protocol::Http11;
                const unsigned char* alpn = nullptr;
                unsigned int alpn_len = 0;
                ::SSL_get0_alpn_selected(ssl, &alpn, &alpn_len);
                if (alpn_len > 0) {
                    auto selected = protocol_from_alpn(std::string_view(
                        reinterpret_cast<const char*>(alpn), alpn_len));
                    if (!selected) {
                        return Result<ConnectedCarrier>::err(
                            Error::Code::TlsHandshakeFailed,
                            "unexpected ALPN protocol");
                    }
                    protocol = *selected;
                }

                SPDLOG_DEBUG("TLS to {} established with {}", host,
                             ::SSL_get_version(ssl));
                return Result<ConnectedCarrier>::ok(ConnectedCarrier{
                    std::move(carrier), protocol, read_handshake(ssl)});
            }

            Error failure = error_from_ec(ec, Error::Code::TlsHandshakeFailed,
                                          "TLS handshake with " + host);
            const bool certificate_rejected =
                ::SSL_get_verify_result(ssl) != X509_V_OK;

            // Another profile must fit a fresh socket for a retry to help.
            bool fallback_possible = false;
            {
                std::unique_ptr<SSL, decltype(&::SSL_free)> fresh(
                    ::SSL_new(m_ssl_ctx.native_handle()), &::SSL_free);
                if (fresh) {
                    OpenSslTlsSocket probe(fresh.get());
                    for (std::size_t i = index + 1; i < profiles.size(); ++i) {
                        if (profiles[i].is_compatible(probe)) {
                            fallback_possible = true;
                            break;
                        }
                    }
                }
            }

            if (failure.code != Error::Code::TlsHandshakeFailed ||
                certificate_rejected || !fallback_possible ||
                !settings.retry_on_connection_failure) {
                return Result<ConnectedCarrier>::err(std::move(failure));
            }

            SPDLOG_DEBUG("TLS handshake with {} failed ({}), falling back",
                         host, failure.message);
            is_fallback = true;
            next = index + 1;
        }
    }

    Status AsioConnector::tunnel(AsioCarrier& carrier, const Route& route,
                                 const StreamSettings& settings) {
        namespace http = boost::beast::http;

        const std::string authority =
            route.address.host + ":" + route.address.port;
        http::request<http::empty_body> req{http::verb::connect, authority,
                                            11};
        req.set(http::field::host, authority);
        req.set(http::field::proxy_connection, "Keep-Alive");

        auto* plain = std::get_if<AsioCarrier::HttpStream>(&carrier.stream());
        if (!plain) {
            return Status::err(Error::Code::IllegalState,
                               "tunnel needs a plain TCP stream");
        }

        carrier.expires_after(settings.write_timeout);
        auto ec = carrier.run([&](auto handler) {
            http::async_write(*plain, req, std::move(handler));
        });
        if (ec) {
            return Status::err(
                error_from_ec(ec, Error::Code::SendFailed, "CONNECT request"));
        }

        // A CONNECT response has no body; reading one would eat TLS bytes.
        boost::beast::flat_buffer buffer;
        http::response_parser<http::empty_body> parser;
        parser.skip(true);
        carrier.expires_after(settings.read_timeout);
        ec = carrier.run([&](auto handler) {
            http::async_read_header(*plain, buffer, parser, std::move(handler));
        });
        if (ec) {
            return Status::err(error_from_ec(ec, Error::Code::ReceiveFailed,
                                             "CONNECT response"));
        }

        const unsigned status = parser.get().result_int();
        if (status != 200) {
            return Status::err(Error::Code::ConnectionFailed,
                               "Unexpected response code for CONNECT: " +
                                   std::to_string(status));
        }
        return ok_status();
    }

}  // namespace conduit
