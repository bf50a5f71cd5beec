#include "conduit/connection/http1_codec.hpp"

#include <boost/beast/http/read.hpp>
#include <boost/beast/http/write.hpp>

namespace conduit {

    Http1Codec::Http1Codec(std::shared_ptr<AsioCarrier> carrier,
                           StreamSettings settings, std::string proxy_origin)
        : m_carrier(std::move(carrier)),
          m_settings(std::move(settings)),
          m_proxy_origin(std::move(proxy_origin)) {}

    Result<HttpResponse> Http1Codec::exchange(const HttpRequest& request) {
        namespace http = boost::beast::http;

        // Through an HTTP proxy the request line carries the full URL.
        const HttpRequest* to_send = &request;
        HttpRequest absolute;
        if (!m_proxy_origin.empty() && !request.target().empty() &&
            request.target().front() == '/') {
            absolute = request;
            absolute.target(m_proxy_origin + std::string(request.target()));
            to_send = &absolute;
        }

        auto with_stream = [this](auto&& op) -> boost::system::error_code {
            auto& stream = m_carrier->stream();
            if (auto* s = std::get_if<AsioCarrier::HttpStream>(&stream))
                return op(*s);
            if (auto* s = std::get_if<AsioCarrier::HttpsStream>(&stream))
                return op(*s);
            return boost::asio::error::not_connected;
        };

        m_carrier->expires_after(m_settings.write_timeout);
        auto ec = with_stream([&](auto& s) {
            return m_carrier->run([&](auto handler) {
                http::async_write(s, *to_send, std::move(handler));
            });
        });
        if (ec) {
            return Result<HttpResponse>::err(
                error_from_ec(ec, Error::Code::SendFailed, "write request"));
        }

        HttpResponse response;
        m_buffer.clear();
        m_carrier->expires_after(m_settings.read_timeout);
        ec = with_stream([&](auto& s) {
            return m_carrier->run([&](auto handler) {
                http::async_read(s, m_buffer, response, std::move(handler));
            });
        });
        if (ec) {
            return Result<HttpResponse>::err(
                error_from_ec(ec, Error::Code::ReceiveFailed, "read response"));
        }

        return Result<HttpResponse>::ok(std::move(response));
    }

    void Http1Codec::cancel() { m_carrier->cancel(); }

}  // namespace conduit
