#pragma once

#include <boost/beast/core/flat_buffer.hpp>
#include <memory>
#include <string>

#include "asio_connector.hpp"
#include "carrier.hpp"

namespace conduit {

    /**
     * @brief HTTP/1.1 exchange over an AsioCarrier, written and read with
     * Boost.Beast.
     * @note Shares ownership of the carrier, so cancel() stays valid after
     * the connection has dropped it. HTTP/1 cannot abort a single stream,
     * so cancel() cancels the whole carrier.
     */
    class Http1Codec final : public Codec {
       public:
        Http1Codec(std::shared_ptr<AsioCarrier> carrier, StreamSettings settings,
                   std::string proxy_origin = {});

        Result<HttpResponse> exchange(const HttpRequest& request) override;

        void cancel() override;

       private:
        std::shared_ptr<AsioCarrier> m_carrier;
        StreamSettings m_settings;
        std::string m_proxy_origin;
        boost::beast::flat_buffer m_buffer{};
    };

}  // namespace conduit
