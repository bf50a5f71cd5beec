#pragma once

#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>
#include <cstddef>
#include <memory>
#include <optional>

#include "../cancel_signal.hpp"
#include "../config.hpp"
#include "../protocol.hpp"
#include "../result.hpp"
#include "../route.hpp"
#include "../stream_failure.hpp"

namespace conduit {

    using HttpRequest =
        boost::beast::http::request<boost::beast::http::string_body>;
    using HttpResponse =
        boost::beast::http::response<boost::beast::http::string_body>;

    /**
     * @brief One logical stream on a connection: carries a single
     * request/response exchange.
     */
    class Codec {
       public:
        virtual ~Codec() = default;

        /// @brief Write @p request and read the whole response.
        virtual Result<HttpResponse> exchange(const HttpRequest& request) = 0;

        /// @brief Abort this stream only. Sibling streams on a multiplexed
        /// connection are unaffected. Callable from any thread.
        virtual void cancel() = 0;

        /// @brief Classify an error returned by exchange(). Codecs that see
        /// stream resets override this.
        virtual StreamFailure classify(const Error& error) const {
            return StreamFailure::io(error);
        }
    };

    /**
     * @brief The connected transport of a physical connection: a socket plus
     * whatever protocol state it carries.
     */
    class Carrier {
       public:
        virtual ~Carrier() = default;

        /// @brief Cheap check: socket open and not canceled.
        virtual bool is_open() const = 0;

        /// @brief Extensive check: protocol-level liveness (a ping, or a
        /// non-blocking peek for unexpected bytes on an idle HTTP/1 socket).
        virtual bool probe() = 0;

        /// @brief Streams this carrier can run at once.
        virtual std::size_t max_concurrent_streams() const { return 1; }

        virtual Result<std::shared_ptr<Codec>> new_codec(
            const StreamSettings& settings) = 0;

        /// @brief Interrupt whatever is in flight. Callable from any thread.
        virtual void cancel() = 0;

        virtual void close() noexcept = 0;
    };

    /**
     * @brief What a successful connect produces.
     * @note The carrier is shared: codecs it hands out may keep it alive past
     * the connection that owns it, so that a late cancel() stays valid.
     */
    struct ConnectedCarrier {
        std::shared_ptr<Carrier> carrier;
        Protocol protocol{Protocol::Http11};
        std::optional<Handshake> handshake;
    };

    /**
     * @brief Performs the TCP and TLS handshakes for a route.
     *
     * connect() blocks. It may install a hook on @p cancel to interrupt
     * itself, and must clear it before returning.
     */
    class Connector {
       public:
        virtual ~Connector() = default;

        virtual Result<ConnectedCarrier> connect(const Route& route,
                                                 const StreamSettings& settings,
                                                 CancelSignal& cancel) = 0;
    };

}  // namespace conduit
