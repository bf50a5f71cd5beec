#pragma once

#include <cstdint>
#include <string>
#include <utility>

#include "error.hpp"

namespace conduit {

    /** @brief HTTP/2 error codes (RFC 7540 section 7) carried by a stream
     * reset. */
    enum class Http2ErrorCode : std::uint32_t {
        NoError = 0x0,
        ProtocolError = 0x1,
        InternalError = 0x2,
        FlowControlError = 0x3,
        SettingsTimeout = 0x4,
        StreamClosed = 0x5,
        FrameSizeError = 0x6,
        RefusedStream = 0x7,
        Cancel = 0x8,
        CompressionError = 0x9,
        ConnectError = 0xa,
        EnhanceYourCalm = 0xb,
        InadequateSecurity = 0xc,
        Http11Required = 0xd,
    };

    inline const char* to_string(Http2ErrorCode code) noexcept;

    /**
     * @brief Why an in-flight stream failed, as reported by the codec layer.
     *
     * Refused is kept apart from other resets because the peer refusing a
     * stream says nothing bad about the connection.
     */
    struct StreamFailure {
        enum class Kind {
            Refused, /**< The peer reset the stream with REFUSED_STREAM. */
            Reset,   /**< The peer reset the stream with another code. */
            Io,      /**< Socket or protocol I/O failed. */
        };

        Kind kind{Kind::Io};
        /// @brief Only meaningful for Refused and Reset.
        Http2ErrorCode reset_code{Http2ErrorCode::NoError};
        Error error{Error::Code::NetworkError, {}};

        static StreamFailure io(Error error) {
            return StreamFailure{Kind::Io, Http2ErrorCode::NoError,
                                 std::move(error)};
        }

        /// @brief A stream reset. REFUSED_STREAM yields Kind::Refused.
        static StreamFailure reset(Http2ErrorCode code) {
            const Kind kind = code == Http2ErrorCode::RefusedStream
                                  ? Kind::Refused
                                  : Kind::Reset;
            return StreamFailure{
                kind, code,
                Error{Error::Code::StreamReset,
                      std::string("stream was reset: ") + to_string(code)}};
        }

        static StreamFailure refused() {
            return reset(Http2ErrorCode::RefusedStream);
        }
    };

    inline const char* to_string(Http2ErrorCode code) noexcept {
        switch (code) {
            case Http2ErrorCode::NoError:
                return "NO_ERROR";
            case Http2ErrorCode::ProtocolError:
                return "PROTOCOL_ERROR";
            case Http2ErrorCode::InternalError:
                return "INTERNAL_ERROR";
            case Http2ErrorCode::FlowControlError:
                return "FLOW_CONTROL_ERROR";
            case Http2ErrorCode::SettingsTimeout:
                return "SETTINGS_TIMEOUT";
            case Http2ErrorCode::StreamClosed:
                return "STREAM_CLOSED";
            case Http2ErrorCode::FrameSizeError:
                return "FRAME_SIZE_ERROR";
            case Http2ErrorCode::RefusedStream:
                return "REFUSED_STREAM";
            case Http2ErrorCode::Cancel:
                return "CANCEL";
            case Http2ErrorCode::CompressionError:
                return "COMPRESSION_ERROR";
            case Http2ErrorCode::ConnectError:
                return "CONNECT_ERROR";
            case Http2ErrorCode::EnhanceYourCalm:
                return "ENHANCE_YOUR_CALM";
            case Http2ErrorCode::InadequateSecurity:
                return "INADEQUATE_SECURITY";
            case Http2ErrorCode::Http11Required:
                return "HTTP_1_1_REQUIRED";
        }
        return "UNKNOWN";
    }

}  // namespace conduit
