#pragma once
#include <string>

namespace conduit {
    /**
     * @brief Represents an error that occurred while allocating or using a
     * stream.
     */
    struct Error {
        /** @brief Enumeration of error codes. */
        enum class Code {
            InvalidArgument,   /**< A caller supplied an unusable value. */
            IllegalState,      /**< An operation was called out of order. */
            Canceled,          /**< The call was canceled. */
            ConnectionFailed,  /**< Failed to establish a TCP connection. */
            TlsHandshakeFailed,/**< Failed to perform TLS handshake. */
            Timeout,           /**< The operation timed out. */
            SendFailed,        /**< Failed to send the request. */
            ReceiveFailed,     /**< Failed to receive the response. */
            NetworkError,      /**< General network error. */
            StreamReset,       /**< The peer reset the stream. */
            Unknown,           /**< An unknown error occurred. */
        };

        /** @brief The error code. */
        Code code;
        /** @brief A descriptive error message. */
        std::string message;
    };

    /// @brief Convert an Error::Code to string for logging or diagnostics
    inline const char* to_string(Error::Code code) {
        switch (code) {
            case Error::Code::InvalidArgument:
                return "InvalidArgument";
            case Error::Code::IllegalState:
                return "IllegalState";
            case Error::Code::Canceled:
                return "Canceled";
            case Error::Code::ConnectionFailed:
                return "ConnectionFailed";
            case Error::Code::TlsHandshakeFailed:
                return "TlsHandshakeFailed";
            case Error::Code::Timeout:
                return "Timeout";
            case Error::Code::SendFailed:
                return "SendFailed";
            case Error::Code::ReceiveFailed:
                return "ReceiveFailed";
            case Error::Code::NetworkError:
                return "NetworkError";
            case Error::Code::StreamReset:
                return "StreamReset";
            case Error::Code::Unknown:
                return "Unknown";
        }
        return "Unknown";
    }
}  // namespace conduit
