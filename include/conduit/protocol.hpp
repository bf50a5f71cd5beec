#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace conduit {

    /** @brief Application protocol negotiated on a connection. */
    enum class Protocol {
        Http10,  /**< "http/1.0" */
        Http11,  /**< "http/1.1", also the default when nothing was
                    negotiated. */
        Http2,   /**< "h2", multiplexed. */
        H2PriorKnowledge, /**< "h2_prior_knowledge", cleartext HTTP/2. */
    };

    /// @brief ALPN identifier of @p p.
    const char* to_string(Protocol p) noexcept;

    /// @brief Parse an ALPN identifier; nullopt when unknown.
    std::optional<Protocol> protocol_from_alpn(std::string_view alpn);

    /// @brief True when the protocol carries concurrent streams.
    inline bool is_multiplexed(Protocol p) noexcept {
        return p == Protocol::Http2 || p == Protocol::H2PriorKnowledge;
    }

    /// @brief Outcome of a TLS handshake.
    struct Handshake {
        /// @brief Negotiated version, e.g. "TLSv1.3".
        std::string tls_version;
        /// @brief Negotiated cipher suite, IANA name.
        std::string cipher_suite;
        /// @brief DNS names the peer certificate is valid for.
        std::vector<std::string> peer_names;

        /// @brief True when one of peer_names covers @p host, honoring a
        /// single leading "*." wildcard label.
        bool covers_host(std::string_view host) const;
    };

}  // namespace conduit
