#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "result.hpp"

namespace conduit {

    /** @brief TLS protocol versions, newest first. */
    enum class TlsVersion { Tls13, Tls12, Tls11, Tls10, Ssl30 };

    /// @brief Protocol name as TLS libraries spell it, e.g. "TLSv1.2".
    const char* to_string(TlsVersion v) noexcept;

    std::optional<TlsVersion> tls_version_from_string(std::string_view name);

    /// @brief Compare cipher suite names, treating the "TLS_" and "SSL_"
    /// prefixes as the same.
    bool same_cipher_suite(std::string_view a, std::string_view b) noexcept;

    /// @brief Name of the downgrade signalling cipher suite (RFC 7507).
    inline constexpr std::string_view kFallbackScsv = "TLS_FALLBACK_SCSV";

    /**
     * @brief The TLS configuration surface of a socket that has not yet
     * handshaken.
     */
    class TlsSocket {
       public:
        virtual ~TlsSocket() = default;

        virtual std::vector<std::string> enabled_cipher_suites() const = 0;
        virtual std::vector<std::string> supported_cipher_suites() const = 0;
        virtual std::vector<TlsVersion> enabled_protocols() const = 0;

        virtual Status set_enabled_cipher_suites(
            const std::vector<std::string>& suites) = 0;
        virtual Status set_enabled_protocols(
            const std::vector<TlsVersion>& versions) = 0;
    };

    /**
     * @brief Ordered TLS preferences for a connection, negotiated against
     * what a socket actually has enabled.
     *
     * An absent cipher or version list means "all enabled": selection is
     * deferred to the socket.
     */
    class ConnectionSecurityProfile {
       public:
        using CipherSuites = std::optional<std::vector<std::string>>;
        using TlsVersions = std::optional<std::vector<TlsVersion>>;

        /**
         * @brief Construct a profile.
         * @throws std::logic_error when TLS options are given for a cleartext
         * profile.
         * @throws std::invalid_argument when a present list is empty.
         */
        ConnectionSecurityProfile(bool tls, CipherSuites cipher_suites,
                                  TlsVersions tls_versions,
                                  bool supports_tls_extensions);

        /// @brief Unencrypted connections for http: URLs.
        static const ConnectionSecurityProfile& cleartext();
        /// @brief TLS 1.3/1.2 with AEAD cipher suites only.
        static const ConnectionSecurityProfile& restricted_tls();
        /// @brief TLS 1.3 to 1.0 with a broader curated cipher list.
        static const ConnectionSecurityProfile& modern_tls();
        /// @brief TLS 1.0 only, for servers that reject modern negotiation.
        static const ConnectionSecurityProfile& compatible_tls();

        bool is_tls() const noexcept { return m_tls; }
        const CipherSuites& cipher_suites() const noexcept {
            return m_cipher_suites;
        }
        const TlsVersions& tls_versions() const noexcept {
            return m_tls_versions;
        }
        bool supports_tls_extensions() const noexcept {
            return m_supports_tls_extensions;
        }

        /**
         * @brief Intersect this profile with what @p socket has enabled, in
         * this profile's order, and apply the result to the socket.
         * @param is_fallback Whether this is a retry after a failed
         * negotiation; appends the fallback SCSV when the socket supports it.
         */
        Status negotiate(TlsSocket& socket, bool is_fallback) const;

        /// @brief The profile negotiate() would apply, without applying it.
        ConnectionSecurityProfile supported_profile(const TlsSocket& socket,
                                                    bool is_fallback) const;

        /// @brief True if a handshake with @p socket can use this profile.
        bool is_compatible(const TlsSocket& socket) const;

        std::size_t hash() const noexcept;
        std::string to_string() const;

        friend bool operator==(const ConnectionSecurityProfile& a,
                               const ConnectionSecurityProfile& b) noexcept;
        friend bool operator!=(const ConnectionSecurityProfile& a,
                               const ConnectionSecurityProfile& b) noexcept {
            return !(a == b);
        }

       private:
        struct Unchecked {};
        ConnectionSecurityProfile(Unchecked, bool tls, CipherSuites suites,
                                  TlsVersions versions, bool extensions)
            : m_tls(tls),
              m_cipher_suites(std::move(suites)),
              m_tls_versions(std::move(versions)),
              m_supports_tls_extensions(extensions) {}

        bool m_tls;
        CipherSuites m_cipher_suites;
        TlsVersions m_tls_versions;
        bool m_supports_tls_extensions;
    };

}  // namespace conduit

namespace std {
    template <>
    struct hash<conduit::ConnectionSecurityProfile> {
        size_t operator()(
            conduit::ConnectionSecurityProfile const& p) const noexcept {
            return p.hash();
        }
    };
}  // namespace std
