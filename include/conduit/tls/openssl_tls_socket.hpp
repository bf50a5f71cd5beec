#pragma once

#include <openssl/ssl.h>

#include <string>
#include <vector>

#include "../security_profile.hpp"

namespace conduit {

    /**
     * @brief TlsSocket over an OpenSSL connection object that has not started
     * its handshake.
     *
     * Cipher suites are reported and accepted by their IANA names. The
     * fallback SCSV is always "supported": enabling it turns on
     * SSL_MODE_SEND_FALLBACK_SCSV. A suite list without pre-1.3 suites also
     * raises the minimum version to TLS 1.3, so that older versions never
     * fall back to the library's default suites.
     * @note Does not own the SSL object.
     */
    class OpenSslTlsSocket final : public TlsSocket {
       public:
        explicit OpenSslTlsSocket(SSL* ssl) noexcept : m_ssl(ssl) {}

        std::vector<std::string> enabled_cipher_suites() const override;
        std::vector<std::string> supported_cipher_suites() const override;
        std::vector<TlsVersion> enabled_protocols() const override;

        Status set_enabled_cipher_suites(
            const std::vector<std::string>& suites) override;
        Status set_enabled_protocols(
            const std::vector<TlsVersion>& versions) override;

        SSL* native_handle() const noexcept { return m_ssl; }

       private:
        /// @brief Empty the pre-1.3 suite list and switch off pre-1.3
        /// versions.
        Status restrict_to_tls13();

        SSL* m_ssl;
    };

}  // namespace conduit
