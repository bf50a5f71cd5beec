#include "conduit/tls/openssl_tls_socket.hpp"

#include <openssl/err.h>

#include <algorithm>
#include <array>
#include <cstdint>
#include <string>

namespace conduit {

    namespace {

        struct VersionInfo {
            TlsVersion version;
            int wire_version;
            std::uint64_t no_flag;
        };

        // SSLv3 is not offered: OpenSSL 3 builds do not ship it.
        constexpr std::array<VersionInfo, 4> kVersions{{
            {TlsVersion::Tls10, TLS1_VERSION, SSL_OP_NO_TLSv1},
            {TlsVersion::Tls11, TLS1_1_VERSION, SSL_OP_NO_TLSv1_1},
            {TlsVersion::Tls12, TLS1_2_VERSION, SSL_OP_NO_TLSv1_2},
            {TlsVersion::Tls13, TLS1_3_VERSION, SSL_OP_NO_TLSv1_3},
        }};

        std::string last_ssl_error(const char* what) {
            std::string msg = what;
            const unsigned long code = ::ERR_get_error();
            if (code != 0) {
                char buf[256];
                ::ERR_error_string_n(code, buf, sizeof(buf));
                msg += ": ";
                msg += buf;
            }
            return msg;
        }

        /// @brief TLS 1.3 suites have no key exchange in their name.
        bool is_tls13_suite(const std::string& name) {
            return name.rfind("TLS_", 0) == 0 &&
                   name.find("_WITH_") == std::string::npos &&
                   name != kFallbackScsv;
        }

        std::string iana_name(const std::string& name) {
            if (name.rfind("SSL_", 0) == 0) return "TLS_" + name.substr(4);
            return name;
        }

        void append(std::string& list, const char* name) {
            if (!list.empty()) list += ':';
            list += name;
        }

    }  // namespace

    std::vector<std::string> OpenSslTlsSocket::enabled_cipher_suites() const {
        std::vector<std::string> out;
        STACK_OF(SSL_CIPHER)* ciphers = ::SSL_get_ciphers(m_ssl);
        if (!ciphers) return out;

        const int n = sk_SSL_CIPHER_num(ciphers);
        out.reserve(static_cast<std::size_t>(n));
        for (int i = 0; i < n; ++i) {
            const SSL_CIPHER* c = sk_SSL_CIPHER_value(ciphers, i);
            const char* name = ::SSL_CIPHER_standard_name(c);
            if (name) out.emplace_back(name);
        }
        return out;
    }

    std::vector<std::string> OpenSslTlsSocket::supported_cipher_suites()
        const {
        auto out = enabled_cipher_suites();
        out.emplace_back(kFallbackScsv);
        return out;
    }

    std::vector<TlsVersion> OpenSslTlsSocket::enabled_protocols() const {
        const long min = ::SSL_get_min_proto_version(m_ssl);
        const long max = ::SSL_get_max_proto_version(m_ssl);
        const auto options = ::SSL_get_options(m_ssl);

        std::vector<TlsVersion> out;
        // Newest first, matching the profile presets.
        for (auto it = kVersions.rbegin(); it != kVersions.rend(); ++it) {
            if (min != 0 && it->wire_version < min) continue;
            if (max != 0 && it->wire_version > max) continue;
            if (options & it->no_flag) continue;
            out.push_back(it->version);
        }
        return out;
    }

    Status OpenSslTlsSocket::set_enabled_protocols(
        const std::vector<TlsVersion>& versions) {
        int min = 0;
        int max = 0;
        std::uint64_t all_flags = 0;
        for (const auto& info : kVersions) {
            all_flags |= info.no_flag;
            if (std::find(versions.begin(), versions.end(), info.version) ==
                versions.end())
                continue;
            if (min == 0 || info.wire_version < min) min = info.wire_version;
            if (info.wire_version > max) max = info.wire_version;
        }
        if (min == 0) {
            return Status::err(Error::Code::InvalidArgument,
                               "no TLS version supported by OpenSSL requested");
        }

        if (!::SSL_set_min_proto_version(m_ssl, min) ||
            !::SSL_set_max_proto_version(m_ssl, max)) {
            return Status::err(Error::Code::TlsHandshakeFailed,
                               last_ssl_error("SSL_set_*_proto_version"));
        }

        // Versions inside [min, max] that were not asked for are switched off.
        std::uint64_t gaps = 0;
        for (const auto& info : kVersions) {
            if (info.wire_version < min || info.wire_version > max) continue;
            if (std::find(versions.begin(), versions.end(), info.version) ==
                versions.end())
                gaps |= info.no_flag;
        }
        ::SSL_clear_options(m_ssl, all_flags);
        if (gaps) ::SSL_set_options(m_ssl, gaps);
        return ok_status();
    }

    Status OpenSslTlsSocket::restrict_to_tls13() {
        const auto versions = enabled_protocols();
        if (std::find(versions.begin(), versions.end(), TlsVersion::Tls13) ==
            versions.end()) {
            return Status::err(Error::Code::InvalidArgument,
                               "only TLS 1.3 cipher suites requested but TLS "
                               "1.3 is not enabled");
        }
        if (!::SSL_set_min_proto_version(m_ssl, TLS1_3_VERSION)) {
            return Status::err(Error::Code::TlsHandshakeFailed,
                               last_ssl_error("SSL_set_min_proto_version"));
        }

        // An empty rule string leaves only the TLS 1.3 suites in the list.
        // OpenSSL installs that list but reports the missing TLS 1.2 match
        // as a failure, so the result is checked on the list itself.
        ::SSL_set_cipher_list(m_ssl, "");
        ::ERR_clear_error();
        for (const auto& name : enabled_cipher_suites()) {
            if (!is_tls13_suite(name)) {
                return Status::err(Error::Code::TlsHandshakeFailed,
                                   "pre-TLS 1.3 cipher suite left enabled: " +
                                       name);
            }
        }
        return ok_status();
    }

    Status OpenSslTlsSocket::set_enabled_cipher_suites(
        const std::vector<std::string>& suites) {
        std::string tls13;
        std::string legacy;
        bool send_scsv = false;

        for (const auto& raw : suites) {
            const std::string name = iana_name(raw);
            if (same_cipher_suite(name, kFallbackScsv)) {
                send_scsv = true;
            } else if (is_tls13_suite(name)) {
                append(tls13, name.c_str());
            } else {
                const char* openssl_name = ::OPENSSL_cipher_name(name.c_str());
                if (openssl_name && std::string_view(openssl_name) != "(NONE)")
                    append(legacy, openssl_name);
            }
        }

        if (tls13.empty() && legacy.empty()) {
            return Status::err(Error::Code::InvalidArgument,
                               "no cipher suite known to OpenSSL requested");
        }

        if (!::SSL_set_ciphersuites(m_ssl, tls13.c_str())) {
            return Status::err(Error::Code::TlsHandshakeFailed,
                               last_ssl_error("SSL_set_ciphersuites"));
        }
        if (legacy.empty()) {
            if (auto st = restrict_to_tls13(); !st) return st;
        } else if (!::SSL_set_cipher_list(m_ssl, legacy.c_str())) {
            return Status::err(Error::Code::TlsHandshakeFailed,
                               last_ssl_error("SSL_set_cipher_list"));
        }

        if (send_scsv)
            ::SSL_set_mode(m_ssl, SSL_MODE_SEND_FALLBACK_SCSV);
        else
            ::SSL_clear_mode(m_ssl, SSL_MODE_SEND_FALLBACK_SCSV);
        return ok_status();
    }

}  // namespace conduit
