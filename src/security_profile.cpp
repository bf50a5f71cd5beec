#include "conduit/security_profile.hpp"

#include <algorithm>
#include <stdexcept>

namespace conduit {

    namespace {

        std::string_view strip_cipher_prefix(std::string_view name) noexcept {
            if (name.size() > 4 && (name.substr(0, 4) == "TLS_" ||
                                    name.substr(0, 4) == "SSL_")) {
                return name.substr(4);
            }
            return name;
        }

        bool contains_cipher(const std::vector<std::string>& list,
                             std::string_view name) {
            return std::any_of(list.begin(), list.end(),
                               [&](const std::string& s) {
                                   return same_cipher_suite(s, name);
                               });
        }

        /// @brief Entries of @p preferred also present in @p available, in
        /// @p preferred order, spelled the way @p available spells them.
        std::vector<std::string> intersect_ciphers(
            const std::vector<std::string>& preferred,
            const std::vector<std::string>& available) {
            std::vector<std::string> out;
            for (const auto& p : preferred) {
                auto it = std::find_if(available.begin(), available.end(),
                                       [&](const std::string& a) {
                                           return same_cipher_suite(a, p);
                                       });
                if (it != available.end()) out.push_back(*it);
            }
            return out;
        }

        std::vector<TlsVersion> intersect_versions(
            const std::vector<TlsVersion>& preferred,
            const std::vector<TlsVersion>& available) {
            std::vector<TlsVersion> out;
            for (TlsVersion v : preferred) {
                if (std::find(available.begin(), available.end(), v) !=
                    available.end()) {
                    out.push_back(v);
                }
            }
            return out;
        }

        std::string join(const std::vector<std::string>& items) {
            std::string out = "[";
            for (std::size_t i = 0; i < items.size(); ++i) {
                if (i) out += ", ";
                out += items[i];
            }
            out += "]";
            return out;
        }

        // TLS 1.3 suites first, then the AEAD ECDHE suites.
        const std::vector<std::string>& restricted_cipher_suites() {
            static const std::vector<std::string> suites = {
                "TLS_AES_128_GCM_SHA256",
                "TLS_AES_256_GCM_SHA384",
                "TLS_CHACHA20_POLY1305_SHA256",
                "TLS_AES_128_CCM_SHA256",
                "TLS_AES_256_CCM_8_SHA256",

                "TLS_ECDHE_ECDSA_WITH_AES_128_GCM_SHA256",
                "TLS_ECDHE_RSA_WITH_AES_128_GCM_SHA256",
                "TLS_ECDHE_ECDSA_WITH_AES_256_GCM_SHA384",
                "TLS_ECDHE_RSA_WITH_AES_256_GCM_SHA384",
                "TLS_ECDHE_ECDSA_WITH_CHACHA20_POLY1305_SHA256",
                "TLS_ECDHE_RSA_WITH_CHACHA20_POLY1305_SHA256",
            };
            return suites;
        }

        const std::vector<std::string>& approved_cipher_suites() {
            static const std::vector<std::string> suites = [] {
                std::vector<std::string> s = restricted_cipher_suites();
                // These are on HTTP/2's bad cipher list but still needed for
                // older servers.
                s.insert(s.end(), {
                                      "TLS_ECDHE_RSA_WITH_AES_128_CBC_SHA",
                                      "TLS_ECDHE_RSA_WITH_AES_256_CBC_SHA",
                                      "TLS_RSA_WITH_AES_128_GCM_SHA256",
                                      "TLS_RSA_WITH_AES_256_GCM_SHA384",
                                      "TLS_RSA_WITH_AES_128_CBC_SHA",
                                      "TLS_RSA_WITH_AES_256_CBC_SHA",
                                      "TLS_RSA_WITH_3DES_EDE_CBC_SHA",
                                  });
                return s;
            }();
            return suites;
        }

    }  // namespace

    const char* to_string(TlsVersion v) noexcept {
        switch (v) {
            case TlsVersion::Tls13:
                return "TLSv1.3";
            case TlsVersion::Tls12:
                return "TLSv1.2";
            case TlsVersion::Tls11:
                return "TLSv1.1";
            case TlsVersion::Tls10:
                return "TLSv1";
            case TlsVersion::Ssl30:
                return "SSLv3";
        }
        return "TLSv1";
    }

    std::optional<TlsVersion> tls_version_from_string(std::string_view name) {
        if (name == "TLSv1.3") return TlsVersion::Tls13;
        if (name == "TLSv1.2") return TlsVersion::Tls12;
        if (name == "TLSv1.1") return TlsVersion::Tls11;
        if (name == "TLSv1" || name == "TLSv1.0") return TlsVersion::Tls10;
        if (name == "SSLv3") return TlsVersion::Ssl30;
        return std::nullopt;
    }

    bool same_cipher_suite(std::string_view a, std::string_view b) noexcept {
        return strip_cipher_prefix(a) == strip_cipher_prefix(b);
    }

    ConnectionSecurityProfile::ConnectionSecurityProfile(
        bool tls, CipherSuites cipher_suites, TlsVersions tls_versions,
        bool supports_tls_extensions)
        : m_tls(tls),
          m_cipher_suites(std::move(cipher_suites)),
          m_tls_versions(std::move(tls_versions)),
          m_supports_tls_extensions(supports_tls_extensions) {
        if (!m_tls) {
            if (m_cipher_suites) {
                throw std::logic_error(
                    "no cipher suites for cleartext connections");
            }
            if (m_tls_versions) {
                throw std::logic_error(
                    "no TLS versions for cleartext connections");
            }
            if (m_supports_tls_extensions) {
                throw std::logic_error(
                    "no TLS extensions for cleartext connections");
            }
            return;
        }
        if (m_cipher_suites && m_cipher_suites->empty()) {
            throw std::invalid_argument("At least one cipher suite is required");
        }
        if (m_tls_versions && m_tls_versions->empty()) {
            throw std::invalid_argument("At least one TLS version is required");
        }
    }

    const ConnectionSecurityProfile& ConnectionSecurityProfile::cleartext() {
        static const ConnectionSecurityProfile profile(false, std::nullopt,
                                                       std::nullopt, false);
        return profile;
    }

    const ConnectionSecurityProfile&
    ConnectionSecurityProfile::restricted_tls() {
        static const ConnectionSecurityProfile profile(
            true, restricted_cipher_suites(),
            std::vector<TlsVersion>{TlsVersion::Tls13, TlsVersion::Tls12},
            true);
        return profile;
    }

    const ConnectionSecurityProfile& ConnectionSecurityProfile::modern_tls() {
        static const ConnectionSecurityProfile profile(
            true, approved_cipher_suites(),
            std::vector<TlsVersion>{TlsVersion::Tls13, TlsVersion::Tls12,
                                    TlsVersion::Tls11, TlsVersion::Tls10},
            true);
        return profile;
    }

    const ConnectionSecurityProfile&
    ConnectionSecurityProfile::compatible_tls() {
        static const ConnectionSecurityProfile profile(
            true, approved_cipher_suites(),
            std::vector<TlsVersion>{TlsVersion::Tls10}, true);
        return profile;
    }

    ConnectionSecurityProfile ConnectionSecurityProfile::supported_profile(
        const TlsSocket& socket, bool is_fallback) const {
        std::vector<std::string> suites =
            m_cipher_suites
                ? intersect_ciphers(*m_cipher_suites,
                                    socket.enabled_cipher_suites())
                : socket.enabled_cipher_suites();
        std::vector<TlsVersion> versions =
            m_tls_versions ? intersect_versions(*m_tls_versions,
                                                socket.enabled_protocols())
                           : socket.enabled_protocols();

        // RFC 7507: tell the server a protocol fallback has taken place.
        if (is_fallback) {
            const auto supported = socket.supported_cipher_suites();
            auto it = std::find_if(supported.begin(), supported.end(),
                                   [](const std::string& s) {
                                       return same_cipher_suite(s,
                                                                kFallbackScsv);
                                   });
            if (it != supported.end() && !contains_cipher(suites, *it)) {
                suites.push_back(*it);
            }
        }

        return ConnectionSecurityProfile(Unchecked{}, m_tls, std::move(suites),
                                         std::move(versions),
                                         m_supports_tls_extensions);
    }

    Status ConnectionSecurityProfile::negotiate(TlsSocket& socket,
                                                bool is_fallback) const {
        if (!m_tls) {
            return Status::err(Error::Code::IllegalState,
                               "cannot negotiate TLS for a cleartext profile");
        }

        const ConnectionSecurityProfile applied =
            supported_profile(socket, is_fallback);

        if (applied.m_tls_versions->empty()) {
            return Status::err(Error::Code::TlsHandshakeFailed,
                               "no TLS versions in common with " + to_string());
        }
        const bool only_scsv =
            applied.m_cipher_suites->size() == 1 &&
            same_cipher_suite(applied.m_cipher_suites->front(), kFallbackScsv);
        if (applied.m_cipher_suites->empty() || only_scsv) {
            return Status::err(Error::Code::TlsHandshakeFailed,
                               "no cipher suites in common with " +
                                   to_string());
        }

        if (auto st = socket.set_enabled_protocols(*applied.m_tls_versions);
            !st) {
            return st;
        }
        return socket.set_enabled_cipher_suites(*applied.m_cipher_suites);
    }

    bool ConnectionSecurityProfile::is_compatible(
        const TlsSocket& socket) const {
        if (!m_tls) return false;

        if (m_tls_versions) {
            const auto enabled = socket.enabled_protocols();
            if (intersect_versions(*m_tls_versions, enabled).empty())
                return false;
        }

        if (m_cipher_suites) {
            const auto enabled = socket.enabled_cipher_suites();
            if (intersect_ciphers(*m_cipher_suites, enabled).empty())
                return false;
        }

        return true;
    }

    bool operator==(const ConnectionSecurityProfile& a,
                    const ConnectionSecurityProfile& b) noexcept {
        if (a.m_tls != b.m_tls) return false;
        if (!a.m_tls) return true;
        return a.m_cipher_suites == b.m_cipher_suites &&
               a.m_tls_versions == b.m_tls_versions &&
               a.m_supports_tls_extensions == b.m_supports_tls_extensions;
    }

    std::size_t ConnectionSecurityProfile::hash() const noexcept {
        std::size_t result = 17;
        if (!m_tls) return result;

        auto mix = [&result](std::size_t h) { result = 31 * result + h; };
        std::size_t suites = 1;
        if (m_cipher_suites) {
            for (const auto& s : *m_cipher_suites)
                suites = 31 * suites + std::hash<std::string>{}(s);
        }
        std::size_t versions = 1;
        if (m_tls_versions) {
            for (TlsVersion v : *m_tls_versions)
                versions = 31 * versions + static_cast<std::size_t>(v);
        }
        mix(suites);
        mix(versions);
        mix(m_supports_tls_extensions ? 0 : 1);
        return result;
    }

    std::string ConnectionSecurityProfile::to_string() const {
        if (!m_tls) return "ConnectionSecurityProfile()";

        std::string suites = "[all enabled]";
        if (m_cipher_suites) suites = join(*m_cipher_suites);

        std::string versions = "[all enabled]";
        if (m_tls_versions) {
            std::vector<std::string> names;
            for (TlsVersion v : *m_tls_versions)
                names.emplace_back(conduit::to_string(v));
            versions = join(names);
        }

        return "ConnectionSecurityProfile(cipherSuites=" + suites +
               ", tlsVersions=" + versions + ", supportsTlsExtensions=" +
               (m_supports_tls_extensions ? "true" : "false") + ")";
    }

}  // namespace conduit
