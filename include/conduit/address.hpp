#pragma once

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <algorithm>
#include <boost/asio/ssl/context.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/ssl/ssl_stream.hpp>
#include <boost/system/error_code.hpp>
#include <cctype>
#include <stdexcept>
#include <string>
#include <vector>

#include "security_profile.hpp"

namespace conduit {

    /** @brief How a connection reaches its origin. */
    struct Proxy {
        enum class Type { Direct, Http, Socks };

        Type type{Type::Direct};
        std::string host;
        std::string port;

        static Proxy direct() { return Proxy{}; }

        bool is_direct() const noexcept { return type == Type::Direct; }

        friend bool operator==(Proxy const& a, Proxy const& b) noexcept {
            return a.type == b.type && a.host == b.host && a.port == b.port;
        }
    };

    /**
     * @brief Destination of a call: origin host/port, proxy and the security
     * profiles to try. Two calls with equal addresses may share connections.
     */
    struct Address {
        std::string host;
        std::string port;
        bool https{false};
        Proxy proxy{};
        /// @brief Profiles to attempt in order. Empty means the defaults for
        /// the scheme, see effective_security_profiles().
        std::vector<ConnectionSecurityProfile> security_profiles;

        inline void normalize_default_port() {
            if (port.empty()) port = https ? "443" : "80";
        }

        inline void normalize_host() {
            if (host.empty()) host = "localhost";
            std::transform(host.begin(), host.end(), host.begin(),
                           [](unsigned char c) { return std::tolower(c); });
        }

        std::vector<ConnectionSecurityProfile> effective_security_profiles()
            const {
            if (!security_profiles.empty()) return security_profiles;
            if (!https) return {ConnectionSecurityProfile::cleartext()};
            return {ConnectionSecurityProfile::modern_tls(),
                    ConnectionSecurityProfile::compatible_tls()};
        }

        /// @brief Equal in everything but the host name.
        bool equals_non_host(Address const& other) const noexcept {
            return https == other.https && port == other.port &&
                   proxy == other.proxy &&
                   security_profiles == other.security_profiles;
        }

        std::string to_string() const {
            return (https ? "https://" : "http://") + host + ":" + port;
        }

        friend bool operator==(Address const& a, Address const& b) noexcept {
            return a.host == b.host && a.equals_non_host(b);
        }
    };

    inline bool set_sni(
        boost::beast::ssl_stream<boost::beast::tcp_stream>& stream,
        const std::string& host, boost::system::error_code& ec) {
        if (!SSL_set_tlsext_host_name(stream.native_handle(), host.c_str())) {
            ec = boost::system::error_code(
                static_cast<int>(::ERR_get_error()),
                boost::asio::error::get_ssl_category());
            return false;
        }
        return true;
    }

    /// @brief Load the system CA store and require peer verification.
    void inline init_tls_on_ssl_context(boost::asio::ssl::context& ssl_context,
                                        bool verify_peer = true) {
        try {
            ssl_context.set_default_verify_paths();
        } catch (const boost::system::system_error& e) {
            throw std::runtime_error(
                std::string("Failed to set default verify paths: ") + e.what());
        }

        static_cast<void>(ssl_context.set_verify_mode(
            verify_peer ? boost::asio::ssl::verify_peer
                        : boost::asio::ssl::verify_none));
    }

}  // namespace conduit

namespace std {
    template <>
    struct hash<conduit::Address> {
        size_t operator()(conduit::Address const& a) const noexcept {
            size_t h = 1469598103934665603ull;
            auto mix = [&](std::string_view s) {
                for (unsigned char c : s) {
                    h ^= c;
                    h *= 1099511628211ull;
                }
            };
            h ^= static_cast<size_t>(a.https);
            h *= 1099511628211ull;
            mix(a.host);
            mix(a.port);
            mix(a.proxy.host);
            return h;
        }
    };
}  // namespace std
