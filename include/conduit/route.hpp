#pragma once

#include <boost/asio/ip/tcp.hpp>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "address.hpp"
#include "result.hpp"

namespace conduit {

    /// @brief One concrete way to reach an address: the proxy and the IP
    /// endpoint to open a socket to.
    struct Route {
        Address address;
        Proxy proxy;
        boost::asio::ip::tcp::endpoint socket_address;

        std::string to_string() const {
            return address.to_string() + " via " +
                   socket_address.address().to_string() + ":" +
                   std::to_string(socket_address.port());
        }

        friend bool operator==(Route const& a, Route const& b) noexcept {
            return a.address == b.address && a.proxy == b.proxy &&
                   a.socket_address == b.socket_address;
        }
    };

    /// @brief A batch of routes sharing one proxy, produced by one route
    /// source step.
    class RouteSelection {
       public:
        explicit RouteSelection(std::vector<Route> routes)
            : m_routes(std::move(routes)) {}

        bool has_next() const noexcept { return m_next < m_routes.size(); }

        /// @brief Take the next route. Only valid when has_next().
        Route next() { return m_routes[m_next++]; }

        const std::vector<Route>& all() const noexcept { return m_routes; }

       private:
        std::vector<Route> m_routes;
        std::size_t m_next{0};
    };

    /**
     * @brief Produces candidate routes for one address.
     *
     * next() may block (DNS). Implementations need not be thread-safe: one
     * StreamAllocation drives one source.
     */
    class RouteSource {
       public:
        virtual ~RouteSource() = default;

        /// @brief The next batch; ConnectionFailed when exhausted.
        virtual Result<RouteSelection> next() = 0;

        virtual bool has_next() const = 0;

        /// @brief Feedback that connecting through @p route failed.
        virtual void connect_failed(const Route& route, const Error& error) = 0;
    };

}  // namespace conduit

namespace std {
    template <>
    struct hash<conduit::Route> {
        size_t operator()(conduit::Route const& r) const noexcept {
            size_t h = hash<conduit::Address>{}(r.address);
            h ^= hash<std::string>{}(r.socket_address.address().to_string()) +
                 0x9e3779b97f4a7c15ull + (h << 6) + (h >> 2);
            h ^= static_cast<size_t>(r.socket_address.port());
            return h;
        }
    };
}  // namespace std
