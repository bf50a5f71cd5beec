#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/address.hpp>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_set>
#include <vector>

#include "route.hpp"

namespace conduit {

    /// @brief Host name lookup.
    class Dns {
       public:
        virtual ~Dns() = default;

        /// @brief Addresses for @p host; ConnectionFailed when none.
        virtual Result<std::vector<boost::asio::ip::address>> lookup(
            const std::string& host) = 0;
    };

    /// @brief Dns backed by the system resolver through Boost.Asio.
    class SystemDns final : public Dns {
       public:
        Result<std::vector<boost::asio::ip::address>> lookup(
            const std::string& host) override;

       private:
        boost::asio::io_context m_io{1};
    };

    /**
     * @brief Blacklist of routes that failed to connect. Routes listed here
     * are still tried, but only after every other candidate.
     * @note Thread-safe.
     */
    class RouteDatabase {
       public:
        void failed(const Route& route);
        void connected(const Route& route);
        bool should_postpone(const Route& route) const;
        std::size_t failed_count() const;

       private:
        mutable std::mutex m_mu;
        std::unordered_set<Route> m_failed;
    };

    /**
     * @brief RouteSource for one address: one selection per proxy, each
     * holding every resolved IP of that proxy (or of the origin when direct).
     */
    class RouteSelector final : public RouteSource {
       public:
        RouteSelector(Address address, Dns& dns, RouteDatabase& database);

        Result<RouteSelection> next() override;
        bool has_next() const override;
        void connect_failed(const Route& route, const Error& error) override;

       private:
        bool has_next_proxy() const noexcept {
            return m_next_proxy < m_proxies.size();
        }

        Address m_address;
        Dns& m_dns;
        RouteDatabase& m_database;

        std::vector<Proxy> m_proxies;
        std::size_t m_next_proxy{0};
        std::vector<Route> m_postponed;
    };

}  // namespace conduit
