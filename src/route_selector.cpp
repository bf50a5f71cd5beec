#include "conduit/route_selector.hpp"

#include <spdlog/spdlog.h>

#include <boost/asio/ip/tcp.hpp>
#include <charconv>

namespace conduit {

    namespace {

        Result<unsigned short> parse_port(const std::string& port) {
            unsigned int value = 0;
            const auto* first = port.data();
            const auto* last = port.data() + port.size();
            auto [ptr, ec] = std::from_chars(first, last, value);
            if (ec != std::errc{} || ptr != last || value == 0 ||
                value > 65535) {
                return Result<unsigned short>::err(Error::Code::InvalidArgument,
                                                   "invalid port: " + port);
            }
            return Result<unsigned short>::ok(
                static_cast<unsigned short>(value));
        }

    }  // namespace

    Result<std::vector<boost::asio::ip::address>> SystemDns::lookup(
        const std::string& host) {
        using Addresses = std::vector<boost::asio::ip::address>;

        boost::system::error_code ec;
        // Literal IPs need no resolver round trip.
        auto literal = boost::asio::ip::make_address(host, ec);
        if (!ec) return Result<Addresses>::ok(Addresses{literal});

        boost::asio::ip::tcp::resolver resolver(m_io);
        auto results = resolver.resolve(host, "", ec);
        if (ec) {
            return Result<Addresses>::err(
                Error::Code::ConnectionFailed,
                "unable to resolve host " + host + ": " + ec.message());
        }

        Addresses out;
        for (const auto& entry : results) {
            out.push_back(entry.endpoint().address());
        }
        if (out.empty()) {
            return Result<Addresses>::err(Error::Code::ConnectionFailed,
                                          "no addresses for host " + host);
        }
        return Result<Addresses>::ok(std::move(out));
    }

    void RouteDatabase::failed(const Route& route) {
        std::lock_guard<std::mutex> lk(m_mu);
        m_failed.insert(route);
    }

    void RouteDatabase::connected(const Route& route) {
        std::lock_guard<std::mutex> lk(m_mu);
        m_failed.erase(route);
    }

    bool RouteDatabase::should_postpone(const Route& route) const {
        std::lock_guard<std::mutex> lk(m_mu);
        return m_failed.count(route) != 0;
    }

    std::size_t RouteDatabase::failed_count() const {
        std::lock_guard<std::mutex> lk(m_mu);
        return m_failed.size();
    }

    RouteSelector::RouteSelector(Address address, Dns& dns,
                                 RouteDatabase& database)
        : m_address(std::move(address)), m_dns(dns), m_database(database) {
        m_address.normalize_default_port();
        m_address.normalize_host();
        m_proxies.push_back(m_address.proxy);
    }

    bool RouteSelector::has_next() const {
        return has_next_proxy() || !m_postponed.empty();
    }

    Result<RouteSelection> RouteSelector::next() {
        if (!has_next()) {
            return Result<RouteSelection>::err(
                Error::Code::ConnectionFailed,
                "no more routes to " + m_address.to_string());
        }

        std::vector<Route> routes;
        while (has_next_proxy()) {
            const Proxy proxy = m_proxies[m_next_proxy++];

            // Through an HTTP proxy the socket goes to the proxy, otherwise to
            // the origin.
            const bool via_proxy = proxy.type == Proxy::Type::Http;
            const std::string& host = via_proxy ? proxy.host : m_address.host;
            const std::string& port_text =
                via_proxy ? proxy.port : m_address.port;

            auto port = parse_port(port_text);
            if (!port) return std::move(port).forward_error<RouteSelection>();

            auto ips = m_dns.lookup(host);
            if (!ips) return std::move(ips).forward_error<RouteSelection>();

            for (const auto& ip : ips.value()) {
                Route route{m_address, proxy,
                            boost::asio::ip::tcp::endpoint(ip, port.value())};
                if (m_database.should_postpone(route)) {
                    m_postponed.push_back(std::move(route));
                } else {
                    routes.push_back(std::move(route));
                }
            }

            if (!routes.empty()) break;
        }

        if (routes.empty()) {
            // Only failed routes are left: try them anyway.
            routes = std::move(m_postponed);
            m_postponed.clear();
        }

        SPDLOG_DEBUG("route selection for {}: {} routes, {} postponed",
                     m_address.to_string(), routes.size(), m_postponed.size());
        return Result<RouteSelection>::ok(std::move(routes));
    }

    void RouteSelector::connect_failed(const Route& route, const Error& error) {
        SPDLOG_DEBUG("route {} failed: {}", route.to_string(), error.message);
        m_database.failed(route);
    }

}  // namespace conduit
