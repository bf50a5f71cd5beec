#include <gtest/gtest.h>

#include <map>
#include <string>
#include <vector>

#include "conduit/route_selector.hpp"

using namespace conduit;
namespace ip = boost::asio::ip;

namespace {

    /// @brief Dns answering from a fixed table.
    class FakeDns final : public Dns {
       public:
        std::map<std::string, std::vector<ip::address>> table;
        std::vector<std::string> queries;

        Result<std::vector<ip::address>> lookup(
            const std::string& host) override {
            queries.push_back(host);
            auto it = table.find(host);
            if (it == table.end()) {
                return Result<std::vector<ip::address>>::err(
                    Error::Code::ConnectionFailed, "unknown host " + host);
            }
            return Result<std::vector<ip::address>>::ok(it->second);
        }
    };

    Address origin(std::string host, bool https = false) {
        Address a;
        a.host = std::move(host);
        a.https = https;
        return a;
    }

    std::vector<Route> drain(RouteSelection selection) {
        std::vector<Route> out;
        while (selection.has_next()) out.push_back(selection.next());
        return out;
    }

    TEST(RouteSelectorTest, DirectRoutesForEveryAddress) {
        FakeDns dns;
        dns.table["example.com"] = {ip::make_address("10.0.0.1"),
                                    ip::make_address("10.0.0.2")};
        RouteDatabase db;
        RouteSelector selector(origin("example.com", true), dns, db);

        ASSERT_TRUE(selector.has_next());
        auto selection = selector.next();
        ASSERT_TRUE(selection.has_value());

        auto routes = drain(std::move(selection).value());
        ASSERT_EQ(routes.size(), 2u);
        EXPECT_EQ(routes[0].socket_address,
                  ip::tcp::endpoint(ip::make_address("10.0.0.1"), 443));
        EXPECT_EQ(routes[1].socket_address.address(),
                  ip::make_address("10.0.0.2"));
        EXPECT_TRUE(routes[0].proxy.is_direct());
        EXPECT_EQ(routes[0].address.port, "443");

        EXPECT_FALSE(selector.has_next());
        auto exhausted = selector.next();
        ASSERT_TRUE(exhausted.has_error());
        EXPECT_EQ(exhausted.error().code, Error::Code::ConnectionFailed);
    }

    TEST(RouteSelectorTest, HttpProxyResolvesProxyHost) {
        FakeDns dns;
        dns.table["proxy.local"] = {ip::make_address("192.168.1.5")};
        RouteDatabase db;

        Address address = origin("example.com");
        address.proxy = Proxy{Proxy::Type::Http, "proxy.local", "3128"};
        RouteSelector selector(address, dns, db);

        auto routes = drain(selector.next().value());
        ASSERT_EQ(routes.size(), 1u);
        EXPECT_EQ(routes[0].socket_address,
                  ip::tcp::endpoint(ip::make_address("192.168.1.5"), 3128));
        EXPECT_EQ(routes[0].proxy.type, Proxy::Type::Http);
        EXPECT_EQ(dns.queries, std::vector<std::string>{"proxy.local"});
    }

    TEST(RouteSelectorTest, FailedRoutesArePostponed) {
        FakeDns dns;
        dns.table["example.com"] = {ip::make_address("10.0.0.1"),
                                    ip::make_address("10.0.0.2")};
        RouteDatabase db;

        {
            RouteSelector first(origin("example.com"), dns, db);
            auto routes = drain(first.next().value());
            first.connect_failed(routes[0],
                                 Error{Error::Code::ConnectionFailed, "refused"});
        }
        EXPECT_EQ(db.failed_count(), 1u);

        RouteSelector selector(origin("example.com"), dns, db);
        auto routes = drain(selector.next().value());
        ASSERT_EQ(routes.size(), 1u);
        EXPECT_EQ(routes[0].socket_address.address(),
                  ip::make_address("10.0.0.2"));

        // The postponed route comes last.
        ASSERT_TRUE(selector.has_next());
        auto last = drain(selector.next().value());
        ASSERT_EQ(last.size(), 1u);
        EXPECT_EQ(last[0].socket_address.address(),
                  ip::make_address("10.0.0.1"));
        EXPECT_FALSE(selector.has_next());
    }

    TEST(RouteSelectorTest, OnlyFailedRoutesAreStillTried) {
        FakeDns dns;
        dns.table["example.com"] = {ip::make_address("10.0.0.1")};
        RouteDatabase db;
        Address address = origin("example.com");
        address.normalize_default_port();
        db.failed(Route{address, Proxy::direct(),
                        ip::tcp::endpoint(ip::make_address("10.0.0.1"), 80)});

        RouteSelector selector(origin("example.com"), dns, db);
        auto routes = drain(selector.next().value());
        ASSERT_EQ(routes.size(), 1u);
        EXPECT_FALSE(selector.has_next());
    }

    TEST(RouteSelectorTest, ConnectedRouteLeavesDatabase) {
        RouteDatabase db;
        Address address = origin("example.com");
        address.normalize_default_port();
        Route route{address, Proxy::direct(),
                    ip::tcp::endpoint(ip::make_address("10.0.0.1"), 80)};

        db.failed(route);
        EXPECT_TRUE(db.should_postpone(route));
        db.connected(route);
        EXPECT_FALSE(db.should_postpone(route));
        EXPECT_EQ(db.failed_count(), 0u);
    }

    TEST(RouteSelectorTest, DnsFailureIsReported) {
        FakeDns dns;
        RouteDatabase db;
        RouteSelector selector(origin("nowhere.invalid"), dns, db);

        auto selection = selector.next();
        ASSERT_TRUE(selection.has_error());
        EXPECT_EQ(selection.error().code, Error::Code::ConnectionFailed);
        EXPECT_FALSE(selector.has_next());
    }

    TEST(RouteSelectorTest, InvalidPortIsRejected) {
        FakeDns dns;
        dns.table["example.com"] = {ip::make_address("10.0.0.1")};
        RouteDatabase db;
        Address address = origin("example.com");
        address.port = "http";
        RouteSelector selector(address, dns, db);

        auto selection = selector.next();
        ASSERT_TRUE(selection.has_error());
        EXPECT_EQ(selection.error().code, Error::Code::InvalidArgument);
        EXPECT_TRUE(dns.queries.empty());
    }

    TEST(RouteSelectorTest, HostIsLowercased) {
        FakeDns dns;
        dns.table["example.com"] = {ip::make_address("10.0.0.1")};
        RouteDatabase db;
        RouteSelector selector(origin("Example.COM"), dns, db);

        auto routes = drain(selector.next().value());
        ASSERT_EQ(routes.size(), 1u);
        EXPECT_EQ(routes[0].address.host, "example.com");
    }

    TEST(SystemDnsTest, LiteralAddressSkipsResolver) {
        SystemDns dns;
        auto r = dns.lookup("127.0.0.1");
        ASSERT_TRUE(r.has_value());
        ASSERT_EQ(r.value().size(), 1u);
        EXPECT_TRUE(r.value().front().is_loopback());
    }

}  // namespace
