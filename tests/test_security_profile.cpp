#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <unordered_set>
#include <vector>

#include "conduit/security_profile.hpp"

using namespace conduit;

namespace {

    /// @brief Records what a profile applies to it.
    class FakeTlsSocket final : public TlsSocket {
       public:
        std::vector<std::string> enabled_suites;
        std::vector<std::string> supported_suites;
        std::vector<TlsVersion> enabled_versions;
        int set_calls{0};

        std::vector<std::string> enabled_cipher_suites() const override {
            return enabled_suites;
        }
        std::vector<std::string> supported_cipher_suites() const override {
            return supported_suites;
        }
        std::vector<TlsVersion> enabled_protocols() const override {
            return enabled_versions;
        }

        Status set_enabled_cipher_suites(
            const std::vector<std::string>& suites) override {
            ++set_calls;
            enabled_suites = suites;
            return ok_status();
        }
        Status set_enabled_protocols(
            const std::vector<TlsVersion>& versions) override {
            ++set_calls;
            enabled_versions = versions;
            return ok_status();
        }
    };

    FakeTlsSocket socket_with(std::vector<std::string> suites,
                              std::vector<TlsVersion> versions) {
        FakeTlsSocket s;
        s.enabled_suites = suites;
        s.supported_suites = std::move(suites);
        s.enabled_versions = std::move(versions);
        return s;
    }

    TEST(SecurityProfileTest, PresetsAreOrderedByRestriction) {
        EXPECT_FALSE(ConnectionSecurityProfile::cleartext().is_tls());
        EXPECT_TRUE(ConnectionSecurityProfile::restricted_tls().is_tls());

        const auto& restricted =
            *ConnectionSecurityProfile::restricted_tls().tls_versions();
        const auto& modern =
            *ConnectionSecurityProfile::modern_tls().tls_versions();
        const auto& compatible =
            *ConnectionSecurityProfile::compatible_tls().tls_versions();
        EXPECT_EQ(restricted, (std::vector<TlsVersion>{TlsVersion::Tls13,
                                                       TlsVersion::Tls12}));
        EXPECT_EQ(modern.size(), 4u);
        EXPECT_EQ(compatible, std::vector<TlsVersion>{TlsVersion::Tls10});

        EXPECT_LT(
            ConnectionSecurityProfile::restricted_tls().cipher_suites()->size(),
            ConnectionSecurityProfile::modern_tls().cipher_suites()->size());
        EXPECT_EQ(*ConnectionSecurityProfile::modern_tls().cipher_suites(),
                  *ConnectionSecurityProfile::compatible_tls().cipher_suites());
    }

    TEST(SecurityProfileTest, CleartextRejectsTlsOptions) {
        EXPECT_THROW(ConnectionSecurityProfile(
                         false, std::vector<std::string>{"TLS_AES_128_GCM_SHA256"},
                         std::nullopt, false),
                     std::logic_error);
        EXPECT_THROW(ConnectionSecurityProfile(false, std::nullopt,
                                               std::vector<TlsVersion>{
                                                   TlsVersion::Tls12},
                                               false),
                     std::logic_error);
        EXPECT_THROW(
            ConnectionSecurityProfile(false, std::nullopt, std::nullopt, true),
            std::logic_error);
    }

    TEST(SecurityProfileTest, EmptyListsAreRejected) {
        EXPECT_THROW(ConnectionSecurityProfile(
                         true, std::vector<std::string>{}, std::nullopt, true),
                     std::invalid_argument);
        EXPECT_THROW(ConnectionSecurityProfile(true, std::nullopt,
                                               std::vector<TlsVersion>{}, true),
                     std::invalid_argument);
    }

    TEST(SecurityProfileTest, NegotiateKeepsProfileOrder) {
        // Socket order is reversed and holds one suite the profile lacks.
        auto socket = socket_with(
            {"TLS_RSA_WITH_AES_128_CBC_SHA", "TLS_UNKNOWN_SUITE",
             "TLS_ECDHE_RSA_WITH_AES_128_GCM_SHA256", "TLS_AES_128_GCM_SHA256"},
            {TlsVersion::Tls10, TlsVersion::Tls12});

        const auto& profile = ConnectionSecurityProfile::modern_tls();
        ASSERT_TRUE(profile.negotiate(socket, false).has_value());

        const std::vector<std::string> expected = {
            "TLS_AES_128_GCM_SHA256", "TLS_ECDHE_RSA_WITH_AES_128_GCM_SHA256",
            "TLS_RSA_WITH_AES_128_CBC_SHA"};
        EXPECT_EQ(socket.enabled_suites, expected);
        EXPECT_EQ(socket.enabled_versions,
                  (std::vector<TlsVersion>{TlsVersion::Tls12,
                                           TlsVersion::Tls10}));
    }

    TEST(SecurityProfileTest, NegotiateLosesNoCommonSuite) {
        const auto& all = *ConnectionSecurityProfile::modern_tls().cipher_suites();
        std::vector<std::string> subset;
        for (std::size_t i = 0; i < all.size(); i += 2) subset.push_back(all[i]);

        auto socket = socket_with(subset, {TlsVersion::Tls12});
        ASSERT_TRUE(ConnectionSecurityProfile::modern_tls()
                        .negotiate(socket, false)
                        .has_value());
        EXPECT_EQ(socket.enabled_suites, subset);
    }

    TEST(SecurityProfileTest, CipherPrefixesAreInterchangeable) {
        auto socket = socket_with({"SSL_RSA_WITH_AES_128_CBC_SHA"},
                                  {TlsVersion::Tls12});
        ConnectionSecurityProfile profile(
            true, std::vector<std::string>{"TLS_RSA_WITH_AES_128_CBC_SHA"},
            std::nullopt, true);

        EXPECT_TRUE(profile.is_compatible(socket));
        ASSERT_TRUE(profile.negotiate(socket, false).has_value());
        // Spelled the way the socket spells it.
        EXPECT_EQ(socket.enabled_suites,
                  std::vector<std::string>{"SSL_RSA_WITH_AES_128_CBC_SHA"});
    }

    TEST(SecurityProfileTest, AllEnabledPassesSocketListsThrough) {
        auto socket = socket_with({"B", "A"}, {TlsVersion::Tls11});
        ConnectionSecurityProfile profile(true, std::nullopt, std::nullopt,
                                          false);

        ASSERT_TRUE(profile.negotiate(socket, false).has_value());
        EXPECT_EQ(socket.enabled_suites, (std::vector<std::string>{"B", "A"}));
        EXPECT_EQ(socket.enabled_versions,
                  std::vector<TlsVersion>{TlsVersion::Tls11});
    }

    TEST(SecurityProfileTest, FallbackAppendsScsvWhenSupported) {
        auto socket = socket_with({"TLS_AES_128_GCM_SHA256"},
                                  {TlsVersion::Tls13});
        socket.supported_suites.push_back(std::string(kFallbackScsv));

        ASSERT_TRUE(ConnectionSecurityProfile::restricted_tls()
                        .negotiate(socket, true)
                        .has_value());
        const std::vector<std::string> expected = {"TLS_AES_128_GCM_SHA256",
                                                   "TLS_FALLBACK_SCSV"};
        EXPECT_EQ(socket.enabled_suites, expected);
    }

    TEST(SecurityProfileTest, FallbackWithoutScsvSupportAddsNothing) {
        auto socket = socket_with({"TLS_AES_128_GCM_SHA256"},
                                  {TlsVersion::Tls13});

        ASSERT_TRUE(ConnectionSecurityProfile::restricted_tls()
                        .negotiate(socket, true)
                        .has_value());
        EXPECT_EQ(socket.enabled_suites,
                  std::vector<std::string>{"TLS_AES_128_GCM_SHA256"});
    }

    TEST(SecurityProfileTest, FirstAttemptNeverSendsScsv) {
        auto socket = socket_with({"TLS_AES_128_GCM_SHA256"},
                                  {TlsVersion::Tls13});
        socket.supported_suites.push_back(std::string(kFallbackScsv));

        ASSERT_TRUE(ConnectionSecurityProfile::restricted_tls()
                        .negotiate(socket, false)
                        .has_value());
        EXPECT_EQ(socket.enabled_suites,
                  std::vector<std::string>{"TLS_AES_128_GCM_SHA256"});
    }

    TEST(SecurityProfileTest, NegotiateFailsWithNothingInCommon) {
        auto socket = socket_with({"TLS_RSA_WITH_NULL_MD5"}, {TlsVersion::Tls12});
        auto st = ConnectionSecurityProfile::restricted_tls().negotiate(socket,
                                                                       false);
        ASSERT_TRUE(st.has_error());
        EXPECT_EQ(st.error().code, Error::Code::TlsHandshakeFailed);
        EXPECT_EQ(socket.set_calls, 0);

        auto old_socket = socket_with({"TLS_AES_128_GCM_SHA256"},
                                      {TlsVersion::Tls10});
        st = ConnectionSecurityProfile::restricted_tls().negotiate(old_socket,
                                                                  false);
        ASSERT_TRUE(st.has_error());
        EXPECT_EQ(old_socket.set_calls, 0);
    }

    TEST(SecurityProfileTest, CleartextCannotNegotiate) {
        auto socket = socket_with({"TLS_AES_128_GCM_SHA256"},
                                  {TlsVersion::Tls13});
        auto st = ConnectionSecurityProfile::cleartext().negotiate(socket, false);
        ASSERT_TRUE(st.has_error());
        EXPECT_EQ(st.error().code, Error::Code::IllegalState);
    }

    TEST(SecurityProfileTest, Compatibility) {
        auto modern_socket = socket_with({"TLS_AES_128_GCM_SHA256"},
                                         {TlsVersion::Tls13, TlsVersion::Tls12});
        auto legacy_socket = socket_with({"TLS_RSA_WITH_AES_128_CBC_SHA"},
                                         {TlsVersion::Tls10});

        EXPECT_FALSE(
            ConnectionSecurityProfile::cleartext().is_compatible(modern_socket));
        EXPECT_TRUE(ConnectionSecurityProfile::restricted_tls().is_compatible(
            modern_socket));
        EXPECT_FALSE(ConnectionSecurityProfile::compatible_tls().is_compatible(
            modern_socket));

        EXPECT_FALSE(ConnectionSecurityProfile::restricted_tls().is_compatible(
            legacy_socket));
        EXPECT_TRUE(ConnectionSecurityProfile::compatible_tls().is_compatible(
            legacy_socket));

        ConnectionSecurityProfile any(true, std::nullopt, std::nullopt, false);
        EXPECT_TRUE(any.is_compatible(legacy_socket));
    }

    TEST(SecurityProfileTest, SupportedProfileDoesNotTouchSocket) {
        auto socket = socket_with({"TLS_AES_128_GCM_SHA256"},
                                  {TlsVersion::Tls13});
        auto applied = ConnectionSecurityProfile::modern_tls().supported_profile(
            socket, false);
        EXPECT_EQ(socket.set_calls, 0);
        EXPECT_EQ(*applied.tls_versions(),
                  std::vector<TlsVersion>{TlsVersion::Tls13});
        EXPECT_TRUE(applied.supports_tls_extensions());
    }

    TEST(SecurityProfileTest, EqualityAndHash) {
        ConnectionSecurityProfile a(
            true, std::vector<std::string>{"TLS_AES_128_GCM_SHA256"},
            std::vector<TlsVersion>{TlsVersion::Tls13}, true);
        ConnectionSecurityProfile b = a;
        ConnectionSecurityProfile c(
            true, std::vector<std::string>{"TLS_AES_128_GCM_SHA256"},
            std::vector<TlsVersion>{TlsVersion::Tls13}, false);

        EXPECT_EQ(a, b);
        EXPECT_EQ(a.hash(), b.hash());
        EXPECT_NE(a, c);

        std::unordered_set<ConnectionSecurityProfile> set{a, b, c};
        EXPECT_EQ(set.size(), 2u);
        EXPECT_EQ(ConnectionSecurityProfile::cleartext(),
                  ConnectionSecurityProfile(false, std::nullopt, std::nullopt,
                                            false));
    }

    TEST(SecurityProfileTest, ToStringNamesVersionsAndSuites) {
        const std::string s =
            ConnectionSecurityProfile::restricted_tls().to_string();
        EXPECT_NE(s.find("TLSv1.3"), std::string::npos);
        EXPECT_NE(s.find("TLS_AES_128_GCM_SHA256"), std::string::npos);
        EXPECT_NE(s.find("supportsTlsExtensions=true"), std::string::npos);
        EXPECT_EQ(ConnectionSecurityProfile::cleartext().to_string(),
                  "ConnectionSecurityProfile()");
    }

    TEST(SecurityProfileTest, VersionNames) {
        EXPECT_EQ(tls_version_from_string("TLSv1.2"), TlsVersion::Tls12);
        EXPECT_EQ(tls_version_from_string("TLSv1"), TlsVersion::Tls10);
        EXPECT_EQ(tls_version_from_string("TLSv1.0"), TlsVersion::Tls10);
        EXPECT_FALSE(tls_version_from_string("TLSv9").has_value());
        EXPECT_STREQ(to_string(TlsVersion::Tls13), "TLSv1.3");
    }

}  // namespace
