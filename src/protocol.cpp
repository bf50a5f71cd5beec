#include "conduit/protocol.hpp"

#include <algorithm>
#include <cctype>

#include "conduit/byte_options.hpp"

namespace conduit {

    namespace {

        constexpr Protocol kAlpnProtocols[] = {
            Protocol::Http10, Protocol::Http11, Protocol::H2PriorKnowledge,
            Protocol::Http2};

        const ByteOptions& alpn_options() {
            static const ByteOptions options =
                // "h2_prior_knowledge" is listed before its prefix "h2" so
                // that both stay selectable.
                ByteOptions::of({"http/1.0", "http/1.1", "h2_prior_knowledge",
                                 "h2"})
                    .value();
            return options;
        }

        std::string lower(std::string_view s) {
            std::string out(s);
            std::transform(out.begin(), out.end(), out.begin(),
                           [](unsigned char c) { return std::tolower(c); });
            return out;
        }

    }  // namespace

    const char* to_string(Protocol p) noexcept {
        switch (p) {
            case Protocol::Http10:
                return "http/1.0";
            case Protocol::Http11:
                return "http/1.1";
            case Protocol::Http2:
                return "h2";
            case Protocol::H2PriorKnowledge:
                return "h2_prior_knowledge";
        }
        return "http/1.1";
    }

    std::optional<Protocol> protocol_from_alpn(std::string_view alpn) {
        const auto& options = alpn_options();
        const int index = options.select(alpn);
        if (index < 0 ||
            options[static_cast<std::size_t>(index)].size() != alpn.size()) {
            return std::nullopt;
        }
        return kAlpnProtocols[index];
    }

    bool Handshake::covers_host(std::string_view host) const {
        const std::string h = lower(host);
        for (const auto& raw : peer_names) {
            const std::string name = lower(raw);
            if (name == h) return true;
            if (name.size() > 2 && name.compare(0, 2, "*.") == 0) {
                // "*.example.com" covers exactly one extra label.
                const std::string_view suffix =
                    std::string_view(name).substr(1);
                if (h.size() > suffix.size() &&
                    h.compare(h.size() - suffix.size(), suffix.size(),
                              suffix) == 0 &&
                    h.find('.') == h.size() - suffix.size()) {
                    return true;
                }
            }
        }
        return false;
    }

}  // namespace conduit
