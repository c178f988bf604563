#pragma once

#include "core/from_text.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace motya {

/**
 * @brief IP address plus port, "10.0.0.1:8080" or "[::1]:8443"
 *
 * IPv4 hosts must be four dotted decimal octets, IPv6 hosts must be
 * bracketed. The textual form is normalized (compressed IPv6).
 */
class SocketAddress {
public:
    enum class Family {
        IPV4,
        IPV6
    };

    SocketAddress() = default;

    static bool parse(std::string_view text, SocketAddress& out, std::string& reason);

    /// Dotted-quad parser; rejects leading zeros, empty octets and values > 255.
    static bool parse_ipv4(std::string_view ip, uint32_t& out);

    [[nodiscard]] Family family() const { return family_; }
    [[nodiscard]] const std::string& host() const { return host_; }
    [[nodiscard]] uint16_t port() const { return port_; }

    [[nodiscard]] std::string to_string() const;

    bool operator==(const SocketAddress&) const = default;

private:
    Family family_ = Family::IPV4;
    std::string host_;
    uint16_t port_ = 0;
};

template<>
struct FromText<SocketAddress> {
    static constexpr std::string_view type_name = "SocketAddr";

    static bool parse(std::string_view text, SocketAddress& out, std::string& reason) {
        return SocketAddress::parse(text, out, reason);
    }
};

} // namespace motya
