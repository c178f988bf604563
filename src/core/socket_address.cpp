#include "core/socket_address.hpp"
#include "core/utils.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>

#include <format>

namespace motya {

namespace {

constexpr const char* kSyntaxError = "invalid socket address syntax";

bool parse_port(std::string_view text, uint16_t& out) {
    if (text.empty() || text.size() > 5) return false;
    if (text.size() > 1 && text.front() == '0') return false;
    const auto port = utils::try_parse_int<uint16_t>(text);
    if (!port) return false;
    out = *port;
    return true;
}

} // anonymous namespace

bool SocketAddress::parse_ipv4(std::string_view ip, uint32_t& out) {
    uint32_t octets[4]{};
    size_t octet_idx = 0;
    uint32_t val = 0;
    size_t digits = 0;
    bool leading_zero = false;

    for (size_t i = 0; i <= ip.size(); ++i) {
        if (i == ip.size() || ip[i] == '.') {
            if (digits == 0 || val > 255 || octet_idx > 3) return false;
            if (leading_zero && digits > 1) return false;
            octets[octet_idx++] = val;
            val = 0;
            digits = 0;
            leading_zero = false;
        } else if (ip[i] >= '0' && ip[i] <= '9') {
            if (digits == 0 && ip[i] == '0') leading_zero = true;
            val = val * 10 + static_cast<uint32_t>(ip[i] - '0');
            if (++digits > 3) return false;
        } else {
            return false;
        }
    }
    if (octet_idx != 4) return false;
    out = (octets[0] << 24) | (octets[1] << 16) | (octets[2] << 8) | octets[3];
    return true;
}

bool SocketAddress::parse(std::string_view text, SocketAddress& out, std::string& reason) {
    SocketAddress addr;

    if (!text.empty() && text.front() == '[') {
        const auto close = text.find("]:");
        if (close == std::string_view::npos) {
            reason = kSyntaxError;
            return false;
        }
        const std::string host(text.substr(1, close - 1));
        in6_addr raw{};
        if (host.empty() || ::inet_pton(AF_INET6, host.c_str(), &raw) != 1) {
            reason = kSyntaxError;
            return false;
        }
        char buf[INET6_ADDRSTRLEN]{};
        if (::inet_ntop(AF_INET6, &raw, buf, sizeof(buf)) == nullptr) {
            reason = kSyntaxError;
            return false;
        }
        if (!parse_port(text.substr(close + 2), addr.port_)) {
            reason = kSyntaxError;
            return false;
        }
        addr.family_ = Family::IPV6;
        addr.host_ = buf;
        out = std::move(addr);
        return true;
    }

    const auto colon = text.rfind(':');
    if (colon == std::string_view::npos) {
        reason = kSyntaxError;
        return false;
    }
    uint32_t ip = 0;
    if (!parse_ipv4(text.substr(0, colon), ip) || !parse_port(text.substr(colon + 1), addr.port_)) {
        reason = kSyntaxError;
        return false;
    }
    addr.family_ = Family::IPV4;
    addr.host_ = std::format("{}.{}.{}.{}", ip >> 24, (ip >> 16) & 0xFF, (ip >> 8) & 0xFF, ip & 0xFF);
    out = std::move(addr);
    return true;
}

std::string SocketAddress::to_string() const {
    if (family_ == Family::IPV6) {
        return std::format("[{}]:{}", host_, port_);
    }
    return std::format("{}:{}", host_, port_);
}

} // namespace motya
