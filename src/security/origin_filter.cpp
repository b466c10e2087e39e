#include "security/origin_filter.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>

#include <format>
#include <stdexcept>

namespace urlrelay {

namespace {

constexpr uint64_t kIpv4MappedHi = 0;
constexpr uint64_t kIpv4MappedLoPrefix = 0x0000FFFF00000000ull;

// Mask with the top `prefix` bits of a 128-bit value set
OriginFilter::Address prefix_mask(uint32_t prefix) {
    OriginFilter::Address mask;
    if (prefix >= 64) {
        mask.hi = ~0ull;
        const uint32_t rest = prefix - 64;
        mask.lo = (rest == 0) ? 0ull : (rest >= 64 ? ~0ull : ~((1ull << (64 - rest)) - 1));
    } else {
        mask.hi = (prefix == 0) ? 0ull : ~((1ull << (64 - prefix)) - 1);
        mask.lo = 0;
    }
    return mask;
}

bool is_ipv4_literal(std::string_view ip) {
    return ip.find(':') == std::string_view::npos;
}

} // anonymous namespace

OriginFilter::OriginFilter(const std::vector<std::string>& ranges) {
    ranges_.reserve(ranges.size());
    for (const auto& entry : ranges) {
        Range range;
        if (!parse_range(entry, range)) {
            throw std::invalid_argument(std::format("Invalid allowed range: '{}'", entry));
        }
        ranges_.push_back(range);
    }
}

bool OriginFilter::parse_ipv4(std::string_view ip, uint32_t& out) {
    uint32_t octets[4]{};
    size_t octet_idx = 0;
    uint32_t val = 0;
    size_t digits = 0;

    for (size_t i = 0; i <= ip.size(); ++i) {
        if (i == ip.size() || ip[i] == '.') {
            if (digits == 0 || val > 255 || octet_idx > 3) return false;
            octets[octet_idx++] = val;
            val = 0;
            digits = 0;
        } else if (ip[i] >= '0' && ip[i] <= '9') {
            if (++digits > 3) return false;
            val = val * 10 + static_cast<uint32_t>(ip[i] - '0');
        } else {
            return false;
        }
    }
    if (octet_idx != 4) return false;
    out = (octets[0] << 24) | (octets[1] << 16) | (octets[2] << 8) | octets[3];
    return true;
}

bool OriginFilter::parse_address(std::string_view ip, Address& out) {
    if (ip.size() >= 2 && ip.front() == '[' && ip.back() == ']') {
        ip = ip.substr(1, ip.size() - 2);
    }
    if (ip.empty()) return false;

    if (is_ipv4_literal(ip)) {
        uint32_t v4 = 0;
        if (!parse_ipv4(ip, v4)) return false;
        out.hi = kIpv4MappedHi;
        out.lo = kIpv4MappedLoPrefix | v4;
        return true;
    }

    // Drop an interface scope ("fe80::1%eth0"); it does not affect the prefix
    if (const auto pct = ip.find('%'); pct != std::string_view::npos) {
        ip = ip.substr(0, pct);
    }
    if (ip.size() >= INET6_ADDRSTRLEN) return false;

    char buf[INET6_ADDRSTRLEN]{};
    ip.copy(buf, ip.size());
    in6_addr addr{};
    if (::inet_pton(AF_INET6, buf, &addr) != 1) return false;

    out.hi = 0;
    out.lo = 0;
    for (int i = 0; i < 8; ++i) out.hi = (out.hi << 8) | addr.s6_addr[i];
    for (int i = 8; i < 16; ++i) out.lo = (out.lo << 8) | addr.s6_addr[i];
    return true;
}

bool OriginFilter::parse_range(std::string_view cidr, Range& out) {
    if (cidr == "*" || cidr == "all") {
        out.network = Address{};
        out.mask = Address{};
        return true;
    }

    const auto slash = cidr.find('/');
    const auto addr_part = cidr.substr(0, slash);
    if (!parse_address(addr_part, out.network)) return false;

    const bool v4 = is_ipv4_literal(addr_part);
    const uint32_t max_prefix = v4 ? 32 : 128;

    uint32_t prefix = max_prefix;  // No prefix → exact host match
    if (slash != std::string_view::npos) {
        const auto digits = cidr.substr(slash + 1);
        if (digits.empty() || digits.size() > 3) return false;
        prefix = 0;
        for (const char c : digits) {
            if (c < '0' || c > '9') return false;
            prefix = prefix * 10 + static_cast<uint32_t>(c - '0');
        }
        if (prefix > max_prefix) return false;
    }

    out.mask = prefix_mask(v4 ? prefix + 96 : prefix);
    // normalize (host bits are ignored, not rejected)
    out.network.hi &= out.mask.hi;
    out.network.lo &= out.mask.lo;
    return true;
}

bool OriginFilter::matches(const Address& ip, const Range& range) {
    return (ip.hi & range.mask.hi) == range.network.hi &&
           (ip.lo & range.mask.lo) == range.network.lo;
}

bool OriginFilter::is_allowed(std::string_view address) const {
    if (ranges_.empty()) return false;

    Address client;
    if (!parse_address(address, client)) return false;

    for (const auto& range : ranges_) {
        if (matches(client, range)) return true;
    }
    return false;
}

} // namespace urlrelay
