#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace urlrelay {

/**
 * @brief Network-range access control applied to every inbound connection
 *
 * All addresses are normalized to 128 bits: IPv4 becomes its IPv4-mapped
 * IPv6 form (::ffff:a.b.c.d), so an IPv4 range is a /96+N prefix and a
 * single bitwise comparison covers both families.
 *
 * Fail-closed: an empty range list denies every address. The entries "*"
 * and "all" explicitly allow everything.
 */
class OriginFilter {
public:
    struct Address {
        uint64_t hi = 0;
        uint64_t lo = 0;
    };

    struct Range {
        Address network;
        Address mask;
    };

    OriginFilter() = default;

    /**
     * @brief Parse every range once
     * @throws std::invalid_argument if an entry is not a valid CIDR
     */
    explicit OriginFilter(const std::vector<std::string>& ranges);

    static bool parse_ipv4(std::string_view ip, uint32_t& out);
    static bool parse_address(std::string_view ip, Address& out);
    static bool parse_range(std::string_view cidr, Range& out);
    static bool matches(const Address& ip, const Range& range);

    /**
     * @brief Check a peer address against the configured ranges
     * @param address Peer literal ("10.0.0.5", "::1", "::ffff:10.0.0.5")
     * @return false for unparsable addresses or when no range matches
     */
    [[nodiscard]] bool is_allowed(std::string_view address) const;

    [[nodiscard]] size_t range_count() const { return ranges_.size(); }

private:
    std::vector<Range> ranges_;
};

} // namespace urlrelay
