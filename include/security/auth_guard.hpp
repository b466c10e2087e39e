#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace urlrelay {

/**
 * @brief Shared-token check with constant-time comparison
 *
 * Both the configured secret and the presented token are reduced to
 * SHA-256 digests and compared with CRYPTO_memcmp, so the comparison time
 * depends on neither the matching prefix length nor the presented length.
 *
 * There is no lockout or backoff: the origin filter is the trust boundary.
 */
class AuthGuard {
public:
    static constexpr size_t kDigestSize = 32;
    using Digest = std::array<uint8_t, kDigestSize>;

    /**
     * @throws std::invalid_argument if secret is empty
     */
    explicit AuthGuard(std::string_view secret);

    /**
     * @brief Verify a presented token
     * @return false for empty or non-matching tokens
     */
    [[nodiscard]] bool verify(std::string_view presented) const;

private:
    static Digest digest(std::string_view data);

    Digest secret_digest_{};
};

} // namespace urlrelay
