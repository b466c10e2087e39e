#include "security/auth_guard.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>

#include <stdexcept>

namespace urlrelay {

AuthGuard::AuthGuard(std::string_view secret) {
    if (secret.empty()) {
        throw std::invalid_argument("Shared token must not be empty");
    }
    secret_digest_ = digest(secret);
}

AuthGuard::Digest AuthGuard::digest(std::string_view data) {
    Digest out{};
    unsigned int len = 0;
    if (EVP_Digest(data.data(), data.size(), out.data(), &len, EVP_sha256(), nullptr) != 1 ||
        len != kDigestSize) {
        throw std::runtime_error("SHA-256 digest failed");
    }
    return out;
}

bool AuthGuard::verify(std::string_view presented) const {
    if (presented.empty()) return false;
    const Digest candidate = digest(presented);
    return CRYPTO_memcmp(candidate.data(), secret_digest_.data(), kDigestSize) == 0;
}

} // namespace urlrelay
