#include "Crypto.hpp"
#include <sodium.h>
#include <mutex>
#include <stdexcept>
#include <spdlog/spdlog.h>

static_assert(Crypto::SHA256_BYTES == crypto_hash_sha256_BYTES, "SHA-256 digest size mismatch");

void Crypto::ensureInitialized() {
    static std::once_flag once;
    static int rc = 0;

    std::call_once(once, [] {
        rc = sodium_init();
        if (rc < 0)
            spdlog::critical("sodium_init failed; no cryptographic services available");
        else
            spdlog::debug("libsodium initialized (rc={})", rc);
    });

    if (rc < 0)
        throw std::runtime_error("libsodium initialization failed");
}

std::vector<unsigned char> Crypto::randomBytes(std::size_t count) {
    ensureInitialized();

    std::vector<unsigned char> out(count);
    if (count > 0)
        randombytes_buf(out.data(), out.size());
    return out;
}

std::string Crypto::sha256Hex(const std::string& data) {
    ensureInitialized();

    std::vector<unsigned char> digest(crypto_hash_sha256_BYTES);
    if (crypto_hash_sha256(digest.data(),
        reinterpret_cast<const unsigned char*>(data.data()),
        static_cast<unsigned long long>(data.size())) != 0)
    {
        spdlog::error("crypto_hash_sha256 failed");
        throw std::runtime_error("crypto_hash_sha256 failed");
    }

    std::string hex = toHex(digest);
    sodium_memzero(digest.data(), digest.size());
    return hex;
}

std::string Crypto::toHex(const std::vector<unsigned char>& bytes) {
    ensureInitialized();

    std::string hex(bytes.size() * 2 + 1, '\0');
    sodium_bin2hex(&hex[0], hex.size(), bytes.data(), bytes.size());
    hex.resize(bytes.size() * 2);
    return hex;
}

std::string Crypto::toBase64Url(const std::vector<unsigned char>& bytes) {
    ensureInitialized();

    const int variant = sodium_base64_VARIANT_URLSAFE_NO_PADDING;
    const std::size_t maxLen = sodium_base64_ENCODED_LEN(bytes.size(), variant);

    std::string b64(maxLen, '\0');
    sodium_bin2base64(&b64[0], b64.size(), bytes.data(), bytes.size(), variant);
    // encoded length includes the terminating NUL
    b64.resize(maxLen - 1);
    return b64;
}

bool Crypto::constantTimeEquals(const std::string& actual, const std::string& expected) {
    const std::size_t n = expected.size();
    std::size_t diff = actual.size() ^ n;

    for (std::size_t i = 0; i < n; ++i) {
        // past the end of a shorter `actual`, keep iterating against a fixed byte
        const unsigned char a = i < actual.size() ? static_cast<unsigned char>(actual[i]) : 0;
        diff |= static_cast<std::size_t>(a ^ static_cast<unsigned char>(expected[i]));
    }

    return diff == 0;
}
