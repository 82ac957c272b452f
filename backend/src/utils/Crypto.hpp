#pragma once
#include <string>
#include <vector>
#include <cstddef>

// Thin wrappers over libsodium shared by the credential and token code.
//
// Every function calls ensureInitialized() first. If libsodium cannot be
// initialised the environment has no usable CSPRNG, so that is reported as
// std::runtime_error instead of a negative result.

class Crypto {
public:
    static constexpr std::size_t SHA256_BYTES = 32;

    static void ensureInitialized();

    static std::vector<unsigned char> randomBytes(std::size_t count);

    // Lowercase hex SHA-256 of the raw bytes of `data`.
    static std::string sha256Hex(const std::string& data);

    static std::string toHex(const std::vector<unsigned char>& bytes);
    static std::string toBase64Url(const std::vector<unsigned char>& bytes); // no padding

    // Fixed-iteration comparison over the full length of `expected`.
    // A length mismatch is reported as false after the loop has still run.
    static bool constantTimeEquals(const std::string& actual, const std::string& expected);
};
