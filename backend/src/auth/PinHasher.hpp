#pragma once

#include <string>
#include <optional>
#include <cstddef>
#include "Credential.hpp"

// PIN hashing with backward compatibility for unsalted legacy hashes.
//
// createSaltedCredential() and verifyCredential() are the lifecycle entry
// points; the remaining functions are building blocks.
class PinHasher {
public:
    static constexpr std::size_t SALT_BYTES = 16;
    static constexpr std::size_t SALT_HEX_LEN = SALT_BYTES * 2;   // 32
    static constexpr std::size_t HASH_HEX_LEN = 64;               // SHA-256

    static std::string generateSalt();

    static std::string hashWithSalt(const std::string& pin, const std::string& salt);
    static bool verifyWithSalt(const std::string& pin, const std::string& salt,
                               const std::string& expectedHash);

    // Verification of historical credentials only. Never used to set one.
    static std::string hashLegacy(const std::string& pin);

    static bool isSaltedFormat(const std::string& stored);
    static bool isLegacyFormat(const std::string& stored);   // 64 lowercase hex
    static std::optional<SaltedCredential> parseSalted(const std::string& stored);
    static StoredCredential parseStored(const std::string& stored);

    static std::string createSaltedCredential(const std::string& pin);

    // needs_upgrade is only ever set for a legacy hash that verified.
    static VerifyResult verifyCredential(const std::string& pin, const std::string& stored);

    // Input shape checks used before a PIN or username reaches the hasher.
    static bool isValidPin(const std::string& pin);
    static bool isValidUsername(const std::string& name);
};
