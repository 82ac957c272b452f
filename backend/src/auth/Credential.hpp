#pragma once
#include <string>
#include <variant>

// Stored PIN hash formats.
//
// Legacy: bare SHA-256 of the PIN, 64 lowercase hex chars. Only ever verified.
// Salted: "<32 hex salt>:<64 hex digest>", digest = SHA-256(salt + ":" + pin).
//
// A stored string that is not exactly the salted shape is treated as legacy.

struct LegacyCredential {
    std::string hash;
};

struct SaltedCredential {
    std::string salt;
    std::string hash;

    std::string serialize() const { return salt + ":" + hash; }
};

using StoredCredential = std::variant<LegacyCredential, SaltedCredential>;

struct VerifyResult {
    bool valid = false;
    bool needs_upgrade = false;
};
