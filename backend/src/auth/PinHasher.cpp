#include "PinHasher.hpp"
#include "../utils/Crypto.hpp"
#include <cctype>
#include <spdlog/spdlog.h>

static bool isLowerHex(const std::string& s, std::size_t from, std::size_t len) {
    for (std::size_t i = from; i < from + len; ++i) {
        const char c = s[i];
        if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f')))
            return false;
    }
    return true;
}

std::string PinHasher::generateSalt() {
    return Crypto::toHex(Crypto::randomBytes(SALT_BYTES));
}

std::string PinHasher::hashWithSalt(const std::string& pin, const std::string& salt) {
    return Crypto::sha256Hex(salt + ":" + pin);
}

bool PinHasher::verifyWithSalt(const std::string& pin, const std::string& salt,
                               const std::string& expectedHash) {
    const std::string inputHash = hashWithSalt(pin, salt);
    return Crypto::constantTimeEquals(inputHash, expectedHash);
}

std::string PinHasher::hashLegacy(const std::string& pin) {
    return Crypto::sha256Hex(pin);
}

bool PinHasher::isSaltedFormat(const std::string& stored) {
    if (stored.size() != SALT_HEX_LEN + 1 + HASH_HEX_LEN)
        return false;
    if (stored[SALT_HEX_LEN] != ':')
        return false;
    return isLowerHex(stored, 0, SALT_HEX_LEN)
        && isLowerHex(stored, SALT_HEX_LEN + 1, HASH_HEX_LEN);
}

bool PinHasher::isLegacyFormat(const std::string& stored) {
    return stored.size() == HASH_HEX_LEN && isLowerHex(stored, 0, HASH_HEX_LEN);
}

std::optional<SaltedCredential> PinHasher::parseSalted(const std::string& stored) {
    if (!isSaltedFormat(stored))
        return std::nullopt;

    SaltedCredential cred;
    cred.salt = stored.substr(0, SALT_HEX_LEN);
    cred.hash = stored.substr(SALT_HEX_LEN + 1);
    return cred;
}

StoredCredential PinHasher::parseStored(const std::string& stored) {
    if (auto salted = parseSalted(stored))
        return *salted;
    return LegacyCredential{ stored };
}

std::string PinHasher::createSaltedCredential(const std::string& pin) {
    spdlog::debug("Creating salted credential (not logging the PIN)");

    SaltedCredential cred;
    cred.salt = generateSalt();
    cred.hash = hashWithSalt(pin, cred.salt);
    return cred.serialize();
}

namespace {

struct CredentialVerifier {
    const std::string& pin;

    VerifyResult operator()(const SaltedCredential& cred) const {
        VerifyResult r;
        r.valid = PinHasher::verifyWithSalt(pin, cred.salt, cred.hash);
        r.needs_upgrade = false;
        return r;
    }

    VerifyResult operator()(const LegacyCredential& cred) const {
        VerifyResult r;
        r.valid = Crypto::constantTimeEquals(PinHasher::hashLegacy(pin), cred.hash);
        // only a correct PIN may reveal that the record is upgradable
        r.needs_upgrade = r.valid;
        return r;
    }
};

} // namespace

VerifyResult PinHasher::verifyCredential(const std::string& pin, const std::string& stored) {
    const StoredCredential parsed = parseStored(stored);
    const VerifyResult r = std::visit(CredentialVerifier{ pin }, parsed);

    spdlog::debug("Credential verification: format={}, valid={}, needs_upgrade={}",
        std::holds_alternative<SaltedCredential>(parsed) ? "salted" : "legacy",
        r.valid, r.needs_upgrade);
    return r;
}

bool PinHasher::isValidPin(const std::string& pin) {
    if (pin.size() != 4)
        return false;
    for (char c : pin)
        if (c < '0' || c > '9') return false;
    return true;
}

bool PinHasher::isValidUsername(const std::string& name) {
    std::string t = name;
    while (!t.empty() && std::isspace((unsigned char)t.front())) t.erase(t.begin());
    while (!t.empty() && std::isspace((unsigned char)t.back())) t.pop_back();

    if (t.size() < 2 || t.size() > 30)
        return false;
    if (!std::isalpha((unsigned char)t.front()))
        return false;

    for (std::size_t i = 1; i < t.size(); ++i) {
        const unsigned char c = static_cast<unsigned char>(t[i]);
        if (!std::isalnum(c) && !std::isspace(c))
            return false;
    }
    return true;
}
