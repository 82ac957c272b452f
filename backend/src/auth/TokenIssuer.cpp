#include "TokenIssuer.hpp"
#include "../utils/Crypto.hpp"
#include <stdexcept>
#include <sodium.h>
#include <spdlog/spdlog.h>

static const char* const PROTECTED_METHODS[] = { "POST", "PUT", "PATCH", "DELETE" };

static const char* const EXEMPT_ROUTES[] = {
    "/api/outlook/",    // API key auth
    "/api/webhooks/",   // signature verification
    "/api/csp-report",
};

static bool startsWith(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

std::string TokenIssuer::generateToken(std::size_t byteLength) {
    if (byteLength == 0)
        throw std::invalid_argument("token byte length must be positive");

    auto bytes = Crypto::randomBytes(byteLength);
    std::string token = Crypto::toBase64Url(bytes);
    sodium_memzero(bytes.data(), bytes.size());

    spdlog::debug("Issued token of {} bytes", byteLength);
    return token;
}

std::string TokenIssuer::generateSessionToken() {
    return generateToken(SessionPolicy::TOKEN_LENGTH);
}

std::string TokenIssuer::generateCsrfToken() {
    return generateToken(CsrfPolicy::TOKEN_LENGTH);
}

std::string TokenIssuer::hashToken(const std::string& token) {
    return Crypto::sha256Hex(token);
}

bool TokenIssuer::isSessionExpired(Clock::time_point createdAt,
                                   Clock::time_point lastActivity,
                                   Clock::time_point now) {
    if (now - lastActivity >= SessionPolicy::IDLE_TIMEOUT)
        return true;
    return now - createdAt >= SessionPolicy::MAX_AGE;
}

bool TokenIssuer::csrfTokensMatch(const std::string& cookieToken, const std::string& headerToken) {
    if (cookieToken.empty() || headerToken.empty()) {
        spdlog::debug("CSRF check failed: missing cookie or header token");
        return false;
    }

    // comparing fixed-length digests keeps the timing independent of token length
    return Crypto::constantTimeEquals(hashToken(headerToken), hashToken(cookieToken));
}

bool TokenIssuer::shouldProtectRoute(const std::string& method, const std::string& path) {
    bool stateChanging = false;
    for (const char* m : PROTECTED_METHODS)
        if (method == m) { stateChanging = true; break; }

    if (!stateChanging)
        return false;

    for (const char* exempt : EXEMPT_ROUTES)
        if (startsWith(path, exempt)) return false;

    return startsWith(path, "/api/");
}
