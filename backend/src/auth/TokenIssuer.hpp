#pragma once
#include <string>
#include <chrono>
#include <cstddef>

// Session expiry policy. The session store enforces it; nothing here keeps a clock.
struct SessionPolicy {
    static constexpr std::chrono::minutes IDLE_TIMEOUT{ 30 };
    static constexpr std::chrono::hours MAX_AGE{ 8 };
    static constexpr std::size_t TOKEN_LENGTH = 32;   // bytes
};

// Double-submit cookie parameters for anti-forgery tokens.
struct CsrfPolicy {
    static constexpr const char* COOKIE_NAME = "csrf_token";
    static constexpr const char* HEADER_NAME = "X-CSRF-Token";
    static constexpr std::chrono::hours COOKIE_MAX_AGE{ 24 };
    static constexpr std::size_t TOKEN_LENGTH = 32;
};

class TokenIssuer {
public:
    using Clock = std::chrono::system_clock;

    // Random bytes as URL-safe base64 without padding ([A-Za-z0-9_-]).
    // Throws std::invalid_argument for byteLength == 0.
    static std::string generateToken(std::size_t byteLength = SessionPolicy::TOKEN_LENGTH);

    static std::string generateSessionToken();
    static std::string generateCsrfToken();

    // SHA-256 hex; the only form a token should be persisted in.
    static std::string hashToken(const std::string& token);

    // Expired once either the idle window or the absolute window has elapsed.
    static bool isSessionExpired(Clock::time_point createdAt,
                                 Clock::time_point lastActivity,
                                 Clock::time_point now = Clock::now());

    static bool csrfTokensMatch(const std::string& cookieToken, const std::string& headerToken);

    // State-changing API requests, minus routes authenticated by other means.
    static bool shouldProtectRoute(const std::string& method, const std::string& path);
};
