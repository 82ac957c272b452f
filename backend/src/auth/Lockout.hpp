#pragma once
#include <string>
#include <chrono>

// Failed-attempt lockout. The counter itself lives with whoever owns the
// user records (see AuthManager); these helpers are stateless.
struct LockoutPolicy {
    static constexpr int MAX_ATTEMPTS = 5;
    static constexpr std::chrono::minutes LOCKOUT_DURATION{ 15 };
};

class Lockout {
public:
    using Clock = std::chrono::system_clock;

    static std::string lockoutKey(const std::string& userId);

    static bool isLockoutExpired(Clock::time_point lockoutTime, Clock::time_point now = Clock::now());

    static bool shouldLock(int failedAttempts) { return failedAttempts >= LockoutPolicy::MAX_ATTEMPTS; }
};
