#include "Lockout.hpp"

std::string Lockout::lockoutKey(const std::string& userId) {
    return "lockout:" + userId;
}

bool Lockout::isLockoutExpired(Clock::time_point lockoutTime, Clock::time_point now) {
    return now - lockoutTime >= LockoutPolicy::LOCKOUT_DURATION;
}
