#pragma once
#include <string>
#include <ctime>

class User {
public:
    User() = default;
    User(const std::string& user, const std::string& hash);

    std::string username;
    std::string pin_hash;         // "salt:hash", or a bare legacy hash awaiting upgrade
    int failed_attempts = 0;
    std::time_t locked_at = 0;    // 0 when not locked
    std::time_t created_at = 0;

    bool isLocked() const { return locked_at != 0; }
};
