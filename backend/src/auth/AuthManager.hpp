#pragma once

#include <string>
#include <vector>
#include <mutex>
#include <chrono>
#include <optional>
#include <functional>
#include <cstddef>
#include "User.hpp"

enum class LoginStatus {
    Success,
    InvalidCredentials,
    LockedOut,
    UnknownUser
};

struct LoginResult {
    LoginStatus status = LoginStatus::InvalidCredentials;
    bool upgraded = false;        // legacy hash was re-hashed to the salted format
    std::string session_token;    // only set on Success; handed out once
};

// In-process user directory: signup, login with transparent hash upgrade,
// failed-attempt lockout and a session table keyed by token hash.
//
// All state changes happen under one mutex, so the failed-attempt increment
// and the lockout threshold check are a single atomic step.
class AuthManager {
public:
    using Clock = std::chrono::system_clock;
    using NowProvider = std::function<Clock::time_point()>;

    // A user file that exists but does not parse is never overwritten: the
    // directory starts empty and every save is refused.
    explicit AuthManager(const std::string& userFile = "users.txt",
                         NowProvider nowProvider = Clock::now);

    bool signup(const std::string& username, const std::string& pin);
    LoginResult login(const std::string& username, const std::string& pin);

    // Seeds a record with a bare legacy hash (pre-migration data). The hash
    // must be 64 lowercase hex characters.
    bool importLegacy(const std::string& username, const std::string& legacyHash);

    // True and refreshes the idle timer if the token maps to a live session.
    bool validateSession(const std::string& token);
    void logout(const std::string& token);

    std::optional<User> findUser(const std::string& username) const;
    std::size_t sessionCount() const;

    bool isReadOnly() const { return read_only; }
    bool save();

private:
    struct Session {
        std::string token_hash;
        std::string username;
        Clock::time_point created_at;
        Clock::time_point last_activity;
    };

    mutable std::mutex mtx;
    std::vector<User> users;
    std::vector<Session> sessions;
    std::string userFilePath;
    NowProvider now;
    bool read_only = false;

    // Storage helpers; caller holds mtx
    void loadUsers();
    bool saveUsers();
    User* lookup(const std::string& username);

    std::string openSession(const std::string& username);
    void pruneExpiredSessions(Clock::time_point at);
};
