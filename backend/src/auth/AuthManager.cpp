#include "AuthManager.hpp"
#include "PinHasher.hpp"
#include "TokenIssuer.hpp"
#include "Lockout.hpp"
#include "../storage/Storage.hpp"
#include <algorithm>
#include <utility>
#include <spdlog/spdlog.h>

// Verified against when the username is unknown so that a miss costs the same
// as a wrong PIN.
static const std::string DUMMY_CREDENTIAL =
    "00000000000000000000000000000000:"
    "0000000000000000000000000000000000000000000000000000000000000000";

AuthManager::AuthManager(const std::string& userFile, NowProvider nowProvider)
    : userFilePath(userFile), now(std::move(nowProvider))
{
    spdlog::info("AuthManager initialized with user file '{}'", userFilePath);
    std::lock_guard<std::mutex> lock(mtx);
    loadUsers();
}

void AuthManager::loadUsers() {
    spdlog::debug("Loading users from '{}'", userFilePath);

    std::vector<User> loaded;
    switch (Storage::loadUsers(loaded, userFilePath)) {
    case LoadResult::Loaded:
        break;
    case LoadResult::NotFound:
        spdlog::warn("Starting with an empty user directory");
        break;
    case LoadResult::Malformed:
        read_only = true;
        spdlog::error("User file '{}' is malformed; directory is read-only until it is repaired",
            userFilePath);
        break;
    }

    spdlog::info("Loaded {} user entries", loaded.size());
    users = std::move(loaded);
}

bool AuthManager::saveUsers() {
    if (read_only) {
        spdlog::error("Refusing to overwrite malformed user file '{}'", userFilePath);
        return false;
    }
    spdlog::debug("Saving {} user entries to '{}'", users.size(), userFilePath);
    if (!Storage::saveUsers(users, userFilePath)) {
        spdlog::error("User data could not be saved");
        return false;
    }
    return true;
}

bool AuthManager::save() {
    std::lock_guard<std::mutex> lock(mtx);
    return saveUsers();
}

User* AuthManager::lookup(const std::string& username) {
    auto it = std::find_if(users.begin(), users.end(),
        [&](const User& u) { return u.username == username; });
    return it == users.end() ? nullptr : &*it;
}

std::optional<User> AuthManager::findUser(const std::string& username) const {
    std::lock_guard<std::mutex> lock(mtx);
    for (const auto& u : users)
        if (u.username == username) return u;
    return std::nullopt;
}

bool AuthManager::signup(const std::string& username, const std::string& pin) {
    spdlog::info("Attempting signup for username '{}'", username);

    if (!PinHasher::isValidUsername(username)) {
        spdlog::warn("Signup failed: invalid username");
        return false;
    }
    if (!PinHasher::isValidPin(pin)) {
        spdlog::warn("Signup failed: PIN must be 4 digits");
        return false;
    }

    std::lock_guard<std::mutex> lock(mtx);
    if (lookup(username)) {
        spdlog::warn("Signup failed: username '{}' already exists", username);
        return false;
    }

    users.emplace_back(username, PinHasher::createSaltedCredential(pin));
    if (!saveUsers()) {
        users.pop_back();
        spdlog::warn("Signup rolled back for '{}'", username);
        return false;
    }

    spdlog::info("Signup successful for username '{}'", username);
    return true;
}

bool AuthManager::importLegacy(const std::string& username, const std::string& legacyHash) {
    if (!PinHasher::isValidUsername(username)) {
        spdlog::warn("Legacy import failed: invalid username");
        return false;
    }
    if (!PinHasher::isLegacyFormat(legacyHash)) {
        spdlog::warn("Legacy import failed: hash for '{}' is not a SHA-256 hex digest", username);
        return false;
    }

    std::lock_guard<std::mutex> lock(mtx);
    if (lookup(username)) {
        spdlog::warn("Legacy import skipped: username '{}' already exists", username);
        return false;
    }

    users.emplace_back(username, legacyHash);
    if (!saveUsers()) {
        users.pop_back();
        return false;
    }

    spdlog::info("Imported legacy credential for '{}'", username);
    return true;
}

LoginResult AuthManager::login(const std::string& username, const std::string& pin) {
    spdlog::info("Login attempt for username '{}'", username);
    LoginResult result;

    std::lock_guard<std::mutex> lock(mtx);
    User* u = lookup(username);
    if (!u) {
        (void)PinHasher::verifyCredential(pin, DUMMY_CREDENTIAL);
        spdlog::warn("Login failed: username '{}' not found", username);
        result.status = LoginStatus::UnknownUser;
        return result;
    }

    const auto at = now();
    if (u->isLocked()) {
        if (!Lockout::isLockoutExpired(Clock::from_time_t(u->locked_at), at)) {
            spdlog::warn("Login refused: '{}' is locked out", username);
            result.status = LoginStatus::LockedOut;
            return result;
        }
        spdlog::info("Lockout for '{}' expired; resetting counter", username);
        u->locked_at = 0;
        u->failed_attempts = 0;
    }

    const VerifyResult v = PinHasher::verifyCredential(pin, u->pin_hash);
    if (!v.valid) {
        u->failed_attempts += 1;
        if (Lockout::shouldLock(u->failed_attempts)) {
            u->locked_at = Clock::to_time_t(at);
            spdlog::warn("'{}' locked after {} failed attempts", username, u->failed_attempts);
        }
        else {
            spdlog::warn("Login failed: incorrect PIN for '{}' ({} of {})",
                username, u->failed_attempts, LockoutPolicy::MAX_ATTEMPTS);
        }
        if (!saveUsers())
            spdlog::warn("Failed-attempt counter for '{}' kept in memory only", username);
        result.status = u->isLocked() ? LoginStatus::LockedOut : LoginStatus::InvalidCredentials;
        return result;
    }

    u->failed_attempts = 0;
    if (v.needs_upgrade) {
        u->pin_hash = PinHasher::createSaltedCredential(pin);
        result.upgraded = true;
        spdlog::info("Upgraded legacy PIN hash for '{}'", username);
    }
    if (!saveUsers())
        spdlog::warn("Login state for '{}' kept in memory only", username);

    result.status = LoginStatus::Success;
    result.session_token = openSession(username);
    spdlog::info("User '{}' logged in successfully", username);
    return result;
}

std::string AuthManager::openSession(const std::string& username) {
    const std::string token = TokenIssuer::generateSessionToken();
    const auto at = now();
    pruneExpiredSessions(at);

    Session s;
    s.token_hash = TokenIssuer::hashToken(token);
    s.username = username;
    s.created_at = at;
    s.last_activity = at;
    sessions.push_back(s);
    return token;
}

void AuthManager::pruneExpiredSessions(Clock::time_point at) {
    sessions.erase(std::remove_if(sessions.begin(), sessions.end(),
        [&](const Session& s) { return TokenIssuer::isSessionExpired(s.created_at, s.last_activity, at); }),
        sessions.end());
}

std::size_t AuthManager::sessionCount() const {
    std::lock_guard<std::mutex> lock(mtx);
    return sessions.size();
}

bool AuthManager::validateSession(const std::string& token) {
    if (token.empty())
        return false;

    const std::string hash = TokenIssuer::hashToken(token);

    std::lock_guard<std::mutex> lock(mtx);
    const auto at = now();
    pruneExpiredSessions(at);

    for (auto& s : sessions) {
        if (s.token_hash == hash) {
            s.last_activity = at;
            return true;
        }
    }

    spdlog::debug("Session token not recognised or expired");
    return false;
}

void AuthManager::logout(const std::string& token) {
    const std::string hash = TokenIssuer::hashToken(token);

    std::lock_guard<std::mutex> lock(mtx);
    const auto before = sessions.size();
    sessions.erase(std::remove_if(sessions.begin(), sessions.end(),
        [&](const Session& s) { return s.token_hash == hash; }),
        sessions.end());

    if (sessions.size() != before)
        spdlog::info("Session closed");
}
