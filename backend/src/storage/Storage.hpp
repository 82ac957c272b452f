#pragma once
#include <vector>
#include <string>
#include "../auth/User.hpp"

// Flat-file user directory used by the CLI.
//
// One record per user, text lines:
//   username, pin_hash, failed_attempts, locked_at, created_at, "---"
//
// Only hashes are written; a PIN never reaches this file.

enum class LoadResult {
    Loaded,
    NotFound,
    Malformed   // nothing is returned; the file must not be overwritten
};

class Storage {
public:
    static bool saveUsers(const std::vector<User>& users, const std::string& filename);

    // `users` is left empty unless the whole file parses.
    static LoadResult loadUsers(std::vector<User>& users, const std::string& filename);
};
