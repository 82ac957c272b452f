#include "Storage.hpp"
#include <fstream>
#include <spdlog/spdlog.h>

bool Storage::saveUsers(const std::vector<User>& users, const std::string& filename) {
    spdlog::info("Saving {} users to '{}'", users.size(), filename);
    std::ofstream out(filename, std::ios::trunc);
    if (!out) {
        spdlog::error("Failed to open '{}' for writing user data", filename);
        return false;
    }

    for (const auto& u : users) {
        out << u.username << "\n"
            << u.pin_hash << "\n"
            << u.failed_attempts << "\n"
            << u.locked_at << "\n"
            << u.created_at << "\n"
            << "---\n";
    }

    out.flush();
    if (!out) {
        spdlog::error("Write to '{}' failed", filename);
        return false;
    }
    return true;
}

LoadResult Storage::loadUsers(std::vector<User>& users, const std::string& filename) {
    spdlog::info("Loading users from '{}'", filename);
    users.clear();

    std::ifstream in(filename);
    if (!in) {
        spdlog::warn("User file '{}' not found; treating as empty", filename);
        return LoadResult::NotFound;
    }

    std::vector<User> parsed;
    std::string username;
    while (std::getline(in, username)) {
        User u;
        u.username = username;

        std::string sep;
        const bool complete = std::getline(in, u.pin_hash)
            && (in >> u.failed_attempts)
            && (in >> u.locked_at)
            && (in >> u.created_at)
            && std::getline(in, sep)
            && std::getline(in, sep);

        if (!complete || sep != "---") {
            spdlog::error("Malformed user record #{} ('{}') in '{}'",
                parsed.size() + 1, u.username, filename);
            return LoadResult::Malformed;
        }
        parsed.push_back(u);
    }

    users = std::move(parsed);
    spdlog::info("Loaded {} users", users.size());
    return LoadResult::Loaded;
}
