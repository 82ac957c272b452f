#include <iostream>
#include <fstream>
#include <vector>
#include <string>
#include <limits>
#include <stdexcept>
#include <iterator>
#include <cstdint>

#include "../utils/logging.hpp"
#include "../utils/Crypto.hpp"
#include "../auth/AuthManager.hpp"
#include "../auth/PinHasher.hpp"
#include "../auth/TokenIssuer.hpp"
#include "../core/PromptSanitizer.hpp"
#include "../core/FileValidator.hpp"

static bool readFileBytes(const std::string& path, std::vector<std::uint8_t>& out) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        spdlog::warn("Could not open '{}' for validation", path);
        return false;
    }
    out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    return true;
}

static int readChoice() {
    int choice;
    if (!(std::cin >> choice)) {
        if (std::cin.eof()) return -2;
        std::cin.clear();
        std::string dummy; std::getline(std::cin, dummy);
        return -1;
    }
    std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
    return choice;
}

static void printSanitization(const SanitizationResult& r) {
    std::cout << "\nSanitized: " << r.sanitized << "\n"
        << "Modified:  " << (r.was_modified ? "yes" : "no") << "\n";

    if (r.warnings.empty()) {
        std::cout << "Warnings:  (none)\n";
    }
    else {
        std::cout << "Warnings:\n";
        for (const auto& w : r.warnings)
            std::cout << "   - [" << toString(w.severity) << "] " << toString(w.type)
                << ": " << w.message << "\n";
    }

    if (!r.blocked_patterns.empty()) {
        std::cout << "Blocked:\n";
        for (const auto& p : r.blocked_patterns)
            std::cout << "   - " << PromptSanitizer::maskSensitiveData(p) << "\n";
    }
}

static void validateUpload() {
    std::string path, mime;
    std::cout << "File path: "; std::getline(std::cin, path);
    std::cout << "Declared MIME type: "; std::getline(std::cin, mime);

    std::vector<std::uint8_t> bytes;
    if (!readFileBytes(path, bytes)) { std::cout << "Cannot read file.\n"; return; }

    auto r = FileValidator::validateFileContent(bytes, mime);
    if (r.valid) {
        std::cout << "Accepted";
        if (!r.detected_type.empty()) std::cout << " (detected " << r.detected_type << ")";
        std::cout << ".\n";
        if (!r.warning.empty()) std::cout << "Warning: " << r.warning << "\n";
    }
    else {
        std::cout << "Rejected: " << r.reason << "\n";
    }

    if (!FileValidator::extensionMatchesMime(path, mime))
        std::cout << "Note: file extension does not match the declared type.\n";
}

static void scanSvg() {
    std::string path;
    std::cout << "SVG path: "; std::getline(std::cin, path);

    std::vector<std::uint8_t> bytes;
    if (!readFileBytes(path, bytes)) { std::cout << "Cannot read file.\n"; return; }

    auto r = FileValidator::scanSvgForActiveContent(bytes);
    if (r.safe) std::cout << "SVG looks safe.\n";
    else std::cout << "Unsafe: " << r.reason << "\n";
}

static void checkStoredCredential() {
    std::string pin, stored;
    std::cout << "PIN: "; std::getline(std::cin, pin);
    std::cout << "Stored hash: "; std::getline(std::cin, stored);

    auto v = PinHasher::verifyCredential(pin, stored);
    std::cout << "Format: " << (PinHasher::isSaltedFormat(stored) ? "salted" : "legacy") << "\n"
        << "Valid: " << (v.valid ? "yes" : "no") << "\n"
        << "Needs upgrade: " << (v.needs_upgrade ? "yes" : "no") << "\n";
    if (v.needs_upgrade)
        std::cout << "Replacement: " << PinHasher::createSaltedCredential(pin) << "\n";
}

int main() {
    Log::init();

    try {
        Crypto::ensureInitialized();
    }
    catch (const std::exception& e) {
        std::cerr << "Failed to initialize libsodium: " << e.what() << "\n";
        return 1;
    }

    AuthManager auth;
    std::string session;
    std::string currentUser;

    // LOGIN / SIGNUP
    while (session.empty()) {
        std::cout << "\n===== LOGIN MENU =====\n"
            "1. Login\n"
            "2. Signup\n"
            "3. Import legacy PIN hash\n"
            "4. Exit\n> ";
        int choice = readChoice();
        if (choice == -2) return 0;

        if (choice == 1) {
            std::string username, pin;
            std::cout << "Username: "; std::getline(std::cin, username);
            std::cout << "PIN: "; std::getline(std::cin, pin);

            LoginResult r = auth.login(username, pin);
            switch (r.status) {
            case LoginStatus::Success:
                session = r.session_token;
                currentUser = username;
                std::cout << "Login successful.\n";
                if (r.upgraded) std::cout << "Your stored PIN hash was upgraded.\n";
                break;
            case LoginStatus::LockedOut:
                std::cout << "Too many failed attempts. Try again later.\n";
                break;
            default:
                std::cout << "Invalid username/PIN.\n";
            }
        }
        else if (choice == 2) {
            std::string username, pin;
            std::cout << "Choose username: "; std::getline(std::cin, username);
            std::cout << "Choose 4-digit PIN: "; std::getline(std::cin, pin);
            if (auth.signup(username, pin)) std::cout << "Signup complete.\n";
            else std::cout << "Signup failed.\n";
        }
        else if (choice == 3) {
            std::string username, hash;
            std::cout << "Username: "; std::getline(std::cin, username);
            std::cout << "Legacy hash: "; std::getline(std::cin, hash);
            if (auth.importLegacy(username, hash)) std::cout << "Imported.\n";
            else std::cout << "Import failed.\n";
        }
        else if (choice == 4)
            return 0;
    }

    // MAIN LOOP
    while (true) {
        if (!auth.validateSession(session)) {
            std::cout << "Session expired. Please log in again.\n";
            break;
        }

        std::cout << "\n===== MAIN MENU =====\n"
            "User: " << currentUser << "\n"
            "1. Sanitize text for AI prompt\n"
            "2. Check text for prompt injection\n"
            "3. Mask sensitive data\n"
            "4. Wrap text for model\n"
            "5. Validate file upload\n"
            "6. Scan SVG for active content\n"
            "7. Generate anti-forgery token\n"
            "8. Check stored credential\n"
            "9. Logout & Exit\n> ";

        int choice = readChoice();
        if (choice == -2) break;

        if (choice >= 1 && choice <= 4) {
            std::string text;
            std::cout << "Enter text: "; std::getline(std::cin, text);

            if (choice == 1) printSanitization(PromptSanitizer::sanitize(text));
            else if (choice == 2)
                std::cout << (PromptSanitizer::isInputSafe(text) ? "Safe.\n" : "Injection pattern found.\n");
            else if (choice == 3) std::cout << PromptSanitizer::maskSensitiveData(text) << "\n";
            else {
                std::string label;
                std::cout << "Label (blank for " << PromptSanitizer::DEFAULT_LABEL << "): ";
                std::getline(std::cin, label);
                std::cout << PromptSanitizer::wrapForModel(text, label.empty() ? PromptSanitizer::DEFAULT_LABEL : label) << "\n";
            }
        }
        else if (choice == 5) validateUpload();
        else if (choice == 6) scanSvg();
        else if (choice == 7) {
            std::string token = TokenIssuer::generateCsrfToken();
            std::cout << CsrfPolicy::COOKIE_NAME << " / " << CsrfPolicy::HEADER_NAME << ": " << token << "\n"
                << "Stored hash: " << TokenIssuer::hashToken(token) << "\n";
        }
        else if (choice == 8) checkStoredCredential();
        else if (choice == 9) break;
        else std::cout << "Invalid.\n";
    }

    auth.logout(session);
    if (!auth.save())
        std::cout << "Error saving users.\n";
    std::cout << "Goodbye!\n";
    return 0;
}
