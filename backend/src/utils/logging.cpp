#include "logging.hpp"
#include <cstddef>
#include <regex>
#include <vector>

static constexpr std::size_t MAX_LOGGED_LENGTH = 1000;

// Quantifiers stay bounded; std::regex recurses once per matched character.
static const std::vector<std::regex>& redactionPatterns() {
    static const std::vector<std::regex> patterns = {
        std::regex(R"(\b\d{3}-\d{2}-\d{4}\b)"),                              // SSN
        std::regex(R"(\b\d{4}[\s-]?\d{4}[\s-]?\d{4}[\s-]?\d{4}\b)"),         // card
        std::regex(R"(Bearer\s{1,16}[A-Za-z0-9._~+/-]{1,512}={0,2})", std::regex::icase),
        // tokens, keys; longer runs are consumed in 256-char chunks
        std::regex(R"([A-Za-z0-9]{32,256})"),
    };
    return patterns;
}

std::string Log::redact(const std::string& text) {
    std::string out = text;
    for (const auto& re : redactionPatterns())
        out = std::regex_replace(out, re, "[REDACTED]");

    if (out.size() > MAX_LOGGED_LENGTH) {
        out.resize(MAX_LOGGED_LENGTH);
        out += "...[TRUNCATED]";
    }
    return out;
}
