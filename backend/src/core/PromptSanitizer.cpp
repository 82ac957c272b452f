#include "PromptSanitizer.hpp"
#include "../utils/logging.hpp"
#include <regex>
#include <cctype>
#include <spdlog/spdlog.h>

namespace {

// Quantifiers are bounded throughout: std::regex matches recursively, one
// stack frame per character consumed, so an unbounded run over a long input
// exhausts the stack.

struct SensitivePattern {
    const char* category;
    std::regex re;
    const char* mask;
};

constexpr auto RX = std::regex::ECMAScript | std::regex::icase;

const std::vector<std::regex>& injectionPatterns() {
    static const std::vector<std::regex> patterns = {
        // instruction overrides
        std::regex(R"(ignore\s{1,64}(all\s{1,64})?previous\s{1,64}instructions?)", RX),
        std::regex(R"(disregard\s{1,64}(all\s{1,64})?above)", RX),
        std::regex(R"(forget\s{1,64}(all\s{1,64})?previous)", RX),
        std::regex(R"(ignore\s{1,64}(the\s{1,64})?system\s{1,64}prompt)", RX),

        // role / mode switching
        std::regex(R"(\bsystem\s{0,64}:)", RX),
        std::regex(R"(\bassistant\s{0,64}:)", RX),
        std::regex(R"(\buser\s{0,64}:)", RX),
        std::regex(R"(\bhuman\s{0,64}:)", RX),
        std::regex(R"(\[\s{0,64}INST\s{0,64}\])", RX),
        std::regex(R"(\[\s{0,64}/INST\s{0,64}\])", RX),
        std::regex(R"(<<\s{0,64}SYS\s{0,64}>>)", RX),
        std::regex(R"(<<\s{0,64}/SYS\s{0,64}>>)", RX),

        // jailbreaks
        std::regex(R"(\bdan\s{1,64}mode)", RX),
        std::regex(R"(\bdeveloper\s{1,64}mode)", RX),
        std::regex(R"(\bjailbreak)", RX),
        std::regex(R"(\bbypass\s{1,64}(safety|filter|restriction))", RX),

        // script execution
        std::regex(R"(<script[\s>])", RX),
        std::regex(R"(javascript:)", RX),
        std::regex(R"(on\w{1,64}\s{0,64}=)", RX),
    };
    return patterns;
}

// Detection and masking share one table; group 1 is the label kept by the mask.
const std::vector<SensitivePattern>& sensitivePatterns() {
    static const std::vector<SensitivePattern> patterns = {
        { "ssn",            std::regex(R"(\b\d{3}-\d{2}-\d{4}\b)", RX), "***-**-****" },
        { "credit_card",    std::regex(R"(\b\d{4}[\s-]?\d{4}[\s-]?\d{4}[\s-]?\d{4}\b)", RX), "****-****-****-****" },
        { "account_number", std::regex(R"(\b(account\s{0,16}#?|acct\.?\s{0,16}#?)\s{0,16}\d{6,64}\b)", RX), "$1 ******" },
        { "policy_number",  std::regex(R"(\b(policy\s{0,16}#?|pol\.?\s{0,16}#?)\s{0,16}[A-Z0-9]{6,64}\b)", RX), "$1 ******" },
        { "password",       std::regex(R"(\b(password|passwd|pwd)\s{0,16}[:=]\s{0,16}\S{1,256})", RX), "$1: ******" },
        { "api_key",        std::regex(R"(\b(api[_-]?key|secret[_-]?key|auth[_-]?token)\s{0,16}[:=]\s{0,16}\S{1,256})", RX), "$1: ******" },
    };
    return patterns;
}

// Next `<name ...>` or `</name ...>` tag at or after `from`. A candidate that
// runs into another '<' is abandoned there, so the scan is linear.
bool findMarkupTag(const std::string& s, std::size_t from, std::size_t& begin, std::size_t& end) {
    std::size_t i = s.find('<', from);
    while (i != std::string::npos) {
        std::size_t j = i + 1;
        if (j < s.size() && s[j] == '/') ++j;
        if (j < s.size() && std::isalpha((unsigned char)s[j])) {
            const std::size_t close = s.find_first_of("<>", j + 1);
            if (close == std::string::npos)
                return false;
            if (s[close] == '>') {
                begin = i;
                end = close + 1;
                return true;
            }
            i = close;
            continue;
        }
        i = s.find('<', i + 1);
    }
    return false;
}

bool filterMarkupTags(std::string& text, std::vector<std::string>& blocked) {
    std::string out;
    std::size_t pos = 0, begin = 0, end = 0;
    bool found = false;

    while (findMarkupTag(text, pos, begin, end)) {
        blocked.push_back(text.substr(begin, end - begin));
        out.append(text, pos, begin - pos);
        out += PromptSanitizer::FILTERED_MARKER;
        pos = end;
        found = true;
    }
    if (!found)
        return false;

    out.append(text, pos, std::string::npos);
    text = std::move(out);
    return true;
}

bool isContinuationByte(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

// Largest prefix length <= maxLen that does not split a UTF-8 sequence.
std::size_t utf8Boundary(const std::string& s, std::size_t maxLen) {
    if (s.size() <= maxLen) return s.size();
    std::size_t cut = maxLen;
    while (cut > 0 && isContinuationByte(s[cut])) --cut;
    return cut;
}

// Length of a character reference starting at s[pos] == '&', or 0 if none.
std::size_t characterReferenceLength(const std::string& s, std::size_t pos) {
    static constexpr std::size_t MAX_REF = 32;
    std::size_t i = pos + 1;
    if (i >= s.size()) return 0;

    if (s[i] == '#') {
        ++i;
        bool hex = false;
        if (i < s.size() && (s[i] == 'x' || s[i] == 'X')) { hex = true; ++i; }
        const std::size_t digitsStart = i;
        while (i < s.size() && i - pos < MAX_REF &&
               (hex ? std::isxdigit((unsigned char)s[i]) : std::isdigit((unsigned char)s[i])))
            ++i;
        if (i == digitsStart) return 0;
    }
    else {
        if (!std::isalpha((unsigned char)s[i])) return 0;
        while (i < s.size() && i - pos < MAX_REF && std::isalnum((unsigned char)s[i]))
            ++i;
    }

    if (i < s.size() && s[i] == ';')
        return i - pos + 1;
    return 0;
}

std::string collapseWhitespace(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    bool pendingSpace = false;

    for (char c : s) {
        if (std::isspace((unsigned char)c)) {
            pendingSpace = !out.empty();
            continue;
        }
        if (pendingSpace) {
            out.push_back(' ');
            pendingSpace = false;
        }
        out.push_back(c);
    }
    return out;
}

// Cut back to maxLen without leaving half a character reference or UTF-8 sequence.
std::string clampEscaped(const std::string& s, std::size_t maxLen) {
    std::size_t cut = utf8Boundary(s, maxLen);

    const std::size_t amp = s.rfind('&', cut == 0 ? 0 : cut - 1);
    if (amp != std::string::npos && amp < cut) {
        const std::size_t ref = characterReferenceLength(s, amp);
        if (ref > 0 && amp + ref > cut)
            cut = amp;
    }

    std::string out = s.substr(0, cut);
    while (!out.empty() && out.back() == ' ') out.pop_back();
    return out;
}

} // namespace

const char* toString(WarningType type) {
    switch (type) {
    case WarningType::SensitiveData:    return "sensitive_data";
    case WarningType::InjectionAttempt: return "injection_attempt";
    case WarningType::LengthExceeded:   return "length_exceeded";
    }
    return "unknown";
}

const char* toString(Severity severity) {
    switch (severity) {
    case Severity::Low:    return "low";
    case Severity::Medium: return "medium";
    case Severity::High:   return "high";
    }
    return "unknown";
}

bool SanitizationResult::hasWarning(WarningType type) const {
    for (const auto& w : warnings)
        if (w.type == type) return true;
    return false;
}

SanitizationResult PromptSanitizer::sanitize(const std::string& input, const SanitizeOptions& options) {
    SanitizationResult result;
    std::string text = input;

    // 1. length
    if (text.size() > options.max_length) {
        text.resize(utf8Boundary(text, options.max_length));
        result.was_modified = true;
        result.warnings.push_back({ WarningType::LengthExceeded,
            "Input truncated from " + std::to_string(input.size()) + " to " +
                std::to_string(options.max_length) + " characters",
            Severity::Low });
    }

    // whitespace first, so padding cannot stretch a phrase past the pattern bounds
    std::string collapsed = collapseWhitespace(text);
    if (collapsed != text) {
        result.was_modified = true;
        text = std::move(collapsed);
    }

    // 2. injection signatures
    for (const auto& re : injectionPatterns()) {
        auto begin = std::sregex_iterator(text.begin(), text.end(), re);
        auto end = std::sregex_iterator();
        if (begin == end) continue;

        for (auto it = begin; it != end; ++it)
            result.blocked_patterns.push_back(it->str());

        text = std::regex_replace(text, re, FILTERED_MARKER);
        result.was_modified = true;
        result.warnings.push_back({ WarningType::InjectionAttempt,
            "Potential prompt injection pattern detected and filtered",
            Severity::High });
    }

    // any remaining markup tag
    if (filterMarkupTags(text, result.blocked_patterns)) {
        result.was_modified = true;
        result.warnings.push_back({ WarningType::InjectionAttempt,
            "Potential prompt injection pattern detected and filtered",
            Severity::High });
    }

    // 3. sensitive data
    if (options.check_sensitive_data) {
        for (const auto& p : sensitivePatterns()) {
            if (std::regex_search(text, p.re)) {
                result.warnings.push_back({ WarningType::SensitiveData,
                    std::string("Potentially sensitive data detected: ") + p.category,
                    Severity::High });
            }
        }

        if (options.mask_sensitive) {
            std::string masked = maskSensitiveData(text);
            if (masked != text) {
                result.was_modified = true;
                text = std::move(masked);
            }
        }
    }

    // 4. markup
    if (options.escape_markup && !options.allow_markup) {
        std::string escaped = escapeMarkup(text);
        if (escaped != text) {
            result.was_modified = true;
            text = std::move(escaped);
        }
    }

    // 5. whitespace
    std::string normalized = collapseWhitespace(text);
    if (normalized.size() > options.max_length) {
        // escaping can grow the text past the ceiling again
        normalized = clampEscaped(normalized, options.max_length);
        if (!result.hasWarning(WarningType::LengthExceeded)) {
            result.warnings.push_back({ WarningType::LengthExceeded,
                "Escaped input truncated to " + std::to_string(options.max_length) + " characters",
                Severity::Low });
        }
    }
    if (normalized != text)
        result.was_modified = true;

    result.sanitized = std::move(normalized);
    return result;
}

std::string PromptSanitizer::quickSanitize(const std::string& input, std::size_t maxLength) {
    SanitizeOptions options;
    options.max_length = maxLength;
    SanitizationResult result = sanitize(input, options);

    if (!result.blocked_patterns.empty()) {
        spdlog::warn("Prompt injection patterns blocked: {}", result.blocked_patterns.size());
        for (const auto& p : result.blocked_patterns)
            spdlog::debug("  blocked: '{}'", Log::redact(maskSensitiveData(p)));
    }

    for (const auto& w : result.warnings) {
        if (w.type == WarningType::SensitiveData)
            spdlog::warn("{}", w.message);
    }

    return result.sanitized;
}

bool PromptSanitizer::isInputSafe(const std::string& input) {
    const std::string text = collapseWhitespace(input);
    for (const auto& re : injectionPatterns())
        if (std::regex_search(text, re)) return false;

    std::size_t begin = 0, end = 0;
    return !findMarkupTag(text, 0, begin, end);
}

std::string PromptSanitizer::maskSensitiveData(const std::string& input) {
    std::string masked = input;
    for (const auto& p : sensitivePatterns())
        masked = std::regex_replace(masked, p.re, p.mask);
    return masked;
}

std::string PromptSanitizer::wrapForModel(const std::string& input, const std::string& label) {
    std::string tag;
    for (char c : label)
        if (std::isalnum((unsigned char)c) || c == '_') tag.push_back(c);
    if (tag.empty())
        tag = DEFAULT_LABEL;

    const std::string body = quickSanitize(input);
    return "<" + tag + ">\n" + body + "\n</" + tag + ">";
}

std::string PromptSanitizer::escapeMarkup(const std::string& input) {
    std::string out;
    out.reserve(input.size());

    for (std::size_t i = 0; i < input.size(); ++i) {
        const char c = input[i];
        switch (c) {
        case '&': {
            const std::size_t ref = characterReferenceLength(input, i);
            if (ref > 0) {
                out.append(input, i, ref);
                i += ref - 1;
            }
            else {
                out += "&amp;";
            }
            break;
        }
        case '<':  out += "&lt;"; break;
        case '>':  out += "&gt;"; break;
        case '"':  out += "&quot;"; break;
        case '\'': out += "&#39;"; break;
        default:   out.push_back(c);
        }
    }
    return out;
}
