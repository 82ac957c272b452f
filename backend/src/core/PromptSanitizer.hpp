#pragma once
#include <string>
#include <vector>
#include <cstddef>

// Scrubs free text before it is embedded in a language-model prompt.
//
// sanitize() pipeline, in order:
//   1. truncate to max_length
//   2. replace known prompt-injection signatures with [FILTERED]
//   3. flag sensitive data (masked only when mask_sensitive is set)
//   4. escape & < > " ' unless markup is allowed
//   5. collapse whitespace and trim
//
// Nothing here throws for any input.

enum class WarningType {
    SensitiveData,
    InjectionAttempt,
    LengthExceeded
};

enum class Severity {
    Low,
    Medium,
    High
};

const char* toString(WarningType type);
const char* toString(Severity severity);

struct SanitizationWarning {
    WarningType type;
    std::string message;
    Severity severity;
};

struct SanitizationResult {
    std::string sanitized;
    bool was_modified = false;
    std::vector<SanitizationWarning> warnings;
    std::vector<std::string> blocked_patterns;

    bool hasWarning(WarningType type) const;
};

struct SanitizeOptions {
    std::size_t max_length = 10000;     // bytes, never splitting a UTF-8 sequence
    bool allow_markup = false;
    bool check_sensitive_data = true;
    bool escape_markup = true;
    bool mask_sensitive = false;
};

class PromptSanitizer {
public:
    static constexpr const char* FILTERED_MARKER = "[FILTERED]";
    static constexpr const char* DEFAULT_LABEL = "USER_INPUT";

    static SanitizationResult sanitize(const std::string& input,
                                       const SanitizeOptions& options = SanitizeOptions());

    // Runs sanitize() and logs what was blocked or flagged.
    static std::string quickSanitize(const std::string& input, std::size_t maxLength = 10000);

    static bool isInputSafe(const std::string& input);

    // For log lines, not for prompts.
    static std::string maskSensitiveData(const std::string& input);

    // <LABEL>\n...\n</LABEL>; label restricted to [A-Za-z0-9_].
    static std::string wrapForModel(const std::string& input,
                                    const std::string& label = DEFAULT_LABEL);

    // Escapes markup characters, leaving existing character references alone.
    static std::string escapeMarkup(const std::string& input);
};
