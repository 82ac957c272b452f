#pragma once
#include <string>
#include <vector>
#include <cstdint>

// Upload checks based on file content rather than on the file name.
//
// Rejection reasons start with a fixed phrase per category so callers can
// match on it, and the category is also available as FileRejection.

enum class FileRejection {
    None,
    Empty,
    BlockedExecutable,
    UnsupportedType,
    SignatureMismatch,
    ActiveContent
};

struct FileValidationResult {
    bool valid = false;
    FileRejection rejection = FileRejection::None;
    std::string reason;          // set when !valid
    std::string claimed_type;
    std::string detected_type;   // set when a known signature was recognised
    std::string warning;         // accepted, but worth a second look
};

struct SvgScanResult {
    bool safe = true;
    std::string reason;
};

class FileValidator {
public:
    // Binary types are judged on their leading bytes only; image/svg+xml is
    // markup, so its full text is scanned as well.
    static FileValidationResult validateFileContent(const std::vector<std::uint8_t>& bytes,
                                                    const std::string& declaredMime);

    static bool extensionMatchesMime(const std::string& filename, const std::string& mime);

    static SvgScanResult scanSvgForActiveContent(const std::string& text);
    static SvgScanResult scanSvgForActiveContent(const std::vector<std::uint8_t>& bytes);
};
