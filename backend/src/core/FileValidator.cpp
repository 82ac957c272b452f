#include "FileValidator.hpp"
#include <algorithm>
#include <cctype>
#include <regex>
#include <utility>
#include <spdlog/spdlog.h>

namespace {

// -1 matches any byte
using Signature = std::vector<int>;

struct TypeSignatures {
    const char* mime;
    std::vector<Signature> signatures;
};

struct DangerousSignature {
    const char* name;
    Signature signature;
};

const Signature ZIP = { 0x50, 0x4B, 0x03, 0x04 };
const Signature OLE2 = { 0xD0, 0xCF, 0x11, 0xE0, 0xA1, 0xB1, 0x1A, 0xE1 };
const Signature EBML = { 0x1A, 0x45, 0xDF, 0xA3 };
const Signature FTYP = { -1, -1, -1, -1, 'f', 't', 'y', 'p' };

const std::vector<TypeSignatures>& signatureTable() {
    static const std::vector<TypeSignatures> table = {
        // images
        { "image/jpeg", { { 0xFF, 0xD8, 0xFF } } },
        { "image/png",  { { 0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A } } },
        { "image/gif",  { { 'G', 'I', 'F', '8', '7', 'a' }, { 'G', 'I', 'F', '8', '9', 'a' } } },
        { "image/webp", { { 'R', 'I', 'F', 'F', -1, -1, -1, -1, 'W', 'E', 'B', 'P' } } },
        { "image/bmp",  { { 'B', 'M' } } },
        { "image/tiff", { { 0x49, 0x49, 0x2A, 0x00 }, { 0x4D, 0x4D, 0x00, 0x2A } } },

        // documents
        { "application/pdf", { { '%', 'P', 'D', 'F', '-' } } },
        { "application/vnd.openxmlformats-officedocument.wordprocessingml.document",   { ZIP } },
        { "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet",         { ZIP } },
        { "application/vnd.openxmlformats-officedocument.presentationml.presentation", { ZIP } },
        { "application/msword",            { OLE2 } },
        { "application/vnd.ms-excel",      { OLE2 } },
        { "application/vnd.ms-powerpoint", { OLE2 } },

        // archives
        { "application/zip",              { ZIP } },
        { "application/x-rar-compressed", { { 0x52, 0x61, 0x72, 0x21, 0x1A, 0x07 } } },
        { "application/x-7z-compressed",  { { 0x37, 0x7A, 0xBC, 0xAF, 0x27, 0x1C } } },
        { "application/gzip",             { { 0x1F, 0x8B } } },

        // audio / video
        { "audio/mpeg", { { 0xFF, 0xFB }, { 0xFF, 0xFA }, { 'I', 'D', '3' } } },
        { "audio/wav",  { { 'R', 'I', 'F', 'F', -1, -1, -1, -1, 'W', 'A', 'V', 'E' } } },
        { "audio/ogg",  { { 'O', 'g', 'g', 'S' } } },
        { "audio/webm", { EBML } },
        { "audio/mp4",  { FTYP } },
        { "video/mp4",  { FTYP } },
        { "video/webm", { EBML } },
        { "video/quicktime", { FTYP } },
    };
    return table;
}

// Blocked whatever the declared type is.
const std::vector<DangerousSignature>& dangerousSignatures() {
    static const std::vector<DangerousSignature> table = {
        { "Windows executable (MZ)",        { 0x4D, 0x5A } },
        { "Linux executable (ELF)",         { 0x7F, 0x45, 0x4C, 0x46 } },
        { "Java class file",                { 0xCA, 0xFE, 0xBA, 0xBE } },
        { "macOS Mach-O 32-bit",            { 0xFE, 0xED, 0xFA, 0xCE } },
        { "macOS Mach-O 64-bit",            { 0xFE, 0xED, 0xFA, 0xCF } },
        { "macOS Mach-O 64-bit (reversed)", { 0xCF, 0xFA, 0xED, 0xFE } },
        { "Shebang script (#!)",            { 0x23, 0x21 } },
    };
    return table;
}

// Declared types with no magic bytes; accepted once the deny-list has passed.
const std::vector<std::string>& textTypes() {
    static const std::vector<std::string> types = {
        "text/plain", "text/csv", "application/json",
        "text/html", "text/css", "application/javascript",
    };
    return types;
}

const std::vector<std::pair<std::string, std::vector<std::string>>>& extensionTable() {
    static const std::vector<std::pair<std::string, std::vector<std::string>>> table = {
        { "image/jpeg", { "jpg", "jpeg" } },
        { "image/png",  { "png" } },
        { "image/gif",  { "gif" } },
        { "image/webp", { "webp" } },
        { "image/bmp",  { "bmp" } },
        { "image/tiff", { "tif", "tiff" } },
        { "image/svg+xml", { "svg" } },
        { "application/pdf", { "pdf" } },
        { "application/vnd.openxmlformats-officedocument.wordprocessingml.document",   { "docx" } },
        { "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet",         { "xlsx" } },
        { "application/vnd.openxmlformats-officedocument.presentationml.presentation", { "pptx" } },
        { "application/msword",            { "doc" } },
        { "application/vnd.ms-excel",      { "xls" } },
        { "application/vnd.ms-powerpoint", { "ppt" } },
        { "application/zip", { "zip" } },
        { "text/plain", { "txt" } },
        { "text/csv",   { "csv" } },
        { "audio/mpeg", { "mp3" } },
        { "audio/wav",  { "wav" } },
        { "audio/ogg",  { "ogg", "oga" } },
        { "video/mp4",  { "mp4" } },
        { "video/webm", { "webm" } },
        { "video/quicktime", { "mov" } },
    };
    return table;
}

constexpr const char* SVG_MIME = "image/svg+xml";

bool matches(const std::vector<std::uint8_t>& bytes, const Signature& sig) {
    if (bytes.size() < sig.size())
        return false;
    for (std::size_t i = 0; i < sig.size(); ++i) {
        if (sig[i] >= 0 && bytes[i] != static_cast<std::uint8_t>(sig[i]))
            return false;
    }
    return true;
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// "Image/PNG; charset=binary" -> "image/png"
std::string normalizeMime(const std::string& mime) {
    std::string m = mime.substr(0, mime.find(';'));
    while (!m.empty() && std::isspace((unsigned char)m.front())) m.erase(m.begin());
    while (!m.empty() && std::isspace((unsigned char)m.back())) m.pop_back();
    return toLower(m);
}

bool looksLikeSvg(const std::vector<std::uint8_t>& bytes) {
    std::size_t i = 0;
    if (bytes.size() >= 3 && bytes[0] == 0xEF && bytes[1] == 0xBB && bytes[2] == 0xBF)
        i = 3;
    while (i < bytes.size() && std::isspace(bytes[i])) ++i;

    std::string head;
    for (std::size_t j = i; j < bytes.size() && head.size() < 14; ++j)
        head.push_back(static_cast<char>(std::tolower(bytes[j])));

    return head.rfind("<?xml", 0) == 0
        || head.rfind("<svg", 0) == 0
        || head.rfind("<!doctype svg", 0) == 0;
}

FileValidationResult reject(FileValidationResult r, FileRejection kind, std::string reason) {
    r.valid = false;
    r.rejection = kind;
    r.reason = std::move(reason);
    spdlog::warn("File rejected (claimed '{}'): {}", r.claimed_type, r.reason);
    return r;
}

// Whitespace runs become one space, so the bounded patterns below see every
// attribute however it is padded.
std::string collapseWhitespace(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    bool inSpace = false;
    for (char c : s) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            if (!inSpace) out.push_back(' ');
            inSpace = true;
        }
        else {
            out.push_back(c);
            inSpace = false;
        }
    }
    return out;
}

} // namespace

FileValidationResult FileValidator::validateFileContent(const std::vector<std::uint8_t>& bytes,
                                                        const std::string& declaredMime) {
    FileValidationResult result;
    result.claimed_type = declaredMime;
    const std::string mime = normalizeMime(declaredMime);

    if (bytes.empty())
        return reject(result, FileRejection::Empty, "empty file: no content to verify");

    for (const auto& d : dangerousSignatures()) {
        if (matches(bytes, d.signature))
            return reject(result, FileRejection::BlockedExecutable,
                std::string("blocked executable signature: file appears to be ") + d.name);
    }

    if (mime == SVG_MIME) {
        if (!looksLikeSvg(bytes))
            return reject(result, FileRejection::SignatureMismatch,
                "signature does not match declared type: content is not SVG markup");

        SvgScanResult scan = scanSvgForActiveContent(bytes);
        if (!scan.safe)
            return reject(result, FileRejection::ActiveContent, "active content: " + scan.reason);

        result.valid = true;
        result.detected_type = SVG_MIME;
        return result;
    }

    const auto& texts = textTypes();
    if (std::find(texts.begin(), texts.end(), mime) != texts.end()) {
        result.valid = true;
        if (mime.find("html") != std::string::npos || mime.find("javascript") != std::string::npos)
            result.warning = "text-based file type may contain active content";
        return result;
    }

    const auto& table = signatureTable();
    auto entry = std::find_if(table.begin(), table.end(),
        [&](const TypeSignatures& t) { return mime == t.mime; });

    if (entry == table.end())
        return reject(result, FileRejection::UnsupportedType,
            "unsupported declared type: " + declaredMime);

    for (const auto& sig : entry->signatures) {
        if (matches(bytes, sig)) {
            result.valid = true;
            result.detected_type = entry->mime;
            spdlog::debug("File content matches declared type '{}'", mime);
            return result;
        }
    }

    for (const auto& t : table) {
        for (const auto& sig : t.signatures) {
            if (matches(bytes, sig)) {
                result.detected_type = t.mime;
                return reject(result, FileRejection::SignatureMismatch,
                    "signature does not match declared type: claimed " + mime +
                    ", detected " + t.mime);
            }
        }
    }

    return reject(result, FileRejection::SignatureMismatch,
        "signature does not match declared type: could not verify content as " + mime);
}

bool FileValidator::extensionMatchesMime(const std::string& filename, const std::string& mime) {
    const auto dot = filename.rfind('.');
    if (dot == std::string::npos || dot + 1 == filename.size())
        return false;

    const std::string ext = toLower(filename.substr(dot + 1));
    const std::string m = normalizeMime(mime);

    for (const auto& entry : extensionTable()) {
        if (entry.first == m)
            return std::find(entry.second.begin(), entry.second.end(), ext) != entry.second.end();
    }
    // no mapping for this type; the content check decides
    return true;
}

SvgScanResult FileValidator::scanSvgForActiveContent(const std::string& content) {
    static const auto flags = std::regex::ECMAScript | std::regex::icase;
    static const std::regex script(R"(<script)", flags);
    static const std::regex handler(R"(\bon\w{1,64}\s?=)", flags);
    static const std::regex externalRef(R"((xlink:)?href\s?=\s?["']?(?![#"']))", flags);
    static const std::regex dataUri(R"(data:\s?(text/html|application/(x-)?javascript))", flags);

    const std::string text = collapseWhitespace(content);

    SvgScanResult r;
    if (std::regex_search(text, script)) {
        r.safe = false;
        r.reason = "SVG contains script element";
    }
    else if (std::regex_search(text, handler)) {
        r.safe = false;
        r.reason = "SVG contains event handlers";
    }
    else if (std::regex_search(text, externalRef)) {
        r.safe = false;
        r.reason = "SVG contains external references";
    }
    else if (std::regex_search(text, dataUri)) {
        r.safe = false;
        r.reason = "SVG contains potentially dangerous data URI";
    }
    return r;
}

SvgScanResult FileValidator::scanSvgForActiveContent(const std::vector<std::uint8_t>& bytes) {
    return scanSvgForActiveContent(std::string(bytes.begin(), bytes.end()));
}
