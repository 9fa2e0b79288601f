#include "pathguard/detectors.hpp"

#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <string>

#include <unicode/uchar.h>

namespace pathguard {

namespace {

constexpr auto npos = std::string::npos;

std::string to_lower_ascii(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string to_upper_ascii(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

bool contains_any(const std::string& haystack, std::initializer_list<const char*> needles) {
    for (const char* needle : needles) {
        if (haystack.find(needle) != npos) return true;
    }
    return false;
}

bool is_continuation(unsigned char b) {
    return (b & 0xC0) == 0x80;
}

// Strict decoder: rejects overlong forms, surrogates and code points above
// U+10FFFF. Advances `i` past the sequence on success.
bool decode_utf8(const std::string& s, size_t& i, char32_t& cp) {
    const size_t n = s.size();
    const auto b0 = static_cast<unsigned char>(s[i]);

    if (b0 < 0x80) {
        cp = b0;
        i += 1;
        return true;
    }

    size_t len = 0;
    unsigned char lo = 0x80;
    unsigned char hi = 0xBF;

    if (b0 >= 0xC2 && b0 <= 0xDF) {
        len = 2;
        cp = b0 & 0x1F;
    } else if (b0 >= 0xE0 && b0 <= 0xEF) {
        len = 3;
        cp = b0 & 0x0F;
        if (b0 == 0xE0) lo = 0xA0;
        if (b0 == 0xED) hi = 0x9F;
    } else if (b0 >= 0xF0 && b0 <= 0xF4) {
        len = 4;
        cp = b0 & 0x07;
        if (b0 == 0xF0) lo = 0x90;
        if (b0 == 0xF4) hi = 0x8F;
    } else {
        return false;
    }

    if (i + len > n) {
        return false;
    }

    const auto b1 = static_cast<unsigned char>(s[i + 1]);
    if (b1 < lo || b1 > hi) {
        return false;
    }
    cp = (cp << 6) | (b1 & 0x3F);

    for (size_t k = 2; k < len; ++k) {
        const auto b = static_cast<unsigned char>(s[i + k]);
        if (!is_continuation(b)) {
            return false;
        }
        cp = (cp << 6) | (b & 0x3F);
    }

    i += len;
    return true;
}

void encode_utf8(char32_t cp, std::string& out) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

// Final path element, splitting on both separator styles and ignoring
// trailing separators.
std::string base_name(const std::string& s) {
    size_t end = s.find_last_not_of("/\\");
    if (end == npos) {
        return "";
    }
    size_t start = s.find_last_of("/\\", end);
    start = (start == npos) ? 0 : start + 1;
    return s.substr(start, end - start + 1);
}

const char* const kReservedNames[] = {
    "CON", "PRN", "AUX", "NUL",
    "COM1", "COM2", "COM3", "COM4", "COM5", "COM6", "COM7", "COM8", "COM9",
    "LPT1", "LPT2", "LPT3", "LPT4", "LPT5", "LPT6", "LPT7", "LPT8", "LPT9",
    "CONIN$", "CONOUT$",
};

// UTF-8 encodings of characters that render like a path separator
const char* const kConfusableSeparators[] = {
    "\xE2\x81\x84",  // U+2044 FRACTION SLASH
    "\xE2\x88\x95",  // U+2215 DIVISION SLASH
    "\xE2\x88\x96",  // U+2216 SET MINUS
    "\xE2\xA7\xB8",  // U+29F8 BIG SOLIDUS
    "\xEF\xBC\x8F",  // U+FF0F FULLWIDTH SOLIDUS
    "\xEF\xBC\xBC",  // U+FF3C FULLWIDTH REVERSE SOLIDUS
};

} // namespace

// ============================================================================
// Detector Names
// ============================================================================

const char* detector_to_string(Detector d) {
    switch (d) {
        case Detector::Traversal: return "path-traversal";
        case Detector::EncodedSequence: return "encoded-sequence";
        case Detector::SuspiciousOsPath: return "suspicious-os-path";
        case Detector::ExtendedLengthPrefix: return "extended-length-prefix";
        case Detector::NullByte: return "null-byte";
        case Detector::ControlCharacter: return "control-character";
        case Detector::OverlongUtf8: return "overlong-utf8";
        case Detector::InvalidUtf8: return "invalid-utf8";
        case Detector::ConfusableSeparator: return "confusable-separator";
        case Detector::UncPath: return "unc-path";
        case Detector::DrivePath: return "drive-path";
        case Detector::AlternateDataStream: return "alternate-data-stream";
        case Detector::WindowsReservedName: return "windows-reserved-name";
        case Detector::TrailingDotOrSpace: return "trailing-dot-or-space";
        case Detector::Length: return "length";
        default: return "unknown";
    }
}

// ============================================================================
// Encoding and Traversal
// ============================================================================

bool contains_traversal(const std::string& s) {
    if (s.find("..") != npos) {
        return true;
    }
    const std::string lower = to_lower_ascii(s);
    return contains_any(lower, {
        "%2e%2e", ".%2e", "%2e.",
        "%252e%252e",
        "\\u002e\\u002e",
        "\\x2e\\x2e",
    });
}

bool contains_encoded_sequence(const std::string& s) {
    const std::string lower = to_lower_ascii(s);
    return contains_any(lower, {
        "%2e", "%2f", "%5c",
        "%252e", "%252f", "%255c",
        "%c0%ae", "%c0%af",
        "\\u", "\\x",
    });
}

bool contains_suspicious_os_path(const std::string& s) {
    return s.find("/proc/") != npos || s.find("/dev/") != npos;
}

bool has_extended_length_prefix(const std::string& s) {
    return s.find("\\\\?\\") != npos;
}

bool contains_null_byte(const std::string& s) {
    return s.find('\0') != npos || s.find("%00") != npos;
}

bool contains_control_character(const std::string& s) {
    for (char c : s) {
        const auto b = static_cast<unsigned char>(c);
        if (b < 0x20 && b != '\t') {
            return true;
        }
    }
    return false;
}

// ============================================================================
// UTF-8
// ============================================================================

bool contains_overlong_utf8(const std::string& s) {
    for (size_t i = 0; i < s.size(); ++i) {
        const auto b = static_cast<unsigned char>(s[i]);
        if (b == 0xC0 || b == 0xC1) {
            return true;
        }
        if (i + 1 < s.size()) {
            const auto next = static_cast<unsigned char>(s[i + 1]);
            if (b == 0xE0 && next >= 0x80 && next <= 0x9F) return true;
            if (b == 0xF0 && next >= 0x80 && next <= 0x8F) return true;
        }
    }
    return false;
}

bool is_valid_utf8(const std::string& s) {
    size_t i = 0;
    char32_t cp = 0;
    while (i < s.size()) {
        if (!decode_utf8(s, i, cp)) {
            return false;
        }
    }
    return true;
}

bool contains_confusable_separator(const std::string& s) {
    for (const char* seq : kConfusableSeparators) {
        if (s.find(seq) != npos) return true;
    }
    return false;
}

std::string fold_case_utf8(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    size_t i = 0;
    char32_t cp = 0;
    while (i < s.size()) {
        if (!decode_utf8(s, i, cp)) {
            return s;
        }
        const UChar32 folded = u_foldCase(static_cast<UChar32>(cp), U_FOLD_CASE_DEFAULT);
        encode_utf8(static_cast<char32_t>(folded), out);
    }
    return out;
}

// ============================================================================
// Windows Forms
// ============================================================================

bool is_unc_path(const std::string& s) {
    return s.find("\\\\") != npos;
}

bool is_drive_path(const std::string& s) {
    return s.size() > 1 && s[1] == ':';
}

bool contains_alternate_data_stream(const std::string& s) {
    if (to_upper_ascii(s).find(":$DATA") != npos) {
        return true;
    }
    return s.find(':') != npos && s.find('$') != npos;
}

bool is_windows_reserved_name(const std::string& s) {
    const std::string base = to_upper_ascii(base_name(s));
    if (base.empty()) {
        return false;
    }

    // Windows ignores everything from the first dot: NUL.tar.gz is NUL
    std::string stem = base;
    size_t dot = base.find('.');
    if (dot != npos && dot > 0) {
        stem = base.substr(0, dot);
    }
    // and trailing spaces: "CON " is CON
    size_t last = stem.find_last_not_of(' ');
    if (last != npos) {
        stem.erase(last + 1);
    }

    for (const char* reserved : kReservedNames) {
        if (stem == reserved || base == reserved) {
            return true;
        }
    }
    return false;
}

bool has_trailing_dot_or_space(const std::string& s) {
    return !s.empty() && (s.back() == '.' || s.back() == ' ');
}

bool exceeds_length(const std::string& s, std::size_t max_length) {
    return s.size() > max_length;
}

// ============================================================================
// Combined Scan
// ============================================================================

std::optional<Detector> find_violation(const std::string& s, std::size_t max_length) {
    if (exceeds_length(s, max_length)) return Detector::Length;
    if (contains_null_byte(s)) return Detector::NullByte;
    if (contains_control_character(s)) return Detector::ControlCharacter;
    if (contains_traversal(s)) return Detector::Traversal;
    if (contains_encoded_sequence(s)) return Detector::EncodedSequence;
    if (contains_suspicious_os_path(s)) return Detector::SuspiciousOsPath;
    if (has_extended_length_prefix(s)) return Detector::ExtendedLengthPrefix;
    if (is_unc_path(s)) return Detector::UncPath;
    if (is_drive_path(s)) return Detector::DrivePath;
    if (contains_alternate_data_stream(s)) return Detector::AlternateDataStream;
    if (has_trailing_dot_or_space(s)) return Detector::TrailingDotOrSpace;
    if (is_windows_reserved_name(s)) return Detector::WindowsReservedName;
    if (contains_overlong_utf8(s)) return Detector::OverlongUtf8;
    if (!is_valid_utf8(s)) return Detector::InvalidUtf8;
    if (contains_confusable_separator(s)) return Detector::ConfusableSeparator;
    return std::nullopt;
}

} // namespace pathguard
