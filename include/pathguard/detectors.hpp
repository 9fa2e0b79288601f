#pragma once

#include "pathguard/types.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace pathguard {

// ============================================================================
// Attack-Pattern Detectors
// ============================================================================
//
// Each detector is a pure predicate over the raw bytes of a path string and
// returns true when the string is UNSAFE for that detector. None of them
// touch the filesystem, allocate beyond small temporaries, or throw on
// malformed input (embedded NULs and invalid UTF-8 included).

enum class Detector {
    Traversal,            // "..", %2e%2e, %252e%252e, \u002e\u002e, \x2e\x2e
    EncodedSequence,      // any %2e / %2f fragment, literal \u or \x escapes
    SuspiciousOsPath,     // /proc/ or /dev/
    ExtendedLengthPrefix, // \\?\ prefix
    NullByte,             // NUL or %00
    ControlCharacter,     // byte < 0x20 other than tab
    OverlongUtf8,         // C0/C1 lead bytes, \xc0\xaf
    InvalidUtf8,          // anything failing strict UTF-8 decoding
    ConfusableSeparator,  // Unicode look-alikes of / and \ (U+2044, ...)
    UncPath,              // double backslash anywhere
    DrivePath,            // second character is ':'
    AlternateDataStream,  // :$DATA, or ':' together with '$'
    WindowsReservedName,  // CON, PRN, AUX, NUL, COM1-9, LPT1-9, CONIN$, CONOUT$
    TrailingDotOrSpace,   // ends with '.' or ' '
    Length,               // longer than the configured bound
};

const char* detector_to_string(Detector d);

bool contains_traversal(const std::string& s);
bool contains_encoded_sequence(const std::string& s);
bool contains_suspicious_os_path(const std::string& s);
bool has_extended_length_prefix(const std::string& s);
bool contains_null_byte(const std::string& s);
bool contains_control_character(const std::string& s);
bool contains_overlong_utf8(const std::string& s);
bool is_valid_utf8(const std::string& s);
bool contains_confusable_separator(const std::string& s);
bool is_unc_path(const std::string& s);
bool is_drive_path(const std::string& s);
bool contains_alternate_data_stream(const std::string& s);
bool is_windows_reserved_name(const std::string& s);
bool has_trailing_dot_or_space(const std::string& s);
bool exceeds_length(const std::string& s, std::size_t max_length = DEFAULT_MAX_PATH_LENGTH);

// Run every detector, cheapest first. Returns the first one that fires.
std::optional<Detector> find_violation(const std::string& s,
                                       std::size_t max_length = DEFAULT_MAX_PATH_LENGTH);

// ============================================================================
// UTF-8 Helpers
// ============================================================================

// Unicode simple case folding (ICU), code point by code point, so two
// strings fold equal exactly when they differ only in case. Invalid UTF-8 is
// returned unchanged.
std::string fold_case_utf8(const std::string& s);

} // namespace pathguard
