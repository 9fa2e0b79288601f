#pragma once

#include <string>

namespace pathguard {

// ============================================================================
// Safe Archive Extraction
// ============================================================================

// Extraction safety checks for archive entries:
//   - Reject empty and absolute entries (including drive and UNC forms)
//   - Reject any ".." component
//   - Reject entries that fail the attack-pattern detectors
//   - Reject entries whose destination escapes the extraction root

struct ExtractionPathResult {
    bool safe = false;
    std::string error;
    std::string normalized_path;  // Normalized relative path
    std::string destination;      // Absolute destination under the root
};

ExtractionPathResult validate_extraction_path(const std::string& entry_path,
                                              const std::string& extraction_root);

} // namespace pathguard
