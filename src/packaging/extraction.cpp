#include "pathguard/extraction.hpp"
#include "pathguard/containment.hpp"
#include "pathguard/detectors.hpp"
#include "pathguard/path.hpp"
#include "pathguard/platform.hpp"

#include <algorithm>
#include <sstream>
#include <vector>

#include <spdlog/spdlog.h>

namespace pathguard {

namespace {

ExtractionPathResult reject(ExtractionPathResult& result, const std::string& error) {
    spdlog::debug("rejecting archive entry: {}", error);
    result.error = error;
    return result;
}

} // namespace

ExtractionPathResult validate_extraction_path(const std::string& entry_path,
                                              const std::string& extraction_root) {
    ExtractionPathResult result;

    if (entry_path.empty()) {
        return reject(result, "empty entry path");
    }
    if (extraction_root.empty()) {
        return reject(result, "empty extraction root");
    }

    // Reject absolute paths, in every platform's spelling
    if (entry_path[0] == '/' || entry_path[0] == '\\' || is_drive_path(entry_path) ||
        is_unc_path(entry_path)) {
        return reject(result, "absolute path not allowed: " + entry_path);
    }

    // Archives written on Windows use backslashes
    std::string portable = entry_path;
    std::replace(portable.begin(), portable.end(), '\\', '/');

    // Normalize path and check for traversal
    std::vector<std::string> normalized;
    std::istringstream ss(portable);
    std::string component;
    while (std::getline(ss, component, '/')) {
        if (component == "..") {
            return reject(result, "path traversal not allowed: " + entry_path);
        }
        if (component != "." && !component.empty()) {
            normalized.push_back(component);
        }
    }
    if (normalized.empty()) {
        return reject(result, "entry resolves to the extraction root: " + entry_path);
    }

    std::string relative;
    for (const auto& part : normalized) {
        if (!relative.empty()) relative += '/';
        relative += part;
    }

    if (auto violation = find_violation(relative)) {
        return reject(result, std::string("unsafe entry path (") + detector_to_string(*violation) +
                                  "): " + entry_path);
    }

    // Verify the path stays within extraction root
    auto root = make_absolute(extraction_root);
    if (!root) {
        return reject(result, "cannot resolve extraction root: " + extraction_root);
    }
    auto under_root = normalize_under_root(*root, relative);
    if (!under_root.ok) {
        return reject(result, std::string("path escapes extraction root: ") + entry_path + " (" +
                                  path_error_to_string(under_root.error) + ")");
    }
    auto containment = check_containment(under_root.path, *root);
    if (!containment.contained) {
        return reject(result, "path escapes extraction root: " + entry_path);
    }

    result.safe = true;
    result.normalized_path = relative;
    result.destination = under_root.path;
    return result;
}

} // namespace pathguard
