#pragma once

// Umbrella header for the pathguard library.

#include "pathguard/containment.hpp"
#include "pathguard/detectors.hpp"
#include "pathguard/extraction.hpp"
#include "pathguard/path.hpp"
#include "pathguard/platform.hpp"
#include "pathguard/policy.hpp"
#include "pathguard/rule_validator.hpp"
#include "pathguard/rules.hpp"
#include "pathguard/safety_checker.hpp"
#include "pathguard/types.hpp"

namespace pathguard {

constexpr const char* PATHGUARD_VERSION = "1.0.0";
constexpr int PATHGUARD_VERSION_MAJOR = 1;
constexpr int PATHGUARD_VERSION_MINOR = 0;
constexpr int PATHGUARD_VERSION_PATCH = 0;

} // namespace pathguard
