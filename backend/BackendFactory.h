// ═══════════════════════════════════════════════════════════════════════════════
// KEYFORGE BackendFactory.h: Creates IBooleanBackend instances by name
// ═══════════════════════════════════════════════════════════════════════════════
//
// Supported backends: "manifold" ("auto" resolves to the first available one).
// Unknown names throw std::invalid_argument.

#pragma once

#include "IBooleanBackend.h"
#include <memory>
#include <string>
#include <vector>

namespace keyforge {

/// Create a backend by name.
/// NOTE: This is also declared in IBooleanBackend.h for callers that only
///       need the interface. The definition lives in BackendFactory.cpp.
std::unique_ptr<IBooleanBackend> createBackend(const std::string& name);

/// Backend names in preference order ("auto" picks the first).
std::vector<std::string> getAvailableBackends();

/// Name "auto" resolves to.
std::string getDefaultBackendName();

} // namespace keyforge
