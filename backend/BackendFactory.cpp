/**
 * @file BackendFactory.cpp
 * @brief Factory implementation for creating Boolean backend instances
 */

#include "BackendFactory.h"
#include "ManifoldBackend.h"

#include <cctype>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace keyforge {

namespace {

//=============================================================================
// NAME NORMALIZATION
//=============================================================================

std::string normalizeBackendName(const std::string& name) {
    std::string result;
    result.reserve(name.size());
    for (char c : name) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            result.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
    }
    return result;
}

std::vector<std::string> getBackendPreferenceOrder() {
    return {"manifold"};
}

} // anonymous namespace

//=============================================================================
// PUBLIC FACTORY
//=============================================================================

std::unique_ptr<IBooleanBackend> createBackend(const std::string& name) {
    const std::string n = normalizeBackendName(name);

    if (n == "manifold") return std::make_unique<ManifoldBackend>();

    if (n == "auto") {
        return createBackend(getDefaultBackendName());
    }

    throw std::invalid_argument(
        "Unknown backend: '" + name + "'. Supported: manifold, auto");
}

//=============================================================================
// UTILITY FUNCTIONS
//=============================================================================

std::vector<std::string> getAvailableBackends() {
    return getBackendPreferenceOrder();
}

std::string getDefaultBackendName() {
    return getBackendPreferenceOrder().front();
}

} // namespace keyforge
