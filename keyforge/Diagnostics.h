/**
 * @file Diagnostics.h
 * @brief Diagnostic logging system for the keyforge solid generator
 */

#pragma once

#include <chrono>
#include <cstdio>
#include <iostream>
#include <string>
#include <vector>

namespace keyforge {

//=============================================================================
// DIAGNOSTIC CATEGORIES
//=============================================================================

enum class DiagCategory {
    Degenerate,         // Zero-area or repeated-index faces
    NonManifold,        // Edge shared by more than two faces
    NotWatertight,      // Mesh has boundary edges
    InconsistentWinding,// Directed edge used twice
    InvalidParameter,   // Dimension, count or scale out of domain
    BooleanFailed,      // Solver rejected or produced an invalid result
    EmptyOperand,       // Operand with zero faces
    Info,               // Informational message
    Warning,            // General warning
    Error               // Fatal error
};

//=============================================================================
// DIAGNOSTIC ENTRY
//=============================================================================

struct DiagEntry {
    DiagCategory category;
    std::string message;
    int count;  // For aggregated messages (e.g., "N boundary edges")

    DiagEntry(DiagCategory cat, const std::string& msg, int cnt = 0)
        : category(cat), message(msg), count(cnt) {}
};

//=============================================================================
// DIAGNOSTIC LOG
//=============================================================================

class DiagnosticLog {
public:
    std::vector<DiagEntry> entries;
    bool has_fatal = false;
    bool has_errors = false;

    // Add a warning entry
    void warn(DiagCategory cat, const std::string& msg, int count = 0) {
        entries.emplace_back(cat, msg, count);
    }

    // Add a non-fatal error entry
    void error(DiagCategory cat, const std::string& msg, int count = 0) {
        entries.emplace_back(cat, msg, count);
        has_errors = true;
    }

    // Add a fatal error entry
    void fatal(DiagCategory cat, const std::string& msg) {
        entries.emplace_back(cat, "FATAL: " + msg, 0);
        has_fatal = true;
        has_errors = true;
    }

    // Add an info entry
    void info(const std::string& msg) {
        entries.emplace_back(DiagCategory::Info, msg, 0);
    }

    void merge(const DiagnosticLog& other) {
        entries.insert(entries.end(), other.entries.begin(), other.entries.end());
        has_fatal = has_fatal || other.has_fatal;
        has_errors = has_errors || other.has_errors;
    }

    bool hasErrors() const {
        return has_errors;
    }

    size_t countOf(DiagCategory cat) const {
        size_t n = 0;
        for (const auto& entry : entries) {
            if (entry.category == cat) ++n;
        }
        return n;
    }

    // Print all entries to stderr
    void print() const {
        for (const auto& entry : entries) {
            const char* prefix = "";
            switch (entry.category) {
                case DiagCategory::Info: prefix = "[KEYFORGE INFO] "; break;
                case DiagCategory::Warning: prefix = "[KEYFORGE WARN] "; break;
                case DiagCategory::Error: prefix = "[KEYFORGE ERROR] "; break;
                case DiagCategory::Degenerate: prefix = "[KEYFORGE DEGENERATE] "; break;
                case DiagCategory::NonManifold: prefix = "[KEYFORGE NON-MANIFOLD] "; break;
                case DiagCategory::NotWatertight: prefix = "[KEYFORGE WATERTIGHT] "; break;
                case DiagCategory::InconsistentWinding: prefix = "[KEYFORGE WINDING] "; break;
                case DiagCategory::InvalidParameter: prefix = "[KEYFORGE PARAMETER] "; break;
                case DiagCategory::BooleanFailed: prefix = "[KEYFORGE BOOLEAN] "; break;
                case DiagCategory::EmptyOperand: prefix = "[KEYFORGE EMPTY] "; break;
            }
            std::cerr << prefix << entry.message;
            if (entry.count > 0) {
                std::cerr << " (count: " << entry.count << ")";
            }
            std::cerr << std::endl;
        }
    }
};

//=============================================================================
// LOGGING MACROS
//=============================================================================

#define KEYFORGE_LOG_INFO(fmt, ...)  do { std::printf("[KEYFORGE] " fmt "\n", ##__VA_ARGS__); } while(0)
#define KEYFORGE_LOG_WARN(fmt, ...)  do { std::printf("[KEYFORGE WARN] " fmt "\n", ##__VA_ARGS__); } while(0)
#define KEYFORGE_LOG_ERROR(fmt, ...) do { std::fprintf(stderr, "[KEYFORGE ERROR] " fmt "\n", ##__VA_ARGS__); } while(0)

#ifdef KEYFORGE_VERBOSE
#define KEYFORGE_LOG_DEBUG(fmt, ...) do { std::printf("[KEYFORGE DEBUG] " fmt "\n", ##__VA_ARGS__); } while(0)
#else
#define KEYFORGE_LOG_DEBUG(fmt, ...) do { } while(0)
#endif

//=============================================================================
// SCOPED TIMER
//=============================================================================

/**
 * @brief Logs the wall time of the enclosing scope at debug level
 */
class ScopedTimer {
public:
    explicit ScopedTimer(const char* label)
        : label_(label), start_(std::chrono::steady_clock::now()) {}

    ~ScopedTimer() {
        const double ms = elapsedMs();
        KEYFORGE_LOG_DEBUG("%s: %.2f ms", label_, ms);
        (void)ms;
    }

    double elapsedMs() const {
        return std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - start_).count();
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    const char* label_;
    std::chrono::steady_clock::time_point start_;
};

#define KEYFORGE_SCOPED_TIMER_CAT2(a, b) a##b
#define KEYFORGE_SCOPED_TIMER_CAT(a, b) KEYFORGE_SCOPED_TIMER_CAT2(a, b)
#define KEYFORGE_SCOPED_TIMER(label) \
    ::keyforge::ScopedTimer KEYFORGE_SCOPED_TIMER_CAT(keyforge_timer_, __LINE__)(label)

} // namespace keyforge
