/**
 * @file HostParameters.h
 * @brief Command-line parameter definitions for the keyforge host
 *
 * This file provides host-specific parameter handling.
 * The core parameter structs are defined in keyforge/Parameters.h and
 * pipeline/KeyforgePipeline.h.
 *
 * Sources, applied in order:
 *   --config <file>   key = value lines, '#' comments, text lines split on '|'
 *   --key=value       overrides, any key the config file accepts
 */

#pragma once

#include "keyforge/Parameters.h"
#include "pipeline/KeyforgePipeline.h"

#include <cstdio>
#include <istream>
#include <stdexcept>
#include <string>
#include <vector>

namespace keyforge {
namespace HostParameters {

    enum class OutputFormat {
        Obj,
        Stl
    };

    /**
     * @brief Everything one invocation of the host needs
     */
    struct Settings {
        DimensionSpec spec;
        PipelineConfig config;

        std::string output = "BibleKeyring.obj";
        OutputFormat format = OutputFormat::Obj;
        bool show_help = false;
        bool print_timing = false;
    };

    /**
     * @brief Malformed configuration; what() names the offending key
     */
    class ConfigError : public std::runtime_error {
    public:
        ConfigError(const std::string& key, const std::string& detail)
            : std::runtime_error(key.empty() ? detail : "'" + key + "': " + detail)
            , key_(key)
            , detail_(detail) {}

        const std::string& key() const { return key_; }
        const std::string& detail() const { return detail_; }

    private:
        std::string key_;
        std::string detail_;
    };

    // Set one parameter from its textual value
    void apply(Settings& settings, const std::string& key, const std::string& value);

    // Parse key = value lines; sourceName prefixes line numbers in errors
    void parseConfig(Settings& settings, std::istream& in, const std::string& sourceName);

    void loadConfigFile(Settings& settings, const std::string& path);

    /**
     * @brief Build settings from argv
     *
     * Config files are applied before any --key=value override,
     * whatever their position on the command line.
     *
     * @throws ConfigError on unknown keys, malformed values, missing files
     */
    Settings parseCommandLine(int argc, const char* const* argv);

    // Every key accepted by apply()
    std::vector<std::string> getParameterNames();

    const char* formatName(OutputFormat format);

    void printUsage(std::FILE* out, const char* program);

} // namespace HostParameters
} // namespace keyforge
