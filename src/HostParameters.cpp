/**
 * @file HostParameters.cpp
 * @brief Parameter definitions for the keyforge command-line host
 */

#include "HostParameters.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <utility>

namespace keyforge {
namespace HostParameters {

namespace {

std::string trim(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(begin, end - begin);
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

double toDouble(const std::string& key, const std::string& value) {
    const std::string text = trim(value);
    if (text.empty()) {
        throw ConfigError(key, "expected a number, got an empty value");
    }
    char* end = nullptr;
    errno = 0;
    const double v = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size() || errno == ERANGE || !std::isfinite(v)) {
        throw ConfigError(key, "expected a number, got '" + text + "'");
    }
    return v;
}

int toInt(const std::string& key, const std::string& value) {
    const std::string text = trim(value);
    if (text.empty()) {
        throw ConfigError(key, "expected an integer, got an empty value");
    }
    char* end = nullptr;
    errno = 0;
    const long v = std::strtol(text.c_str(), &end, 10);
    if (end != text.c_str() + text.size() || errno == ERANGE ||
        v < -2147483647L || v > 2147483647L) {
        throw ConfigError(key, "expected an integer, got '" + text + "'");
    }
    return static_cast<int>(v);
}

std::vector<std::string> splitLines(const std::string& value) {
    std::vector<std::string> lines;
    std::string current;
    for (char c : value) {
        if (c == '|') {
            lines.push_back(trim(current));
            current.clear();
        } else {
            current += c;
        }
    }
    lines.push_back(trim(current));
    return lines;
}

// "r,g,b" or "r,g,b,a"
std::array<double, 4> toColor(const std::string& key, const std::string& value) {
    std::array<double, 4> color = {0.0, 0.0, 0.0, 1.0};
    std::stringstream ss(value);
    std::string part;
    size_t n = 0;
    while (std::getline(ss, part, ',')) {
        if (n == 4) {
            throw ConfigError(key, "expected 3 or 4 comma-separated components");
        }
        color[n++] = toDouble(key, part);
    }
    if (n < 3) {
        throw ConfigError(key, "expected 3 or 4 comma-separated components");
    }
    return color;
}

//=============================================================================
// PARAMETER TABLE
//=============================================================================

using Setter = void (*)(Settings&, const std::string& key, const std::string& value);

struct ParameterEntry {
    const char* name;
    const char* label;
    Setter set;
};

static const ParameterEntry parameterTable[] = {
    // Book body
    {"book_width", "Book Width (X)",
     [](Settings& s, const std::string& k, const std::string& v) { s.spec.book_width = toDouble(k, v); }},
    {"book_height", "Book Height (Z)",
     [](Settings& s, const std::string& k, const std::string& v) { s.spec.book_height = toDouble(k, v); }},
    {"book_depth", "Book Depth (Y), also spine diameter",
     [](Settings& s, const std::string& k, const std::string& v) { s.spec.book_depth = toDouble(k, v); }},
    {"cover_thickness", "Cover Thickness",
     [](Settings& s, const std::string& k, const std::string& v) { s.spec.cover_thickness = toDouble(k, v); }},

    // Carabiner loop
    {"loop_outer_radius", "Loop Outer Radius",
     [](Settings& s, const std::string& k, const std::string& v) { s.spec.loop_outer_radius = toDouble(k, v); }},
    {"loop_inner_radius", "Loop Inner Radius",
     [](Settings& s, const std::string& k, const std::string& v) { s.spec.loop_inner_radius = toDouble(k, v); }},
    {"loop_thickness", "Loop Thickness",
     [](Settings& s, const std::string& k, const std::string& v) { s.spec.loop_thickness = toDouble(k, v); }},
    {"loop_overlap", "Loop Overlap Into Body",
     [](Settings& s, const std::string& k, const std::string& v) { s.spec.loop_overlap = toDouble(k, v); }},

    // Label
    {"text_lines", "Label Lines (split on '|')",
     [](Settings& s, const std::string&, const std::string& v) { s.spec.text_lines = splitLines(v); }},
    {"text_size", "Label Line Height",
     [](Settings& s, const std::string& k, const std::string& v) { s.spec.text_size = toDouble(k, v); }},
    {"text_extrude", "Label Extrude Depth",
     [](Settings& s, const std::string& k, const std::string& v) { s.spec.text_extrude = toDouble(k, v); }},
    {"label_mode", "Label Mode (union|difference)",
     [](Settings& s, const std::string& k, const std::string& v) {
         const std::string mode = lower(trim(v));
         if (mode == "union" || mode == "emboss") {
             s.config.label_mode = LabelMode::Emboss;
         } else if (mode == "difference" || mode == "engrave") {
             s.config.label_mode = LabelMode::Engrave;
         } else {
             throw ConfigError(k, "expected union or difference, got '" + trim(v) + "'");
         }
     }},
    {"font_path", "Font File (empty: block font)",
     [](Settings& s, const std::string&, const std::string& v) { s.config.font_path = trim(v); }},

    // Page lines
    {"page_line_count", "Page Line Count",
     [](Settings& s, const std::string& k, const std::string& v) { s.spec.page_line_count = toInt(k, v); }},
    {"page_line_depth", "Page Line Depth (X)",
     [](Settings& s, const std::string& k, const std::string& v) { s.spec.page_line_depth = toDouble(k, v); }},
    {"page_line_thickness", "Page Line Thickness (Y)",
     [](Settings& s, const std::string& k, const std::string& v) { s.spec.page_line_thickness = toDouble(k, v); }},
    {"page_line_height_ratio", "Page Line Height / Book Height",
     [](Settings& s, const std::string& k, const std::string& v) { s.spec.page_line_height_ratio = toDouble(k, v); }},

    {"cylinder_segments", "Cylinder Segments",
     [](Settings& s, const std::string& k, const std::string& v) { s.spec.cylinder_segments = toInt(k, v); }},

    // Material
    {"material_name", "Material Name",
     [](Settings& s, const std::string&, const std::string& v) { s.config.material.name = trim(v); }},
    {"base_color", "Base Color (r,g,b[,a])",
     [](Settings& s, const std::string& k, const std::string& v) { s.config.material.base_color = toColor(k, v); }},
    {"roughness", "Roughness",
     [](Settings& s, const std::string& k, const std::string& v) { s.config.material.roughness = toDouble(k, v); }},
    {"specular", "Specular",
     [](Settings& s, const std::string& k, const std::string& v) { s.config.material.specular = toDouble(k, v); }},

    // Run
    {"backend", "Boolean Backend (auto|manifold)",
     [](Settings& s, const std::string&, const std::string& v) { s.config.backend = lower(trim(v)); }},
    {"output_name", "Output Object Name",
     [](Settings& s, const std::string&, const std::string& v) { s.config.output_name = trim(v); }},
    {"unit", "Output Unit (mm|m)",
     [](Settings& s, const std::string& k, const std::string& v) {
         const std::string unit = lower(trim(v));
         if (unit == "mm") {
             s.config.target_unit_scale = 1.0;
         } else if (unit == "m") {
             s.config.target_unit_scale = 0.001;
         } else {
             throw ConfigError(k, "expected mm or m, got '" + trim(v) + "'");
         }
     }},
    {"output", "Output File",
     [](Settings& s, const std::string& k, const std::string& v) {
         const std::string path = trim(v);
         if (path.empty()) {
             throw ConfigError(k, "output path cannot be empty");
         }
         s.output = path;
     }},
    {"format", "Output Format (obj|stl)",
     [](Settings& s, const std::string& k, const std::string& v) {
         const std::string format = lower(trim(v));
         if (format == "obj") {
             s.format = OutputFormat::Obj;
         } else if (format == "stl") {
             s.format = OutputFormat::Stl;
         } else {
             throw ConfigError(k, "expected obj or stl, got '" + trim(v) + "'");
         }
     }},
};

} // anonymous namespace

//=============================================================================
// PUBLIC API
//=============================================================================

void apply(Settings& settings, const std::string& key, const std::string& value) {
    const std::string name = trim(key);
    for (const auto& entry : parameterTable) {
        if (name == entry.name) {
            entry.set(settings, name, value);
            return;
        }
    }
    throw ConfigError(name, "unknown parameter");
}

void parseConfig(Settings& settings, std::istream& in, const std::string& sourceName) {
    std::string line;
    int line_number = 0;
    while (std::getline(in, line)) {
        ++line_number;
        const size_t hash = line.find('#');
        if (hash != std::string::npos) {
            line.erase(hash);
        }
        line = trim(line);
        if (line.empty()) {
            continue;
        }

        const size_t eq = line.find('=');
        if (eq == std::string::npos) {
            throw ConfigError("", sourceName + ":" + std::to_string(line_number) +
                                  ": expected 'key = value', got '" + line + "'");
        }

        const std::string key = trim(line.substr(0, eq));
        try {
            apply(settings, key, line.substr(eq + 1));
        } catch (const ConfigError& e) {
            throw ConfigError(e.key(), sourceName + ":" + std::to_string(line_number) + ": " + e.detail());
        }
    }
}

void loadConfigFile(Settings& settings, const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("config", "cannot open '" + path + "'");
    }
    parseConfig(settings, in, path);
}

Settings parseCommandLine(int argc, const char* const* argv) {
    Settings settings;
    std::vector<std::string> config_files;
    std::vector<std::pair<std::string, std::string>> overrides;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            settings.show_help = true;
        } else if (arg == "--timing") {
            settings.print_timing = true;
        } else if (arg == "--config") {
            if (i + 1 >= argc) {
                throw ConfigError("config", "missing file after --config");
            }
            config_files.push_back(argv[++i]);
        } else if (arg.compare(0, 9, "--config=") == 0) {
            config_files.push_back(arg.substr(9));
        } else if (arg.compare(0, 2, "--") == 0) {
            const size_t eq = arg.find('=');
            if (eq == std::string::npos) {
                throw ConfigError(arg.substr(2), "expected --key=value");
            }
            overrides.emplace_back(arg.substr(2, eq - 2), arg.substr(eq + 1));
        } else {
            throw ConfigError("", "unexpected argument '" + arg + "'");
        }
    }

    for (const auto& path : config_files) {
        loadConfigFile(settings, path);
    }
    for (const auto& [key, value] : overrides) {
        apply(settings, key, value);
    }
    return settings;
}

std::vector<std::string> getParameterNames() {
    std::vector<std::string> names;
    for (const auto& entry : parameterTable) {
        names.push_back(entry.name);
    }
    return names;
}

const char* formatName(OutputFormat format) {
    switch (format) {
        case OutputFormat::Obj: return "obj";
        case OutputFormat::Stl: return "stl";
    }
    return "unknown";
}

void printUsage(std::FILE* out, const char* program) {
    std::fprintf(out, "Usage: %s [--config <file>] [--key=value ...] [--timing] [--help]\n\n", program);
    std::fprintf(out, "Parameters:\n");
    for (const auto& entry : parameterTable) {
        std::fprintf(out, "  --%-24s %s\n", entry.name, entry.label);
    }
    std::fprintf(out, "\nExit codes: 0 success, 1 generation or export failure, 2 usage error\n");
}

} // namespace HostParameters
} // namespace keyforge
