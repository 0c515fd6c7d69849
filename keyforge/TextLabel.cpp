/**
 * @file TextLabel.cpp
 * @brief Text-Solid Builder implementation
 */

#include "TextLabel.h"
#include "Frame.h"
#include "Errors.h"
#include "Diagnostics.h"
#include "backend/BooleanCombine.h"
#include "backend/Extrude.h"

#include <algorithm>
#include <cctype>
#include <utility>

namespace keyforge {

namespace {

bool isBlank(const std::string& text) {
    return std::all_of(text.begin(), text.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

} // anonymous namespace

Solid buildLabel(const std::vector<std::string>& lines,
                 double lineHeight,
                 double extrudeDepth,
                 const Vec3& faceCenter,
                 const Vec3& faceNormal,
                 const IGlyphSource& glyphs,
                 IBooleanBackend& backend,
                 double overlapEps,
                 const std::string& name) {
    requirePositive("line_height", lineHeight);
    requirePositive("extrude_depth", extrudeDepth);
    requirePositive("overlap_epsilon", overlapEps);

    Solid label(name);
    if (lines.empty()) {
        return label;
    }

    const FaceFrame frame = computeFaceFrame(faceNormal);
    const double spacing = lineHeight * kLineSpacingRatio;
    const double first_offset = 0.5 * static_cast<double>(lines.size() - 1) * spacing;

    for (size_t i = 0; i < lines.size(); ++i) {
        if (isBlank(lines[i])) continue;

        const std::string line_name = name + "_line" + std::to_string(i);
        const Contours contours = glyphs.outlineLine(lines[i], lineHeight);
        if (contours.empty()) continue;

        Solid line = extrudeContours(contours, extrudeDepth + overlapEps, line_name);
        if (line.empty()) {
            KEYFORGE_LOG_WARN("Label line %zu (\"%s\") produced no solid", i, lines[i].c_str());
            continue;
        }

        // Prism-local z in [0, depth + eps] -> [-eps, depth] along the normal
        const double up_offset = first_offset - static_cast<double>(i) * spacing;
        for (auto& v : line.vertices) {
            v = frame.toWorld(faceCenter, {v[0], v[1] + up_offset, v[2] - overlapEps});
        }

        BooleanResult merged = combine(backend, label, line, BooleanOp::Union);
        if (!merged.success) {
            KEYFORGE_LOG_WARN("Label line %zu (\"%s\") could not be merged: %s",
                              i, lines[i].c_str(), merged.error_message.c_str());
            continue;
        }
        label = std::move(merged.output);
        label.name = name;
    }

    return label;
}

} // namespace keyforge
