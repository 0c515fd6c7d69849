/**
 * @file keyforge/Parameters.cpp
 * @brief Dimension validation and the overlap tolerance
 */

#include "Parameters.h"
#include "Errors.h"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace keyforge {

void requirePositive(const char* parameter, double value) {
    if (!std::isfinite(value) || value <= 0.0) {
        std::ostringstream oss;
        oss << "must be positive, got " << value;
        throw InvalidParameterError(parameter, oss.str());
    }
}

double DimensionSpec::smallestFeature() const {
    const double lengths[] = {
        book_width, book_height, book_depth, cover_thickness,
        loop_outer_radius, loop_inner_radius, loop_thickness, loop_overlap,
        text_size, text_extrude,
        page_line_depth, page_line_thickness,
    };

    double smallest = 0.0;
    for (double v : lengths) {
        if (v > 0.0 && (smallest == 0.0 || v < smallest)) {
            smallest = v;
        }
    }
    return smallest;
}

double overlapEpsilon(const DimensionSpec& spec) {
    return std::max(1e-4, 0.05 * spec.smallestFeature());
}

const char* labelModeName(LabelMode mode) {
    switch (mode) {
        case LabelMode::Emboss:  return "union";
        case LabelMode::Engrave: return "difference";
    }
    return "?";
}

//=============================================================================
// VALIDATION
//=============================================================================

namespace {

void checkPositive(const char* name, double value, bool& valid, DiagnosticLog& log) {
    if (!std::isfinite(value) || value <= 0.0) {
        std::ostringstream oss;
        oss << name << " must be positive (got " << value << ")";
        log.error(DiagCategory::InvalidParameter, oss.str());
        valid = false;
    }
}

} // anonymous namespace

bool validateDimensions(const DimensionSpec& spec, DiagnosticLog& log) {
    bool valid = true;

    checkPositive("book_width", spec.book_width, valid, log);
    checkPositive("book_height", spec.book_height, valid, log);
    checkPositive("book_depth", spec.book_depth, valid, log);
    checkPositive("cover_thickness", spec.cover_thickness, valid, log);
    checkPositive("loop_outer_radius", spec.loop_outer_radius, valid, log);
    checkPositive("loop_inner_radius", spec.loop_inner_radius, valid, log);
    checkPositive("loop_thickness", spec.loop_thickness, valid, log);
    checkPositive("text_size", spec.text_size, valid, log);
    checkPositive("text_extrude", spec.text_extrude, valid, log);
    checkPositive("page_line_depth", spec.page_line_depth, valid, log);
    checkPositive("page_line_thickness", spec.page_line_thickness, valid, log);
    checkPositive("page_line_height_ratio", spec.page_line_height_ratio, valid, log);

    if (spec.loop_overlap < 0.0) {
        log.error(DiagCategory::InvalidParameter, "loop_overlap cannot be negative");
        valid = false;
    }

    if (spec.loop_inner_radius >= spec.loop_outer_radius) {
        log.error(DiagCategory::InvalidParameter,
                  "loop_inner_radius must be smaller than loop_outer_radius");
        valid = false;
    }

    // The hole must clear the body top or the carabiner cannot pass
    if (spec.loop_overlap >= spec.loop_outer_radius - spec.loop_inner_radius) {
        log.error(DiagCategory::InvalidParameter,
                  "loop_overlap must be smaller than the ring wall (outer - inner radius)");
        valid = false;
    }

    if (spec.cylinder_segments < 3) {
        log.error(DiagCategory::InvalidParameter,
                  "cylinder_segments must be at least 3 (got " +
                  std::to_string(spec.cylinder_segments) + ")");
        valid = false;
    }

    if (spec.page_line_count < 0) {
        log.error(DiagCategory::InvalidParameter,
                  "page_line_count cannot be negative (got " +
                  std::to_string(spec.page_line_count) + ")");
        valid = false;
    } else if (spec.page_line_count > kMaxPageLineCount) {
        log.error(DiagCategory::InvalidParameter,
                  "page_line_count cannot exceed " + std::to_string(kMaxPageLineCount) +
                  " (got " + std::to_string(spec.page_line_count) + ")");
        valid = false;
    }

    if (spec.page_line_height_ratio > 1.0) {
        log.warn(DiagCategory::Warning, "page_line_height_ratio above 1.0, page lines overhang the body");
    }

    if (2.0 * spec.cover_thickness >= spec.book_depth) {
        log.error(DiagCategory::InvalidParameter,
                  "cover_thickness leaves no room for page lines (2 * cover >= book_depth)");
        valid = false;
    }

    if (spec.page_line_count > 0 && valid) {
        const double span = spec.book_depth - 2.0 * spec.cover_thickness;
        const double spacing = span / (static_cast<double>(spec.page_line_count) + 1.0);
        if (spacing <= spec.page_line_thickness) {
            log.error(DiagCategory::InvalidParameter,
                      "page_line_count too high, page lines would touch");
            valid = false;
        }
    }

    return valid;
}

} // namespace keyforge
