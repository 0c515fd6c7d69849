/**
 * @file keyforge/Parameters.h
 * @brief Dimension and material parameters for one keyforge generation run
 *
 * This struct is host-agnostic and can be used by any frontend.
 * The command-line host (src/HostParameters.h) fills it from a config
 * file and overrides. All lengths are in the working unit (millimetres).
 */

#pragma once

#include "Diagnostics.h"

#include <array>
#include <string>
#include <vector>

namespace keyforge {

/// Upper bound on page_line_count
constexpr int kMaxPageLineCount = 10000;

/**
 * @brief Every scalar of a run. Immutable once the run starts.
 */
struct DimensionSpec {
    // Book body
    double book_width = 30.0;        ///< X extent
    double book_height = 38.0;       ///< Z extent
    double book_depth = 10.0;        ///< Y extent, also the spine diameter
    double cover_thickness = 1.5;    ///< Inset of the page lines from each cover

    // Carabiner loop
    double loop_outer_radius = 4.0;
    double loop_inner_radius = 2.5;
    double loop_thickness = 3.0;
    double loop_overlap = 1.0;       ///< How far the ring sinks into the body top

    // Label
    std::vector<std::string> text_lines = {"I AM", "WHO", "I AM"};
    double text_size = 5.0;
    double text_extrude = 0.8;

    // Page lines
    int page_line_count = 12;           ///< At most kMaxPageLineCount
    double page_line_depth = 0.3;        ///< X extent of each slab
    double page_line_thickness = 0.15;   ///< Y extent of each slab
    double page_line_height_ratio = 0.9; ///< Slab Z extent as a fraction of book height

    int cylinder_segments = 32;

    /// Smallest positive length; drives the overlap epsilon.
    double smallestFeature() const;
};

/**
 * @brief Over-extension applied wherever two solids are meant to touch
 *
 * max(1e-4, 0.05 * smallest feature dimension)
 */
double overlapEpsilon(const DimensionSpec& spec);

/**
 * @brief Check every dimension
 *
 * Logs one InvalidParameter entry per violation.
 * @return true if the keyring can be built
 */
bool validateDimensions(const DimensionSpec& spec, DiagnosticLog& log);

//=============================================================================
// LABEL MODE
//=============================================================================

enum class LabelMode {
    Emboss,   ///< Label unioned onto the face (standing proud)
    Engrave   ///< Label subtracted from the face
};

const char* labelModeName(LabelMode mode);

//=============================================================================
// MATERIAL
//=============================================================================

/**
 * @brief Plain-scalar material handed to the exporter
 */
struct MaterialDescriptor {
    std::string name = "BibleNavy";
    std::array<double, 4> base_color = {0.05, 0.08, 0.18, 1.0};
    double roughness = 0.7;
    double specular = 0.3;
};

} // namespace keyforge
