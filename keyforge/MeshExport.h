/**
 * @file MeshExport.h
 * @brief Hand-off of the finished solid to file formats
 *
 * The mesh is written in its local (origin-centred) frame; the transform
 * is not baked. Both writers return false and log on I/O failure.
 */

#pragma once

#include "Solid.h"
#include "Parameters.h"

#include <string>

namespace keyforge {

/**
 * @brief Wavefront OBJ plus a sibling .mtl with the material
 *
 * The .mtl path is the OBJ path with its extension replaced. Kd comes from
 * the base color, Ks from specular, Ns from roughness, d from alpha.
 */
bool writeObj(const Solid& solid, const MaterialDescriptor& material, const std::string& path);

/**
 * @brief Binary STL with per-face normals (little-endian float32)
 */
bool writeStlBinary(const Solid& solid, const std::string& path);

/// Path with its extension (if any) replaced by `extension` (".mtl").
std::string replaceExtension(const std::string& path, const std::string& extension);

} // namespace keyforge
