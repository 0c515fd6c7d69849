/**
 * @file MeshExport.cpp
 * @brief OBJ/MTL and binary STL writers
 */

#include "MeshExport.h"
#include "Diagnostics.h"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <iomanip>

namespace keyforge {

std::string replaceExtension(const std::string& path, const std::string& extension) {
    const size_t slash = path.find_last_of("/\\");
    const size_t dot = path.find_last_of('.');
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) {
        return path + extension;
    }
    return path.substr(0, dot) + extension;
}

namespace {

std::string baseName(const std::string& path) {
    const size_t slash = path.find_last_of("/\\");
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

bool writeMtl(const MaterialDescriptor& material, const std::string& path) {
    std::ofstream out(path);
    if (!out) {
        KEYFORGE_LOG_ERROR("Cannot open '%s' for writing", path.c_str());
        return false;
    }

    // Blender's OBJ convention: Ns = (1 - roughness)^2 * 1000
    const double gloss = 1.0 - std::min(std::max(material.roughness, 0.0), 1.0);
    const auto& c = material.base_color;

    out << std::fixed << std::setprecision(6);
    out << "# keyforge material\n";
    out << "newmtl " << material.name << "\n";
    out << "Ns " << gloss * gloss * 1000.0 << "\n";
    out << "Ka 1.000000 1.000000 1.000000\n";
    out << "Kd " << c[0] << " " << c[1] << " " << c[2] << "\n";
    out << "Ks " << material.specular << " " << material.specular << " " << material.specular << "\n";
    out << "Ke 0.000000 0.000000 0.000000\n";
    out << "Pr " << material.roughness << "\n";
    out << "d " << c[3] << "\n";
    out << "illum 2\n";

    return static_cast<bool>(out);
}

void putFloat(std::ofstream& out, double v) {
    const float f = static_cast<float>(v);
    char bytes[4];
    std::memcpy(bytes, &f, 4);
    out.write(bytes, 4);
}

} // anonymous namespace

//=============================================================================
// OBJ
//=============================================================================

bool writeObj(const Solid& solid, const MaterialDescriptor& material, const std::string& path) {
    const std::string mtl_path = replaceExtension(path, ".mtl");
    if (!writeMtl(material, mtl_path)) {
        return false;
    }

    std::ofstream out(path);
    if (!out) {
        KEYFORGE_LOG_ERROR("Cannot open '%s' for writing", path.c_str());
        return false;
    }

    out << "# keyforge\n";
    out << "mtllib " << baseName(mtl_path) << "\n";
    out << "o " << (solid.name.empty() ? "solid" : solid.name) << "\n";

    out << std::setprecision(9);
    for (const auto& v : solid.vertices) {
        out << "v " << v[0] << " " << v[1] << " " << v[2] << "\n";
    }

    out << "usemtl " << material.name << "\n";
    out << "s off\n";
    for (const auto& f : solid.faces) {
        out << "f " << (f[0] + 1) << " " << (f[1] + 1) << " " << (f[2] + 1) << "\n";
    }

    if (!out) {
        KEYFORGE_LOG_ERROR("Write to '%s' failed", path.c_str());
        return false;
    }

    KEYFORGE_LOG_INFO("Wrote %s (%zu vertices, %zu faces) and %s",
                      path.c_str(), solid.vertexCount(), solid.faceCount(), mtl_path.c_str());
    return true;
}

//=============================================================================
// STL
//=============================================================================

bool writeStlBinary(const Solid& solid, const std::string& path) {
    std::ofstream out(path, std::ios::binary);
    if (!out) {
        KEYFORGE_LOG_ERROR("Cannot open '%s' for writing", path.c_str());
        return false;
    }

    char header[80];
    std::memset(header, 0, sizeof(header));
    const std::string title = "keyforge " + solid.name;
    std::memcpy(header, title.data(), std::min(title.size(), sizeof(header)));
    out.write(header, sizeof(header));

    const uint32_t count = static_cast<uint32_t>(solid.faces.size());
    char count_bytes[4];
    std::memcpy(count_bytes, &count, 4);
    out.write(count_bytes, 4);

    const char attribute[2] = {0, 0};
    for (const auto& f : solid.faces) {
        const Vec3& a = solid.vertices[f[0]];
        const Vec3& b = solid.vertices[f[1]];
        const Vec3& c = solid.vertices[f[2]];
        const Vec3 n = normalized(cross(sub(b, a), sub(c, a)));

        for (int i = 0; i < 3; ++i) putFloat(out, n[i]);
        for (int i = 0; i < 3; ++i) putFloat(out, a[i]);
        for (int i = 0; i < 3; ++i) putFloat(out, b[i]);
        for (int i = 0; i < 3; ++i) putFloat(out, c[i]);
        out.write(attribute, 2);
    }

    if (!out) {
        KEYFORGE_LOG_ERROR("Write to '%s' failed", path.c_str());
        return false;
    }

    KEYFORGE_LOG_INFO("Wrote %s (%u triangles)", path.c_str(), count);
    return true;
}

} // namespace keyforge
