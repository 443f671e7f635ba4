#include "protocol/mesh.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>

namespace protocol {

Mesh merge(const std::vector<Mesh>& meshes) {
    Mesh out;
    for (const auto& mesh : meshes) {
        int32_t offset = static_cast<int32_t>(out.vertices.size());
        out.vertices.insert(out.vertices.end(), mesh.vertices.begin(), mesh.vertices.end());
        for (const auto& tri : mesh.triangles) {
            out.triangles.push_back({tri[0] + offset, tri[1] + offset, tri[2] + offset});
        }
    }
    return out;
}

MeshAnalysis analyze(const Mesh& mesh) {
    MeshAnalysis analysis;
    analysis.vertex_count = mesh.vertices.size();
    analysis.triangle_count = mesh.triangles.size();
    if (mesh.vertices.empty()) {
        return analysis;
    }

    Vertex lo = mesh.vertices.front();
    Vertex hi = mesh.vertices.front();
    for (const auto& v : mesh.vertices) {
        for (int axis = 0; axis < 3; ++axis) {
            lo[axis] = std::min(lo[axis], v[axis]);
            hi[axis] = std::max(hi[axis], v[axis]);
        }
    }
    for (int axis = 0; axis < 3; ++axis) {
        analysis.extent[axis] = hi[axis] - lo[axis];
        analysis.center[axis] = (lo[axis] + hi[axis]) / 2.0f;
    }

    const auto count = static_cast<int64_t>(mesh.vertices.size());
    for (const auto& tri : mesh.triangles) {
        bool in_range = std::all_of(tri.begin(), tri.end(),
                                    [count](int32_t i) { return i >= 0 && i < count; });
        if (!in_range) continue;

        const Vertex& a = mesh.vertices[tri[0]];
        const Vertex& b = mesh.vertices[tri[1]];
        const Vertex& c = mesh.vertices[tri[2]];
        double ux = b[0] - a[0], uy = b[1] - a[1], uz = b[2] - a[2];
        double vx = c[0] - a[0], vy = c[1] - a[1], vz = c[2] - a[2];
        double cx = uy * vz - uz * vy;
        double cy = uz * vx - ux * vz;
        double cz = ux * vy - uy * vx;
        analysis.surface_area += 0.5 * std::sqrt(cx * cx + cy * cy + cz * cz);
    }
    return analysis;
}

std::string describe(const MeshAnalysis& analysis, const std::string& name) {
    char buf[256];
    snprintf(buf, sizeof(buf), "%s: %zu vertices, %zu triangles, %.2f x %.2f x %.2f units, area %.2f",
             name.c_str(), analysis.vertex_count, analysis.triangle_count,
             analysis.extent[0], analysis.extent[1], analysis.extent[2],
             analysis.surface_area);
    return std::string(buf);
}

Mesh make_demo_quad() {
    Mesh quad;
    quad.vertices = {{0.0f, 0.0f, 0.0f}, {1.0f, 0.0f, 0.0f}, {1.0f, 1.0f, 0.0f}, {0.0f, 1.0f, 0.0f}};
    quad.triangles = {{0, 1, 2}, {0, 2, 3}};
    return quad;
}

} // namespace protocol
