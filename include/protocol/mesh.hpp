#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace protocol {

using Vertex = std::array<float, 3>;
using Triangle = std::array<int32_t, 3>;

// Serialized bytes of one MeshMessage
using Payload = std::vector<uint8_t>;

struct Mesh {
    std::vector<Vertex> vertices;
    std::vector<Triangle> triangles;

    bool operator==(const Mesh& other) const {
        return vertices == other.vertices && triangles == other.triangles;
    }
    bool operator!=(const Mesh& other) const { return !(*this == other); }
};

// A mesh as it travels on the wire, with its capture time
struct MeshMessage {
    Mesh mesh;
    double captured_at = 0.0; // seconds since epoch
};

struct MeshAnalysis {
    size_t vertex_count = 0;
    size_t triangle_count = 0;
    std::array<float, 3> extent{0.0f, 0.0f, 0.0f};
    std::array<float, 3> center{0.0f, 0.0f, 0.0f};
    double surface_area = 0.0;
};

// Concatenate meshes into one, shifting each mesh's triangle indices
// past the vertices appended before it.
Mesh merge(const std::vector<Mesh>& meshes);

// Counts, axis-aligned bounds and surface area. Triangles with an
// out-of-range index are skipped for the area.
MeshAnalysis analyze(const Mesh& mesh);

// One-line summary, e.g. "quad: 4 vertices, 2 triangles, 1.00 x 1.00 x 0.00 units, area 1.00"
std::string describe(const MeshAnalysis& analysis, const std::string& name);

// Unit quad in the z = 0 plane split into two triangles
Mesh make_demo_quad();

} // namespace protocol
