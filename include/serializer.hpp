#pragma once

#include "protocol/mesh.hpp"
#include <string>

namespace serializer {

// Current wall-clock time in seconds since epoch
double now_seconds();

// Encode a mesh as the JSON payload document
// {"type": "mesh", "vertices": [...], "triangles": [...], "ts": ...}.
// Throws protocol::SerializationError on NaN or infinite values.
protocol::Payload serialize(const protocol::Mesh& mesh, double captured_at);

// Inverse of serialize. Throws protocol::MalformedPayloadError when the bytes
// are not JSON, a field is missing or mistyped, a flattened array length is not
// a multiple of 3, or a triangle references a vertex that does not exist.
protocol::MeshMessage deserialize(const protocol::Payload& payload);
protocol::MeshMessage deserialize(const std::string& text);

} // namespace serializer
