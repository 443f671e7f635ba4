#include "serializer.hpp"
#include "protocol/errors.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <cmath>
#include <limits>

namespace serializer {

namespace {

const nlohmann::json& require(const nlohmann::json& doc, const char* key) {
    auto it = doc.find(key);
    if (it == doc.end()) {
        throw protocol::MalformedPayloadError(std::string("missing field '") + key + "'");
    }
    return *it;
}

const nlohmann::json& require_array(const nlohmann::json& doc, const char* key) {
    const auto& value = require(doc, key);
    if (!value.is_array()) {
        throw protocol::MalformedPayloadError(std::string("field '") + key + "' is not an array");
    }
    if (value.size() % 3 != 0) {
        throw protocol::MalformedPayloadError(std::string("field '") + key + "' length " +
                                              std::to_string(value.size()) + " is not a multiple of 3");
    }
    return value;
}

float to_float(const nlohmann::json& value) {
    if (!value.is_number()) {
        throw protocol::MalformedPayloadError("vertex component is not a number");
    }
    double d = value.get<double>();
    if (!std::isfinite(d) || std::fabs(d) > std::numeric_limits<float>::max()) {
        throw protocol::MalformedPayloadError("vertex component out of float range");
    }
    return static_cast<float>(d);
}

int32_t to_index(const nlohmann::json& value, size_t vertex_count) {
    if (value.is_number_unsigned()) {
        uint64_t u = value.get<uint64_t>();
        if (u < vertex_count) {
            return static_cast<int32_t>(u);
        }
    } else if (value.is_number_integer()) {
        int64_t i = value.get<int64_t>();
        if (i >= 0 && static_cast<uint64_t>(i) < vertex_count) {
            return static_cast<int32_t>(i);
        }
    } else {
        throw protocol::MalformedPayloadError("triangle index is not an integer");
    }
    throw protocol::MalformedPayloadError("triangle index out of range for " +
                                          std::to_string(vertex_count) + " vertices");
}

protocol::MeshMessage from_json(const nlohmann::json& doc) {
    if (!doc.is_object()) {
        throw protocol::MalformedPayloadError("payload is not a JSON object");
    }

    const auto& type = require(doc, "type");
    if (!type.is_string() || type.get<std::string>() != "mesh") {
        throw protocol::MalformedPayloadError("payload type is not 'mesh'");
    }

    const auto& ts = require(doc, "ts");
    if (!ts.is_number()) {
        throw protocol::MalformedPayloadError("field 'ts' is not a number");
    }

    const auto& vertices = require_array(doc, "vertices");
    const auto& triangles = require_array(doc, "triangles");

    protocol::MeshMessage message;
    message.captured_at = ts.get<double>();

    message.mesh.vertices.reserve(vertices.size() / 3);
    for (size_t i = 0; i < vertices.size(); i += 3) {
        message.mesh.vertices.push_back({to_float(vertices[i]), to_float(vertices[i + 1]), to_float(vertices[i + 2])});
    }

    const size_t vertex_count = message.mesh.vertices.size();
    message.mesh.triangles.reserve(triangles.size() / 3);
    for (size_t i = 0; i < triangles.size(); i += 3) {
        message.mesh.triangles.push_back({to_index(triangles[i], vertex_count),
                                          to_index(triangles[i + 1], vertex_count),
                                          to_index(triangles[i + 2], vertex_count)});
    }
    return message;
}

} // namespace

double now_seconds() {
    auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration<double>(since_epoch).count();
}

protocol::Payload serialize(const protocol::Mesh& mesh, double captured_at) {
    if (!std::isfinite(captured_at)) {
        throw protocol::SerializationError("capture timestamp is not finite");
    }

    nlohmann::json vertices = nlohmann::json::array();
    for (size_t i = 0; i < mesh.vertices.size(); ++i) {
        for (float component : mesh.vertices[i]) {
            if (!std::isfinite(component)) {
                throw protocol::SerializationError("vertex " + std::to_string(i) + " has a non-finite component");
            }
            vertices.push_back(component);
        }
    }

    nlohmann::json triangles = nlohmann::json::array();
    for (const auto& tri : mesh.triangles) {
        for (int32_t index : tri) {
            triangles.push_back(index);
        }
    }

    nlohmann::json doc;
    doc["type"] = "mesh";
    doc["vertices"] = std::move(vertices);
    doc["triangles"] = std::move(triangles);
    doc["ts"] = captured_at;

    std::string text = doc.dump();
    return protocol::Payload(text.begin(), text.end());
}

protocol::MeshMessage deserialize(const protocol::Payload& payload) {
    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(payload.begin(), payload.end());
    } catch (const nlohmann::json::parse_error& e) {
        throw protocol::MalformedPayloadError(std::string("payload is not valid JSON: ") + e.what());
    } catch (const nlohmann::json::exception& e) {
        // e.g. out_of_range.406 for a number that overflows a double
        throw protocol::MalformedPayloadError(std::string("payload is not a usable JSON document: ") + e.what());
    }
    try {
        return from_json(doc);
    } catch (const nlohmann::json::exception& e) {
        throw protocol::MalformedPayloadError(std::string("payload has an unexpected shape: ") + e.what());
    }
}

protocol::MeshMessage deserialize(const std::string& text) {
    return deserialize(protocol::Payload(text.begin(), text.end()));
}

} // namespace serializer
