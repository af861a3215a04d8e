#include "Geometry.hpp"
#include <glm/glm.hpp>
#include <cstddef>

Geometry::Geometry() : hasColors(false), hasTexCoords(false) {
}

Geometry::~Geometry() {
}

void Geometry::calculateNormals() {
    for (size_t i = 0; i < vertices.size(); ++i) {
        vertices[i].normal = glm::vec3(0.0f);
    }

    // Accumulate face normals (consistent winding: v1-v0, v2-v0)
    for (size_t i = 0; i + 2 < indices.size(); i += 3) {
        size_t i0 = indices[i + 0];
        size_t i1 = indices[i + 1];
        size_t i2 = indices[i + 2];

        glm::vec3 p0 = vertices[i0].position;
        glm::vec3 p1 = vertices[i1].position;
        glm::vec3 p2 = vertices[i2].position;

        glm::vec3 face = glm::cross(p1 - p0, p2 - p0);
        float len2 = glm::dot(face, face);
        if (len2 > 1e-12f) {
            glm::vec3 fn = glm::normalize(face);
            vertices[i0].normal += fn;
            vertices[i1].normal += fn;
            vertices[i2].normal += fn;
        }
    }

    // Normalize and fall back to (0,1,0) for vertices no triangle touches
    for (size_t i = 0; i < vertices.size(); ++i) {
        float l2 = glm::dot(vertices[i].normal, vertices[i].normal);
        if (l2 > 1e-12f) vertices[i].normal = glm::normalize(vertices[i].normal);
        else vertices[i].normal = glm::vec3(0.0f, 1.0f, 0.0f);
    }
}

void Geometry::addTriangle(const Vertex &v0, const Vertex &v1, const Vertex &v2) {
    // Preserve the winding order provided by the caller (v0, v1, v2).
    addVertex(v0);
    addVertex(v1);
    addVertex(v2);
}

void Geometry::addVertex(const Vertex &vertex) {
    auto [it, inserted] = compactMap.try_emplace(vertex, vertices.size());
    size_t idx = it->second;

    if (inserted) {
        vertices.push_back(vertex);
    }
    indices.push_back(static_cast<uint>(idx));
}

void Geometry::setColor(const glm::vec3 &color) {
    for (Vertex &vertex : vertices) {
        vertex.color = color;
    }
    compactMap.clear();
    hasColors = true;
}

void Geometry::transform(const Transformation &model) {
    for (Vertex &vertex : vertices) {
        vertex.position = model.applyPoint(vertex.position);
        vertex.normal = model.applyDirection(vertex.normal);
    }
    compactMap.clear();
}

size_t Geometry::triangleCount() const {
    return indices.size() / 3;
}

bool Geometry::empty() const {
    return vertices.empty() || indices.empty();
}

glm::vec3 Geometry::getMin() const {
    if (vertices.empty()) {
        return glm::vec3(0);
    }
    glm::vec3 min = vertices[0].position;
    for (const Vertex &vertex : vertices) {
        min = glm::min(min, vertex.position);
    }
    return min;
}

glm::vec3 Geometry::getMax() const {
    if (vertices.empty()) {
        return glm::vec3(0);
    }
    glm::vec3 max = vertices[0].position;
    for (const Vertex &vertex : vertices) {
        max = glm::max(max, vertex.position);
    }
    return max;
}
