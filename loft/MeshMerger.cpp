#include "MeshMerger.hpp"

Geometry MeshMerger::merge(const std::vector<const Geometry*> &geometries) {
    Geometry merged;
    size_t vertexCount = 0;
    size_t indexCount = 0;
    for (const Geometry *g : geometries) {
        vertexCount += g->vertices.size();
        indexCount += g->indices.size();
        merged.hasColors |= g->hasColors;
        merged.hasTexCoords |= g->hasTexCoords;
    }
    merged.vertices.reserve(vertexCount);
    merged.indices.reserve(indexCount);

    for (const Geometry *g : geometries) {
        uint offset = static_cast<uint>(merged.vertices.size());
        for (const Vertex &v : g->vertices) {
            Vertex copy = v;
            if (!g->hasColors) {
                copy.color = glm::vec3(0.0f);
            }
            if (!g->hasTexCoords) {
                copy.texCoord = glm::vec2(0.0f);
            }
            merged.vertices.push_back(copy);
        }
        for (uint index : g->indices) {
            merged.indices.push_back(index + offset);
        }
    }

    merged.calculateNormals();
    return merged;
}
