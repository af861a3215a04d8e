#pragma once
#include "Vertex.hpp"
#include "Transformation.hpp"
#include <vector>
#include <tsl/robin_map.h>

typedef unsigned int uint;

class Geometry
{

public:
    std::vector<Vertex> vertices;
    std::vector<uint> indices;
    tsl::robin_map<Vertex, size_t, VertexHasher> compactMap;

    // Lofted rings carry neither; the merger zero-fills missing attributes
    bool hasColors;
    bool hasTexCoords;

    Geometry();
    ~Geometry();

    // Recomputes per-vertex normals from the indexed triangles
    void calculateNormals();

    void addVertex(const Vertex &vertex);
    void addTriangle(const Vertex &v0, const Vertex &v1, const Vertex &v2);
    void setColor(const glm::vec3 &color);
    void transform(const Transformation &model);
    size_t triangleCount() const;
    bool empty() const;
    glm::vec3 getMin() const;
    glm::vec3 getMax() const;
};
