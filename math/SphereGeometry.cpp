#include "SphereGeometry.hpp"
#include <glm/gtc/constants.hpp>
#include <algorithm>
#include <cmath>

namespace {
    Vertex getVertex(float radius, float u, float v) {
        float PI = glm::pi<float>();
        glm::vec3 n(
            -std::cos(u * 2.0f * PI) * std::sin(v * PI),
            std::cos(v * PI),
            std::sin(u * 2.0f * PI) * std::sin(v * PI)
        );
        return Vertex(n * radius, n, glm::vec2(u, 1.0f - v));
    }
}

SphereGeometry::SphereGeometry(float radius, int widthSegments, int heightSegments) {
    int longs = std::max(3, widthSegments);
    int lats = std::max(2, heightSegments);

    for (int iy = 0; iy < lats; ++iy) {
        float v0 = static_cast<float>(iy) / lats;
        float v1 = static_cast<float>(iy + 1) / lats;
        for (int ix = 0; ix < longs; ++ix) {
            float u0 = static_cast<float>(ix) / longs;
            float u1 = static_cast<float>(ix + 1) / longs;

            Vertex a = getVertex(radius, u1, v0);
            Vertex b = getVertex(radius, u0, v0);
            Vertex c = getVertex(radius, u0, v1);
            Vertex d = getVertex(radius, u1, v1);

            // The pole rows collapse to a single triangle
            if (iy != 0) addTriangle(a, b, d);
            if (iy != lats - 1) addTriangle(b, c, d);
        }
    }
    hasTexCoords = true;
}
