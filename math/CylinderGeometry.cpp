#include "CylinderGeometry.hpp"
#include <glm/gtc/constants.hpp>
#include <algorithm>
#include <cmath>

CylinderGeometry::CylinderGeometry(float radiusTop, float radiusBottom, float height, int segments) {
    float PI = glm::pi<float>();
    segments = std::max(3, segments);
    float halfHeight = height * 0.5f;
    float slope = height > 0.0f ? (radiusBottom - radiusTop) / height : 0.0f;

    for (int i = 0; i < segments; ++i) {
        float u0 = static_cast<float>(i) / segments;
        float u1 = static_cast<float>(i + 1) / segments;
        float a0 = u0 * 2.0f * PI;
        float a1 = u1 * 2.0f * PI;
        glm::vec3 d0(std::sin(a0), 0.0f, std::cos(a0));
        glm::vec3 d1(std::sin(a1), 0.0f, std::cos(a1));

        glm::vec3 n0 = glm::normalize(glm::vec3(d0.x, slope, d0.z));
        glm::vec3 n1 = glm::normalize(glm::vec3(d1.x, slope, d1.z));

        Vertex a(d0 * radiusBottom + glm::vec3(0, -halfHeight, 0), n0, glm::vec2(u0, 0.0f));
        Vertex b(d1 * radiusBottom + glm::vec3(0, -halfHeight, 0), n1, glm::vec2(u1, 0.0f));
        Vertex c(d0 * radiusTop + glm::vec3(0, halfHeight, 0), n0, glm::vec2(u0, 1.0f));
        Vertex d(d1 * radiusTop + glm::vec3(0, halfHeight, 0), n1, glm::vec2(u1, 1.0f));

        if (radiusBottom > 0.0f) addTriangle(a, b, c);
        if (radiusTop > 0.0f) addTriangle(b, d, c);
    }

    if (radiusTop > 0.0f) {
        glm::vec3 up(0.0f, 1.0f, 0.0f);
        Vertex center(glm::vec3(0, halfHeight, 0), up, glm::vec2(0.5f));
        for (int i = 0; i < segments; ++i) {
            float a0 = 2.0f * PI * i / segments;
            float a1 = 2.0f * PI * (i + 1) / segments;
            glm::vec3 p0(radiusTop * std::sin(a0), halfHeight, radiusTop * std::cos(a0));
            glm::vec3 p1(radiusTop * std::sin(a1), halfHeight, radiusTop * std::cos(a1));
            addTriangle(center,
                        Vertex(p0, up, glm::vec2(0.5f) + glm::vec2(std::sin(a0), std::cos(a0)) * 0.5f),
                        Vertex(p1, up, glm::vec2(0.5f) + glm::vec2(std::sin(a1), std::cos(a1)) * 0.5f));
        }
    }

    if (radiusBottom > 0.0f) {
        glm::vec3 down(0.0f, -1.0f, 0.0f);
        Vertex center(glm::vec3(0, -halfHeight, 0), down, glm::vec2(0.5f));
        for (int i = 0; i < segments; ++i) {
            float a0 = 2.0f * PI * i / segments;
            float a1 = 2.0f * PI * (i + 1) / segments;
            glm::vec3 p0(radiusBottom * std::sin(a0), -halfHeight, radiusBottom * std::cos(a0));
            glm::vec3 p1(radiusBottom * std::sin(a1), -halfHeight, radiusBottom * std::cos(a1));
            addTriangle(center,
                        Vertex(p1, down, glm::vec2(0.5f) + glm::vec2(std::sin(a1), std::cos(a1)) * 0.5f),
                        Vertex(p0, down, glm::vec2(0.5f) + glm::vec2(std::sin(a0), std::cos(a0)) * 0.5f));
        }
    }
    hasTexCoords = true;
}
