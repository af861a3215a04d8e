#include "OutlineNormalizer.hpp"
#include <glm/gtc/constants.hpp>
#include <algorithm>
#include <cmath>

float OutlineNormalizer::castRay(const Polyline &closedOutline, const glm::vec2 &dir) {
    float bestT = 1.0f;
    size_t n = closedOutline.size();
    for (size_t i = 0; i < n; ++i) {
        const glm::vec2 &a = closedOutline[i];
        const glm::vec2 &b = closedOutline[(i + 1) % n];
        glm::vec2 e = b - a;

        float denom = dir.x * e.y - dir.y * e.x;
        if (std::fabs(denom) < 1e-8f) {
            continue;
        }
        float t = (a.x * e.y - a.y * e.x) / denom;
        float s = (a.x * dir.y - a.y * dir.x) / denom;

        if (t > MIN_RAY_T && s >= 0.0f && s <= 1.0f && t < bestT) {
            bestT = t;
        }
    }
    return bestT;
}

std::optional<std::vector<glm::vec2>> OutlineNormalizer::normalize(const Polyline &outline, float centerX, float centerY, int vertsPerRing) {
    if (outline.size() < 3 || vertsPerRing <= 0) {
        return std::nullopt;
    }

    glm::vec2 center(centerX, centerY);
    float maxAbsX = 0.0f;
    float maxAbsZ = 0.0f;
    for (const glm::vec2 &p : outline) {
        glm::vec2 c = p - center;
        maxAbsX = std::max(maxAbsX, std::fabs(c.x));
        maxAbsZ = std::max(maxAbsZ, std::fabs(c.y));
    }
    if (maxAbsX < MIN_EXTENT || maxAbsZ < MIN_EXTENT) {
        return std::nullopt;
    }

    Polyline normalized;
    normalized.reserve(outline.size());
    for (const glm::vec2 &p : outline) {
        glm::vec2 c = p - center;
        normalized.emplace_back(c.x / maxAbsX, c.y / maxAbsZ);
    }

    float PI = glm::pi<float>();
    std::vector<glm::vec2> shape;
    shape.reserve(vertsPerRing);
    for (int i = 0; i < vertsPerRing; ++i) {
        float angle = 2.0f * PI * i / vertsPerRing;
        glm::vec2 dir(std::sin(angle), std::cos(angle));
        shape.push_back(dir * castRay(normalized, dir));
    }
    return shape;
}
