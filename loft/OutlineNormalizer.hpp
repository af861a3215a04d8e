#pragma once
#include "types.hpp"
#include <optional>

// Turns a closed top-view outline into a unit cross-section: one (x, z) offset
// in [-1, 1]^2 per ring slot, scaled later by each ring's half-width/half-depth.
class OutlineNormalizer {
public:
    static constexpr float MIN_RAY_T = 0.01f;
    static constexpr float MIN_EXTENT = 0.001f;

    static std::optional<std::vector<glm::vec2>> normalize(const Polyline &outline, float centerX, float centerY, int vertsPerRing);

    // Smallest ray parameter t > MIN_RAY_T where origin + t*dir crosses the closed outline, 1 if none
    static float castRay(const Polyline &closedOutline, const glm::vec2 &dir);
};
