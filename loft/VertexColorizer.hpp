#pragma once
#include "../math/Geometry.hpp"
#include <optional>
#include <vector>

struct ColorZone {
    float yMin;
    float yMax;
    glm::vec3 color;
};

class VertexColorizer {
public:
    static constexpr uint32_t DEFAULT_COLOR = 0xcccccc;

    // First zone with yMin <= y < yMax, if any
    static std::optional<glm::vec3> zoneColor(const std::vector<ColorZone> &zones, float y);

    // Component zones, then the component color, then global zones, then gray.
    // Declared component zones win even when empty.
    static void apply(Geometry &geometry,
                      const std::optional<std::vector<ColorZone>> &componentZones,
                      const std::optional<glm::vec3> &componentColor,
                      const std::vector<ColorZone> &globalZones);
};
