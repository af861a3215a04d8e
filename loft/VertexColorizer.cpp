#include "VertexColorizer.hpp"
#include "../math/Math.hpp"

std::optional<glm::vec3> VertexColorizer::zoneColor(const std::vector<ColorZone> &zones, float y) {
    for (const ColorZone &zone : zones) {
        if (y >= zone.yMin && y < zone.yMax) {
            return zone.color;
        }
    }
    return std::nullopt;
}

void VertexColorizer::apply(Geometry &geometry,
                            const std::optional<std::vector<ColorZone>> &componentZones,
                            const std::optional<glm::vec3> &componentColor,
                            const std::vector<ColorZone> &globalZones) {
    glm::vec3 fallback = Math::hexToRgb(DEFAULT_COLOR);

    if (!componentZones && componentColor) {
        geometry.setColor(*componentColor);
        return;
    }

    const std::vector<ColorZone> &zones = componentZones ? *componentZones : globalZones;
    for (Vertex &vertex : geometry.vertices) {
        vertex.color = zoneColor(zones, vertex.position.y).value_or(fallback);
    }
    geometry.compactMap.clear();
    geometry.hasColors = true;
}
