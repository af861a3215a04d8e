#pragma once
#include "Material.hpp"
#include "../math/Geometry.hpp"
#include <optional>
#include <string>

// Parametric solid merged into the main mesh
struct AddonSpec {
    std::string id;
    std::string type;
    glm::vec3 size = glm::vec3(0.1f);
    float radius = 0.1f;
    std::optional<float> radiusTop;
    std::optional<float> radiusBottom;
    float height = 0.1f;
    std::optional<int> segments;
    glm::vec3 position = glm::vec3(0.0f);
    glm::vec3 rotation = glm::vec3(0.0f);
    std::optional<glm::vec3> color;
};

// Named rigid attachment exported next to a static mesh
struct ChildSpec {
    std::string name;
    std::string type;
    float radius = 0.1f;
    float width = 0.14f;
    float height = 0.1f;
    glm::vec3 size = glm::vec3(0.1f);
    int segments = 12;
    float rotateX = 0.0f;
    float rotateZ = 0.0f;
    glm::vec3 position = glm::vec3(0.0f);
    glm::vec3 rotation = glm::vec3(0.0f);
    std::optional<glm::vec3> color;
    // Color is taken from 'color' when the child is built
    Material material;
};

struct MeshPart {
    Geometry geometry;
    Material material;
};

struct ChildObject {
    std::string name;
    Transformation transform;
    std::vector<MeshPart> parts;
};

class Primitives {
public:
    static constexpr float WHEEL_RADIUS = 0.25f;
    static constexpr uint32_t TIRE_COLOR = 0x222222;
    static constexpr uint32_t HUB_COLOR = 0x888888;
    static constexpr float TIRE_ROUGHNESS = 0.95f;
    static constexpr float TIRE_METALNESS = 0.0f;
    static constexpr float HUB_ROUGHNESS = 0.2f;
    static constexpr float HUB_METALNESS = 0.8f;

    // Addon geometry with its local transform and color applied.
    // Unknown types are reported and yield nothing.
    static std::optional<Geometry> buildAddon(const AddonSpec &spec);

    static std::optional<ChildObject> buildChild(const ChildSpec &spec);

    // Tire part followed by the hub part (hub cap and spokes)
    static std::vector<MeshPart> wheel(float radius, float width, bool rightSide);
};
