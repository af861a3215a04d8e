#pragma once
#include <glm/glm.hpp>

// Surface parameters exported next to a geometry
struct Material {
    static constexpr float MODEL_ROUGHNESS = 0.7f;
    static constexpr float MODEL_METALNESS = 0.02f;
    static constexpr float CHILD_ROUGHNESS = 0.5f;
    static constexpr float CHILD_METALNESS = 0.3f;

    glm::vec3 color = glm::vec3(1.0f);
    float roughness = CHILD_ROUGHNESS;
    float metalness = CHILD_METALNESS;
    glm::vec3 emissive = glm::vec3(0.0f);
    float emissiveIntensity = 0.0f;
    bool transparent = false;
    float opacity = 1.0f;
    // Color comes from the vertices instead of the material
    bool vertexColors = false;
    bool flatShading = false;

    bool operator==(const Material &o) const {
        return color == o.color && roughness == o.roughness && metalness == o.metalness
            && emissive == o.emissive && emissiveIntensity == o.emissiveIntensity
            && transparent == o.transparent && opacity == o.opacity
            && vertexColors == o.vertexColors && flatShading == o.flatShading;
    }

    // Vertex-colored, flat shaded material of the lofted mesh
    static Material model(float roughness = MODEL_ROUGHNESS, float metalness = MODEL_METALNESS) {
        Material material;
        material.roughness = roughness;
        material.metalness = metalness;
        material.vertexColors = true;
        material.flatShading = true;
        return material;
    }
};
