#pragma once
#include "types.hpp"
#include "../math/Geometry.hpp"
#include <optional>
#include <string>

struct LoftOptions {
    int vertsPerRing = 10;
    float yMin = 0.0f;
    float yMax = 0.0f;
    glm::vec3 offset = glm::vec3(0.0f);
    bool capTop = false;
    bool capBottom = false;
    // Unit cross-section from the top view; an ellipse is used when absent
    std::optional<std::vector<glm::vec2>> topShape;
};

struct ComponentMesh {
    std::vector<Ring> rings;
    int vertsPerRing = 0;
    Geometry geometry;
};

class Lofter {
public:
    static Ring generateRing(float y, float halfWidth, float halfDepth, const LoftOptions &options);

    // Stitches one ring per height level present in both views. Returns nothing
    // when fewer than two rings survive, and then describes why in reason.
    static std::optional<ComponentMesh> loft(const SilhouetteSampleMap &front, const SilhouetteSampleMap &side, const LoftOptions &options, std::string *reason = nullptr);

private:
    static void addCap(ComponentMesh &mesh, size_t ringIndex, bool top);
};
