#pragma once
#include "../math/Vertex.hpp"
#include <vector>

struct SkinBinding {
    glm::ivec2 joints;
    glm::vec2 weights;

    SkinBinding() : joints(0), weights(0.0f) {}
    SkinBinding(glm::ivec2 joints, glm::vec2 weights) : joints(joints), weights(weights) {}

    int influenceCount() const {
        return weights.y > 0.0f ? 2 : 1;
    }
};

class SkinWeightAssigner {
public:
    static constexpr float DEFAULT_JOINT_THRESHOLD = 0.15f;

    // Binds each vertex to its nearest bone. Near a joint (nearest bone closer
    // than threshold, second nearest closer than twice that) the two are blended.
    static SkinBinding assign(const glm::vec3 &position, const std::vector<glm::vec3> &bonePositions, float threshold = DEFAULT_JOINT_THRESHOLD);
    static std::vector<SkinBinding> assign(const std::vector<Vertex> &vertices, const std::vector<glm::vec3> &bonePositions, float threshold = DEFAULT_JOINT_THRESHOLD);
};
