#include "SkinWeights.hpp"
#include <limits>

SkinBinding SkinWeightAssigner::assign(const glm::vec3 &position, const std::vector<glm::vec3> &bonePositions, float threshold) {
    int nearest = 0;
    int second = 0;
    float d1 = std::numeric_limits<float>::infinity();
    float d2 = std::numeric_limits<float>::infinity();

    for (size_t i = 0; i < bonePositions.size(); ++i) {
        float d = glm::distance(position, bonePositions[i]);
        if (d < d1) {
            second = nearest;
            d2 = d1;
            nearest = static_cast<int>(i);
            d1 = d;
        } else if (d < d2) {
            second = static_cast<int>(i);
            d2 = d;
        }
    }

    if (d1 < threshold && d2 < 2.0f * threshold && nearest != second && d1 + d2 > 0.0f) {
        float total = d1 + d2;
        float w1 = 1.0f - d1 / total;
        float w2 = 1.0f - d2 / total;
        float sum = w1 + w2;
        return SkinBinding(glm::ivec2(nearest, second), glm::vec2(w1 / sum, w2 / sum));
    }
    return SkinBinding(glm::ivec2(nearest, 0), glm::vec2(1.0f, 0.0f));
}

std::vector<SkinBinding> SkinWeightAssigner::assign(const std::vector<Vertex> &vertices, const std::vector<glm::vec3> &bonePositions, float threshold) {
    std::vector<SkinBinding> result;
    result.reserve(vertices.size());
    for (const Vertex &vertex : vertices) {
        result.push_back(assign(vertex.position, bonePositions, threshold));
    }
    return result;
}
