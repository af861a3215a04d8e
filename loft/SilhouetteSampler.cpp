#include "SilhouetteSampler.hpp"
#include <algorithm>
#include <limits>

std::vector<float> SilhouetteSampler::levels(float yMin, float yMax, int numSamples) {
    std::vector<float> result;
    if (numSamples <= 0) {
        return result;
    }
    if (numSamples == 1) {
        result.push_back(yMin);
        return result;
    }
    float dy = (yMax - yMin) / (numSamples - 1);
    result.reserve(numSamples);
    for (int i = 0; i < numSamples - 1; ++i) {
        result.push_back(yMin + i * dy);
    }
    result.push_back(yMax);
    return result;
}

SilhouetteSampleMap SilhouetteSampler::sample(const Polyline &points, float yMin, float yMax, int numSamples) {
    std::vector<float> ys = levels(yMin, yMax, numSamples);
    const float inf = std::numeric_limits<float>::infinity();
    std::vector<SilhouetteBounds> bounds(ys.size(), SilhouetteBounds{inf, -inf});

    for (size_t i = 0; i + 1 < points.size(); ++i) {
        const glm::vec2 &p0 = points[i];
        const glm::vec2 &p1 = points[i + 1];

        if (p0.y == p1.y) {
            continue;
        }

        float yLo = std::min(p0.y, p1.y);
        float yHi = std::max(p0.y, p1.y);

        for (size_t l = 0; l < ys.size(); ++l) {
            float y = ys[l];
            if (y < yLo || y > yHi) {
                continue;
            }
            float t = (y - p0.y) / (p1.y - p0.y);
            float x = p0.x + t * (p1.x - p0.x);
            bounds[l].left = std::min(bounds[l].left, x);
            bounds[l].right = std::max(bounds[l].right, x);
        }
    }

    SilhouetteSampleMap samples;
    for (size_t l = 0; l < ys.size(); ++l) {
        if (bounds[l].left != inf) {
            samples[ys[l]] = bounds[l];
        }
    }
    return samples;
}
