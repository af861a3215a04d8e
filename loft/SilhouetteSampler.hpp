#pragma once
#include "types.hpp"

class SilhouetteSampler {
public:
    // numSamples evenly spaced levels over [yMin, yMax], the last pinned to yMax
    static std::vector<float> levels(float yMin, float yMax, int numSamples);

    // Left/right X bounds of the polyline at each level. The polyline is walked
    // edge by edge as given and never closed implicitly; levels no edge crosses
    // are left out of the result.
    static SilhouetteSampleMap sample(const Polyline &points, float yMin, float yMax, int numSamples);
};
