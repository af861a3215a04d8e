#pragma once
#include "../math/Geometry.hpp"
#include <vector>

class MeshMerger {
public:
    // Appends the inputs in order, offsetting indices by the running vertex
    // count, and recomputes normals over the result.
    static Geometry merge(const std::vector<const Geometry*> &geometries);
};
