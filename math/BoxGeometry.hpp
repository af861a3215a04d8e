#pragma once
#include "Geometry.hpp"

// Axis-aligned box centered on the origin
class BoxGeometry : public Geometry {
public:
    BoxGeometry(glm::vec3 size);
};
