#pragma once
#include "Geometry.hpp"

// Capped cylinder (or truncated cone) around the Y axis, centered on the origin
class CylinderGeometry : public Geometry {
public:
    CylinderGeometry(float radiusTop, float radiusBottom, float height, int segments);
};
