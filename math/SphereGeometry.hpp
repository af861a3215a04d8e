#pragma once
#include "Geometry.hpp"

class SphereGeometry : public Geometry {
public:
    SphereGeometry(float radius, int widthSegments, int heightSegments);
};
