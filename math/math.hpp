#ifndef MATH_HPP
#define MATH_HPP

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>
#include <glm/gtc/constants.hpp>
#include <vector>
#include <string>
#include <tsl/robin_map.h>

#include "Vertex.hpp"
#include "Transformation.hpp"
#include "Geometry.hpp"
#include "BoxGeometry.hpp"
#include "CylinderGeometry.hpp"
#include "SphereGeometry.hpp"
#include "Math.hpp"

#endif // MATH_HPP
