#include "Transformation.hpp"
#include <glm/gtc/quaternion.hpp>

Transformation::Transformation()
    : scale(1.0f, 1.0f, 1.0f), translate(0.0f, 0.0f, 0.0f), quaternion(1.0f, 0.0f, 0.0f, 0.0f)
{
}

Transformation::Transformation(glm::vec3 translate, glm::vec3 eulerXYZ)
    : scale(1.0f, 1.0f, 1.0f), translate(translate), quaternion(getRotation(eulerXYZ))
{
}

Transformation::Transformation(glm::vec3 scale, glm::vec3 translate, glm::vec3 eulerXYZ)
    : scale(scale), translate(translate), quaternion(getRotation(eulerXYZ))
{
}

glm::quat Transformation::getRotation(glm::vec3 eulerXYZ)
{
    // Angles are radians, intrinsic X then Y then Z (authoring tools' default order)
    glm::quat qx = glm::angleAxis(eulerXYZ.x, glm::vec3(1.0f, 0.0f, 0.0f));
    glm::quat qy = glm::angleAxis(eulerXYZ.y, glm::vec3(0.0f, 1.0f, 0.0f));
    glm::quat qz = glm::angleAxis(eulerXYZ.z, glm::vec3(0.0f, 0.0f, 1.0f));
    return qx * qy * qz;
}

glm::vec3 Transformation::applyPoint(const glm::vec3 &p) const
{
    return quaternion * (p * scale) + translate;
}

glm::vec3 Transformation::applyDirection(const glm::vec3 &d) const
{
    glm::vec3 n = quaternion * (d / scale);
    float len = glm::length(n);
    return len > 0.0f ? n / len : n;
}
