#pragma once
#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

// Local transform of an addon or rigid child: scale, then rotation, then translation
class Transformation {
public:
    glm::vec3 scale;
    glm::vec3 translate;
    glm::quat quaternion;
    Transformation();
    Transformation(glm::vec3 translate, glm::vec3 eulerXYZ);
    Transformation(glm::vec3 scale, glm::vec3 translate, glm::vec3 eulerXYZ);
    static glm::quat getRotation(glm::vec3 eulerXYZ);
    glm::vec3 applyPoint(const glm::vec3 &p) const;
    glm::vec3 applyDirection(const glm::vec3 &d) const;
};
