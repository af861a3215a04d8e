#pragma once
#include "types.hpp"
#include <optional>
#include <string>

// Parse state of one path: pen position, subpath start and the last Bezier
// control point used by the smooth (S/T) continuations.
struct PathCursor {
    glm::vec2 current = glm::vec2(0.0f);
    glm::vec2 start = glm::vec2(0.0f);
    std::optional<glm::vec2> prevControl;
};

class PathParser {
public:
    static const int CUBIC_STEPS = 8;
    static const int QUADRATIC_STEPS = 6;

    // Flattens an SVG path `d` attribute into a polyline, curves sampled uniformly
    static Polyline parse(const std::string &d);

    static glm::vec2 cubic(const glm::vec2 &p0, const glm::vec2 &p1, const glm::vec2 &p2, const glm::vec2 &p3, float t);
    static glm::vec2 quadratic(const glm::vec2 &p0, const glm::vec2 &p1, const glm::vec2 &p2, float t);
    static std::vector<float> parseNumbers(const std::string &args);

private:
    static void moveTo(PathCursor &cursor, const std::vector<float> &nums, bool rel, Polyline &out);
    static void lineTo(PathCursor &cursor, const std::vector<float> &nums, bool rel, Polyline &out);
    static void horizontalTo(PathCursor &cursor, const std::vector<float> &nums, bool rel, Polyline &out);
    static void verticalTo(PathCursor &cursor, const std::vector<float> &nums, bool rel, Polyline &out);
    static void cubicTo(PathCursor &cursor, const std::vector<float> &nums, bool rel, bool smooth, Polyline &out);
    static void quadraticTo(PathCursor &cursor, const std::vector<float> &nums, bool rel, bool smooth, Polyline &out);
    static void closePath(PathCursor &cursor, Polyline &out);
};
