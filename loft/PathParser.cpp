#include "PathParser.hpp"
#include <cctype>
#include <cstdlib>

namespace {
    bool isDigit(char c) {
        return std::isdigit(static_cast<unsigned char>(c)) != 0;
    }

    // Exponent markers belong to numbers, every other letter starts a command
    bool isExponent(const std::string &d, size_t i) {
        if (d[i] != 'e' && d[i] != 'E') return false;
        if (i == 0 || !(isDigit(d[i - 1]) || d[i - 1] == '.')) return false;
        size_t j = i + 1;
        if (j < d.size() && (d[j] == '+' || d[j] == '-')) ++j;
        return j < d.size() && isDigit(d[j]);
    }

    glm::vec2 origin(const PathCursor &cursor, bool rel) {
        return rel ? cursor.current : glm::vec2(0.0f);
    }

    glm::vec2 reflect(const PathCursor &cursor) {
        return cursor.prevControl ? 2.0f * cursor.current - *cursor.prevControl : cursor.current;
    }
}

glm::vec2 PathParser::cubic(const glm::vec2 &p0, const glm::vec2 &p1, const glm::vec2 &p2, const glm::vec2 &p3, float t) {
    float it = 1.0f - t;
    return it * it * it * p0 + 3.0f * it * it * t * p1 + 3.0f * it * t * t * p2 + t * t * t * p3;
}

glm::vec2 PathParser::quadratic(const glm::vec2 &p0, const glm::vec2 &p1, const glm::vec2 &p2, float t) {
    float it = 1.0f - t;
    return it * it * p0 + 2.0f * it * t * p1 + t * t * p2;
}

std::vector<float> PathParser::parseNumbers(const std::string &args) {
    std::vector<float> nums;
    size_t i = 0;
    size_t n = args.size();
    while (i < n) {
        size_t j = i;
        if (args[j] == '-') ++j;
        if (j >= n || !isDigit(args[j])) {
            // Not a number here: treat the character as a separator
            ++i;
            continue;
        }
        while (j < n && isDigit(args[j])) ++j;
        if (j < n && args[j] == '.') {
            ++j;
            while (j < n && isDigit(args[j])) ++j;
        }
        if (j < n && (args[j] == 'e' || args[j] == 'E')) {
            size_t k = j + 1;
            if (k < n && (args[k] == '+' || args[k] == '-')) ++k;
            if (k < n && isDigit(args[k])) {
                while (k < n && isDigit(args[k])) ++k;
                j = k;
            }
        }
        nums.push_back(std::strtof(args.substr(i, j - i).c_str(), nullptr));
        i = j;
    }
    return nums;
}

void PathParser::moveTo(PathCursor &cursor, const std::vector<float> &nums, bool rel, Polyline &out) {
    for (size_t i = 0; i + 2 <= nums.size(); i += 2) {
        cursor.current = origin(cursor, rel) + glm::vec2(nums[i], nums[i + 1]);
        out.push_back(cursor.current);
        if (i == 0) {
            cursor.start = cursor.current;
        }
    }
    cursor.prevControl.reset();
}

void PathParser::lineTo(PathCursor &cursor, const std::vector<float> &nums, bool rel, Polyline &out) {
    for (size_t i = 0; i + 2 <= nums.size(); i += 2) {
        cursor.current = origin(cursor, rel) + glm::vec2(nums[i], nums[i + 1]);
        out.push_back(cursor.current);
    }
    cursor.prevControl.reset();
}

void PathParser::horizontalTo(PathCursor &cursor, const std::vector<float> &nums, bool rel, Polyline &out) {
    for (float n : nums) {
        cursor.current.x = rel ? cursor.current.x + n : n;
        out.push_back(cursor.current);
    }
    cursor.prevControl.reset();
}

void PathParser::verticalTo(PathCursor &cursor, const std::vector<float> &nums, bool rel, Polyline &out) {
    for (float n : nums) {
        cursor.current.y = rel ? cursor.current.y + n : n;
        out.push_back(cursor.current);
    }
    cursor.prevControl.reset();
}

void PathParser::cubicTo(PathCursor &cursor, const std::vector<float> &nums, bool rel, bool smooth, Polyline &out) {
    size_t group = smooth ? 4 : 6;
    for (size_t i = 0; i + group <= nums.size(); i += group) {
        glm::vec2 base = origin(cursor, rel);
        glm::vec2 p0 = cursor.current;
        glm::vec2 p1, p2, p3;
        if (smooth) {
            p1 = reflect(cursor);
            p2 = base + glm::vec2(nums[i], nums[i + 1]);
            p3 = base + glm::vec2(nums[i + 2], nums[i + 3]);
        } else {
            p1 = base + glm::vec2(nums[i], nums[i + 1]);
            p2 = base + glm::vec2(nums[i + 2], nums[i + 3]);
            p3 = base + glm::vec2(nums[i + 4], nums[i + 5]);
        }
        for (int step = 1; step <= CUBIC_STEPS; ++step) {
            float t = static_cast<float>(step) / CUBIC_STEPS;
            out.push_back(step == CUBIC_STEPS ? p3 : cubic(p0, p1, p2, p3, t));
        }
        cursor.prevControl = p2;
        cursor.current = p3;
    }
}

void PathParser::quadraticTo(PathCursor &cursor, const std::vector<float> &nums, bool rel, bool smooth, Polyline &out) {
    size_t group = smooth ? 2 : 4;
    for (size_t i = 0; i + group <= nums.size(); i += group) {
        glm::vec2 base = origin(cursor, rel);
        glm::vec2 p0 = cursor.current;
        glm::vec2 p1, p2;
        if (smooth) {
            p1 = reflect(cursor);
            p2 = base + glm::vec2(nums[i], nums[i + 1]);
        } else {
            p1 = base + glm::vec2(nums[i], nums[i + 1]);
            p2 = base + glm::vec2(nums[i + 2], nums[i + 3]);
        }
        for (int step = 1; step <= QUADRATIC_STEPS; ++step) {
            float t = static_cast<float>(step) / QUADRATIC_STEPS;
            out.push_back(step == QUADRATIC_STEPS ? p2 : quadratic(p0, p1, p2, t));
        }
        cursor.prevControl = p1;
        cursor.current = p2;
    }
}

void PathParser::closePath(PathCursor &cursor, Polyline &out) {
    cursor.current = cursor.start;
    out.push_back(cursor.current);
    cursor.prevControl.reset();
}

Polyline PathParser::parse(const std::string &d) {
    Polyline points;
    PathCursor cursor;

    size_t i = 0;
    while (i < d.size()) {
        if (!std::isalpha(static_cast<unsigned char>(d[i])) || isExponent(d, i)) {
            ++i;
            continue;
        }
        char type = d[i];
        size_t end = i + 1;
        while (end < d.size() && (!std::isalpha(static_cast<unsigned char>(d[end])) || isExponent(d, end))) {
            ++end;
        }
        std::vector<float> nums = parseNumbers(d.substr(i + 1, end - i - 1));
        bool rel = std::islower(static_cast<unsigned char>(type)) != 0;

        switch (std::toupper(static_cast<unsigned char>(type))) {
            case 'M': moveTo(cursor, nums, rel, points); break;
            case 'L': lineTo(cursor, nums, rel, points); break;
            case 'H': horizontalTo(cursor, nums, rel, points); break;
            case 'V': verticalTo(cursor, nums, rel, points); break;
            case 'C': cubicTo(cursor, nums, rel, false, points); break;
            case 'S': cubicTo(cursor, nums, rel, true, points); break;
            case 'Q': quadraticTo(cursor, nums, rel, false, points); break;
            case 'T': quadraticTo(cursor, nums, rel, true, points); break;
            case 'Z': closePath(cursor, points); break;
            default: break;
        }
        i = end;
    }
    return points;
}
