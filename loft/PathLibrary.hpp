#pragma once
#include "types.hpp"
#include <string>
#include <vector>
#include <tsl/robin_map.h>

// Named polylines read from the <path> elements of one SVG view
class PathLibrary {
    tsl::robin_map<std::string, Polyline> paths;
    std::vector<std::string> order;
public:
    PathLibrary() = default;

    static PathLibrary parseSvg(const std::string &content);
    static PathLibrary load(const std::string &filename);

    void add(const std::string &id, Polyline polyline);
    const Polyline * find(const std::string &id) const;
    size_t size() const;
    const std::vector<std::string>& ids() const;

    // SVG Y grows downward; world Y grows upward from the bottom of the drawing
    static Polyline toWorld(const Polyline &raw, float centerX, float sourceHeight, float scale);
};
