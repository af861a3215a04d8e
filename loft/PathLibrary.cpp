#include "PathLibrary.hpp"
#include "PathParser.hpp"
#include "../utils/FileReader.hpp"
#include <cctype>
#include <iostream>
#include <optional>

namespace {
    // Value of `name="..."` inside one element tag; the name must start an attribute
    std::optional<std::string> attribute(const std::string &tag, const std::string &name) {
        std::string key = name + "=\"";
        size_t pos = 0;
        while ((pos = tag.find(key, pos)) != std::string::npos) {
            if (pos > 0 && std::isspace(static_cast<unsigned char>(tag[pos - 1]))) {
                size_t begin = pos + key.size();
                size_t end = tag.find('"', begin);
                if (end == std::string::npos) {
                    return std::nullopt;
                }
                return tag.substr(begin, end - begin);
            }
            pos += key.size();
        }
        return std::nullopt;
    }
}

PathLibrary PathLibrary::parseSvg(const std::string &content) {
    PathLibrary library;
    size_t pos = 0;
    while ((pos = content.find("<path", pos)) != std::string::npos) {
        size_t end = content.find('>', pos);
        if (end == std::string::npos) {
            break;
        }
        std::string tag = content.substr(pos, end - pos + 1);
        pos = end + 1;

        std::optional<std::string> d = attribute(tag, "d");
        if (!d) {
            continue;
        }
        std::optional<std::string> id = attribute(tag, "id");
        std::string name = id ? *id : "path_" + std::to_string(library.size());
        Polyline parsed = PathParser::parse(*d);
        std::cout << "    Parsed path \"" << name << "\" -> " << parsed.size() << " points" << std::endl;
        library.add(name, std::move(parsed));
    }
    return library;
}

PathLibrary PathLibrary::load(const std::string &filename) {
    return parseSvg(FileReader::readText(filename));
}

void PathLibrary::add(const std::string &id, Polyline polyline) {
    auto [it, inserted] = paths.insert_or_assign(id, std::move(polyline));
    if (inserted) {
        order.push_back(id);
    }
}

const Polyline * PathLibrary::find(const std::string &id) const {
    auto it = paths.find(id);
    return it == paths.end() ? nullptr : &it->second;
}

size_t PathLibrary::size() const {
    return paths.size();
}

const std::vector<std::string>& PathLibrary::ids() const {
    return order;
}

Polyline PathLibrary::toWorld(const Polyline &raw, float centerX, float sourceHeight, float scale) {
    Polyline world;
    world.reserve(raw.size());
    for (const glm::vec2 &p : raw) {
        world.emplace_back((p.x - centerX) * scale, (sourceHeight - p.y) * scale);
    }
    return world;
}
