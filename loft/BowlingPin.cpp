#include "BowlingPin.hpp"
#include "LoftConfig.hpp"
#include "LoftPipeline.hpp"
#include "MeshFile.hpp"
#include "../math/Math.hpp"
#include <fstream>
#include <stdexcept>
#include <system_error>

namespace {
    void writeFile(const std::filesystem::path &path, const std::string &content) {
        std::ofstream file(path);
        if (!file) {
            throw std::runtime_error("failed to open file for writing: " + path.string());
        }
        file << content;
    }
}

const std::string BowlingPin::PATH =
    "M 80 10 C 78 10 70 20 70 40 C 70 55 88 70 88 80 C 88 90 75 100 72 120 "
    "C 68 140 60 155 60 165 C 60 175 62 185 65 190 L 135 190 "
    "C 138 185 140 175 140 165 C 140 155 132 140 128 120 "
    "C 125 100 112 90 112 80 C 112 70 130 55 130 40 C 130 20 122 10 120 10 Z";

std::string BowlingPin::svg() {
    return "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
           "<svg xmlns=\"http://www.w3.org/2000/svg\" viewBox=\"0 0 200 200\">\n"
           "  <path id=\"body\" d=\"" + PATH + "\" fill=\"none\" stroke=\"black\"/>\n"
           "</svg>\n";
}

nlohmann::json BowlingPin::config(const std::string &frontSvg, const std::string &sideSvg, const std::string &output) {
    return {
        {"name", "bowling_pin"},
        {"svgFront", frontSvg},
        {"svgSide", sideSvg},
        {"svgHeight", 200},
        {"svgCenterX", 100},
        {"scale", 0.01},
        {"vertsPerRing", 10},
        {"samplesPerUnit", 60},
        {"components", {
            {{"id", "body"}, {"frontPath", "body"}, {"sidePath", "body"}, {"capTop", true}, {"capBottom", true}}
        }},
        {"yRanges", {
            {{"yMin", 0.0}, {"yMax", 0.5}, {"color", "0xeeeeee"}},
            {{"yMin", 0.5}, {"yMax", 1.2}, {"color", "0xcc0000"}},
            {{"yMin", 1.2}, {"yMax", 2.0}, {"color", "0xeeeeee"}}
        }},
        {"output", output}
    };
}

LoftResult BowlingPin::run(const std::filesystem::path &workDir, const std::string &output) {
    ensureFolderExists(workDir.string());
    try {
        writeFile(workDir / "pin-front.svg", svg());
        writeFile(workDir / "pin-side.svg", svg());
        std::filesystem::path configPath = workDir / "pin-config.json";
        writeFile(configPath, config("pin-front.svg", "pin-side.svg", output).dump(2));

        LoftConfig loftConfig = LoftConfig::load(configPath.string());
        LoftResult result = LoftPipeline(loftConfig).run();
        MeshFile().exportAsset(result, loftConfig.resolve(loftConfig.output));
        std::filesystem::remove_all(workDir);
        return result;
    } catch (const std::exception &) {
        std::error_code ignored;
        std::filesystem::remove_all(workDir, ignored);
        throw;
    }
}
