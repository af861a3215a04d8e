#include "loft/loft.hpp"

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <exception>
#include <string>

void printUsage() {
    std::cout << "SVG silhouette lofting tool" << std::endl;
    std::cout << "Usage: silhouette-loft <config.json>" << std::endl;
    std::cout << "       silhouette-loft --test" << std::endl;
    std::cout << std::endl;
    std::cout << "Config JSON format:" << std::endl;

    nlohmann::json example = {
        {"name", "character"},
        {"svgFront", "character-front.svg"},
        {"svgSide", "character-side.svg"},
        {"svgTop", "character-top.svg"},
        {"svgHeight", 200},
        {"svgCenterX", 100},
        {"scale", 0.01},
        {"vertsPerRing", 10},
        {"samplesPerUnit", 40},
        {"roughness", 0.7},
        {"metalness", 0.02},
        {"components", {
            {{"id", "body"}, {"frontPath", "body"}, {"sidePath", "body"}, {"capTop", true}, {"capBottom", true}}
        }},
        {"yRanges", {
            {{"yMin", 0}, {"yMax", 0.08}, {"color", "0x1a1a1a"}},
            {{"yMin", 0.08}, {"yMax", 0.88}, {"color", "0x3d3024"}},
            {{"yMin", 0.88}, {"yMax", 1.48}, {"color", "0x3366cc"}},
            {{"yMin", 1.48}, {"yMax", 2.0}, {"color", "0xd4a574"}}
        }},
        {"output", "output.mesh.gz"}
    };
    std::cout << example.dump(2) << std::endl;
}

void process(const std::string &configPath) {
    LoftConfig config = LoftConfig::load(configPath);
    LoftPipeline pipeline(config);
    LoftResult result = pipeline.run();
    MeshFile exporter;
    exporter.exportAsset(result, config.resolve(config.output));
}

void runBowlingPinTest() {
    std::filesystem::path tmpDir = std::filesystem::temp_directory_path() / "silhouette-loft-test";
    std::filesystem::path output = std::filesystem::current_path() / "test_bowling_pin.mesh.gz";
    BowlingPin::run(tmpDir, output.string());

    std::cout << std::endl << "Bowling pin test complete: " << output.string() << std::endl;
}

int main(int argc, char **argv) {
    if (argc < 2) {
        printUsage();
        return EXIT_SUCCESS;
    }

    try {
        std::string arg = argv[1];
        if (arg == "--test") {
            std::cout << "Running built-in test: bowling pin..." << std::endl;
            runBowlingPinTest();
        } else {
            process(arg);
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
