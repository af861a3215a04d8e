#pragma once
#include "AssetExporter.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <string>

// Built-in demo shape: a symmetric pin whose front and side views share one path
class BowlingPin {
public:
    static const std::string PATH;
    static std::string svg();
    static nlohmann::json config(const std::string &frontSvg, const std::string &sideSvg, const std::string &output);

    // Writes both views and a config into workDir, lofts and exports them to
    // output. workDir is removed afterwards, also when the run throws.
    static LoftResult run(const std::filesystem::path &workDir, const std::string &output);
};
