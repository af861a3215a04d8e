#pragma once
#include <glm/glm.hpp>
#include <cstdint>
#include <string>
#include <sstream>
#include <fstream>
#include <istream>
#include <iostream>
#include <filesystem>
#include <cmath>

class Math {
public:
    static float clamp(float val, float min, float max);
    static glm::vec3 hexToRgb(uint32_t hex);
    static uint32_t rgbToHex(const glm::vec3 &rgb);
};

void ensureFolderExists(const std::string& folder);
std::stringstream gzipDecompressFromIfstream(std::ifstream& inputFile);
void gzipCompressToOfstream(std::istream& inputStream, std::ofstream& outputFile);
