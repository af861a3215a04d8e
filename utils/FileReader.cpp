#include "FileReader.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>

std::vector<char> FileReader::readFile(const std::string& filename) {
    std::ifstream file(filename, std::ios::ate | std::ios::binary);

    if (!file.is_open()) {
        throw std::runtime_error("failed to open file: " + filename);
    }

    size_t fileSize = static_cast<size_t>(file.tellg());
    std::vector<char> buffer(fileSize);
    file.seekg(0);
    file.read(buffer.data(), fileSize);
    file.close();
    return buffer;
}

std::string FileReader::readText(const std::string& filename) {
    std::vector<char> buffer = readFile(filename);
    return std::string(buffer.begin(), buffer.end());
}
