#include "strata-fdm/utils.h"

#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace strata {
namespace fdm {

namespace {

// Position of the extension dot in the last path component, npos if none
size_t extensionDot(const std::string& path) {
    size_t lastSeparator = path.find_last_of("/\\");
    size_t lastDot = path.find_last_of('.');
    if (lastDot == std::string::npos) {
        return std::string::npos;
    }
    if (lastSeparator != std::string::npos && lastDot < lastSeparator) {
        return std::string::npos;
    }
    return lastDot;
}

} // namespace

bool Utils::saveLayersToCSV(const std::vector<Layer>& layers, const std::string& filename) {
    std::ofstream outFile(filename);
    if (!outFile.is_open()) {
        std::cerr << "Error: Could not open file for writing: " << filename << std::endl;
        return false;
    }

    outFile << "# Sliced layers" << std::endl;
    outFile << "# Format: layer_index,z,segment_index,x1,y1,x2,y2" << std::endl;

    for (size_t layerIndex = 0; layerIndex < layers.size(); layerIndex++) {
        const auto& layer = layers[layerIndex];
        outFile << "# Layer " << layerIndex << " (" << layer.segments.size() << " segments)" << std::endl;

        for (size_t segmentIndex = 0; segmentIndex < layer.segments.size(); segmentIndex++) {
            const auto& segment = layer.segments[segmentIndex];
            outFile << layerIndex << "," << layer.z << "," << segmentIndex << ","
                    << segment.start.x << "," << segment.start.y << ","
                    << segment.end.x << "," << segment.end.y << std::endl;
        }
    }

    outFile.close();
    return !outFile.fail();
}

std::string Utils::formatNumber(double value, int precision) {
    std::stringstream ss;
    ss << std::fixed << std::setprecision(precision) << value;
    return ss.str();
}

std::string Utils::getFileExtension(const std::string& path) {
    size_t pos = extensionDot(path);
    if (pos == std::string::npos) {
        return "";
    }
    return path.substr(pos + 1);
}

std::string Utils::getBaseName(const std::string& path) {
    size_t lastSeparator = path.find_last_of("/\\");
    std::string fileName = (lastSeparator == std::string::npos) ? path : path.substr(lastSeparator + 1);

    size_t lastDot = fileName.find_last_of('.');
    if (lastDot != std::string::npos) {
        fileName = fileName.substr(0, lastDot);
    }

    return fileName;
}

std::string Utils::replaceExtension(const std::string& path, const std::string& newExtension) {
    size_t pos = extensionDot(path);
    if (pos == std::string::npos) {
        return path + "." + newExtension;
    }
    return path.substr(0, pos + 1) + newExtension;
}

} // namespace fdm
} // namespace strata
