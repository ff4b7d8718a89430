#include "strata-fdm/config.h"
#include "strata-fdm/errors.h"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <limits>
#include <sstream>

namespace strata {
namespace fdm {

namespace {

// Shortest decimal text that reads back as the same double
std::string formatExact(double value) {
    std::ostringstream ss;
    for (int precision = 6; precision < std::numeric_limits<double>::max_digits10; ++precision) {
        ss.str("");
        ss << std::setprecision(precision) << value;
        if (std::strtod(ss.str().c_str(), nullptr) == value) {
            return ss.str();
        }
    }
    ss.str("");
    ss << std::setprecision(std::numeric_limits<double>::max_digits10) << value;
    return ss.str();
}

} // namespace

SlicerConfig::SlicerConfig() {
    setDefaults();
}

SlicerConfig::~SlicerConfig() = default;

void SlicerConfig::setDefaults() {
    m_inputFile.clear();
    m_outputFile.clear();
    m_layerHeight = 0.2;
    m_heightStepping = HeightStepping::INDEXED;
}

bool SlicerConfig::isFirstRun(const std::string& filename) {
    std::ifstream file(filename);
    return !file.good();
}

bool SlicerConfig::loadFromFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Error: Could not open config file: " << filename << std::endl;
        return false;
    }

    std::string line;
    std::string section;

    // First set defaults, then override with values from file
    setDefaults();

    while (std::getline(file, line)) {
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        if (line[0] == '[' && line[line.length() - 1] == ']') {
            section = line.substr(1, line.length() - 2);
            continue;
        }

        std::string key, value;
        if (!parseLine(line, key, value)) {
            continue;
        }

        if (section == "files") {
            if (key == "input") m_inputFile = value;
            else if (key == "output") m_outputFile = value;
        }
        else if (section == "slicing") {
            if (key == "layer_height") m_layerHeight = parseDouble(key, value);
            else if (key == "height_stepping") setHeightSteppingFromString(value);
        }
    }

    return true;
}

bool SlicerConfig::saveToFile(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Error: Could not open config file for writing: " << filename << std::endl;
        return false;
    }

    file << "# strata-fdm slicer configuration" << std::endl;
    file << "# Automatically generated" << std::endl << std::endl;

    file << "[files]" << std::endl;
    file << "input=" << m_inputFile << std::endl;
    file << "output=" << m_outputFile << std::endl << std::endl;

    file << "[slicing]" << std::endl;
    file << "layer_height=" << formatExact(m_layerHeight) << std::endl;
    file << "height_stepping=" << getHeightSteppingString() << std::endl;

    file.close();
    return !file.fail();
}

void SlicerConfig::validate() const {
    if (!std::isfinite(m_layerHeight) || m_layerHeight <= 0.0) {
        throw InvalidParameterError("layer_height must be greater than zero, got "
                                    + std::to_string(m_layerHeight));
    }
}

bool SlicerConfig::parseLine(const std::string& line, std::string& key, std::string& value) const {
    size_t pos = line.find('=');
    if (pos == std::string::npos) {
        return false;
    }

    key = trim(line.substr(0, pos));
    value = trim(line.substr(pos + 1));

    return !key.empty();
}

std::string SlicerConfig::trim(const std::string& str) {
    auto start = std::find_if_not(str.begin(), str.end(), [](unsigned char c) {
        return std::isspace(c);
    });

    auto end = std::find_if_not(str.rbegin(), str.rend(), [](unsigned char c) {
        return std::isspace(c);
    }).base();

    return (start < end) ? std::string(start, end) : std::string();
}

double SlicerConfig::parseDouble(const std::string& key, const std::string& value) {
    size_t consumed = 0;
    double result = 0.0;
    try {
        result = std::stod(value, &consumed);
    } catch (const std::logic_error&) {
        throw InvalidParameterError("Invalid number for " + key + ": '" + value + "'");
    }
    if (consumed != value.size()) {
        throw InvalidParameterError("Invalid number for " + key + ": '" + value + "'");
    }
    return result;
}

std::string SlicerConfig::getHeightSteppingString() const {
    return heightSteppingToString(m_heightStepping);
}

void SlicerConfig::setHeightSteppingFromString(const std::string& stepping) {
    m_heightStepping = heightSteppingFromString(stepping);
}

std::string SlicerConfig::heightSteppingToString(HeightStepping stepping) {
    return (stepping == HeightStepping::ACCUMULATED) ? "accumulated" : "indexed";
}

HeightStepping SlicerConfig::heightSteppingFromString(const std::string& stepping) {
    if (stepping == "indexed") {
        return HeightStepping::INDEXED;
    }
    if (stepping == "accumulated") {
        return HeightStepping::ACCUMULATED;
    }
    throw InvalidParameterError("Unknown height stepping '" + stepping
                                + "' (expected 'indexed' or 'accumulated')");
}

} // namespace fdm
} // namespace strata
