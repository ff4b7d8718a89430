#include "strata-fdm/gcode_emitter.h"
#include "strata-fdm/errors.h"
#include "strata-fdm/utils.h"

#include <cmath>
#include <fstream>
#include <sstream>

namespace strata {
namespace fdm {

namespace {

// Printer settings are fixed, not part of SlicerConfig
const int kExtruderTemperature = 200;
const int kBedTemperature = 60;
const int kZFeedRate = 300;
const int kXYFeedRate = 1500;
const int kCoordinateDecimals = 2;

} // namespace

std::string GCodeCommand::toString() const {
    if (comment.empty()) {
        return command;
    }
    return command + " ; " + comment;
}

void GCodeProgram::writeTo(std::ostream& out) const {
    for (const auto& command : m_commands) {
        out << command.toString() << '\n';
    }
}

std::string GCodeProgram::toString() const {
    std::stringstream ss;
    writeTo(ss);
    return ss.str();
}

GCodeEmitter::GCodeEmitter() = default;
GCodeEmitter::~GCodeEmitter() = default;

GCodeProgram GCodeEmitter::generateProgram(const std::vector<Toolpath>& toolpaths,
                                           double layerHeight) const {
    if (!std::isfinite(layerHeight) || layerHeight <= 0.0) {
        throw InvalidParameterError("Layer height must be greater than zero, got "
                                    + std::to_string(layerHeight));
    }

    GCodeProgram program;

    writeHeader(program);

    // Height comes from the toolpath index, not from Layer::z
    for (size_t i = 0; i < toolpaths.size(); ++i) {
        double z = static_cast<double>(i + 1) * layerHeight;
        writeLayer(program, toolpaths[i], z);
    }

    writeFooter(program);

    return program;
}

std::string GCodeEmitter::generateGCodeString(const std::vector<Toolpath>& toolpaths,
                                              double layerHeight) const {
    return generateProgram(toolpaths, layerHeight).toString();
}

void GCodeEmitter::generateGCode(const std::vector<Toolpath>& toolpaths, double layerHeight,
                                 const std::string& outputFile) const {
    writeProgram(generateProgram(toolpaths, layerHeight), outputFile);
}

void GCodeEmitter::writeProgram(const GCodeProgram& program, const std::string& outputFile) const {
    std::ofstream file(outputFile);
    if (!file.is_open()) {
        throw IoError("Could not open file for writing: " + outputFile);
    }

    program.writeTo(file);
    file.flush();
    if (file.fail()) {
        throw IoError("Failed while writing G-code to: " + outputFile);
    }

    file.close();
    if (file.fail()) {
        throw IoError("Failed to close G-code file: " + outputFile);
    }
}

void GCodeEmitter::writeHeader(GCodeProgram& program) const {
    program.addCommand(GCodeCommand("G21", "Set units to mm"));
    program.addCommand(GCodeCommand("G90", "Absolute positioning"));
    program.addCommand(GCodeCommand("M104 S" + std::to_string(kExtruderTemperature),
                                    "Set extruder temperature"));
    program.addCommand(GCodeCommand("M140 S" + std::to_string(kBedTemperature),
                                    "Set bed temperature"));
    program.addCommand(GCodeCommand("M190 S" + std::to_string(kBedTemperature),
                                    "Wait for bed temperature"));
    program.addCommand(GCodeCommand("M109 S" + std::to_string(kExtruderTemperature),
                                    "Wait for extruder temperature"));
}

void GCodeEmitter::writeFooter(GCodeProgram& program) const {
    program.addCommand(GCodeCommand("M104 S0", "Turn off extruder"));
    program.addCommand(GCodeCommand("M140 S0", "Turn off bed"));
    program.addCommand(GCodeCommand("M84", "Disable motors"));
}

void GCodeEmitter::writeLayer(GCodeProgram& program, const Toolpath& toolpath, double z) const {
    program.addCommand(GCodeCommand("G1 " + formatCoordinate('Z', z) + " F" + std::to_string(kZFeedRate),
                                    "Move to layer height"));

    for (const auto& point : toolpath.getPoints()) {
        program.addCommand(GCodeCommand("G1 " + formatCoordinate('X', point.x) + " "
                                        + formatCoordinate('Y', point.y)
                                        + " F" + std::to_string(kXYFeedRate),
                                        "Move"));
    }
}

std::string GCodeEmitter::formatCoordinate(char axis, double value) {
    return std::string(1, axis) + Utils::formatNumber(value, kCoordinateDecimals);
}

} // namespace fdm
} // namespace strata
