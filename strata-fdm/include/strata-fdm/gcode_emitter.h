#ifndef STRATA_FDM_GCODE_EMITTER_H
#define STRATA_FDM_GCODE_EMITTER_H

#include "strata-fdm/geometry.h"
#include <ostream>
#include <string>
#include <vector>

namespace strata {
namespace fdm {

/**
 * One G-code line: the command words and an inline comment
 */
struct GCodeCommand {
    std::string command;
    std::string comment;

    GCodeCommand(const std::string& cmd, const std::string& note = "")
        : command(cmd), comment(note) {}

    // "<command> ; <comment>" or just the command when there is no comment
    std::string toString() const;
};

/**
 * Ordered list of G-code commands
 */
class GCodeProgram {
public:
    void addCommand(const GCodeCommand& command) {
        m_commands.push_back(command);
    }

    const std::vector<GCodeCommand>& getCommands() const {
        return m_commands;
    }

    size_t size() const {
        return m_commands.size();
    }

    bool empty() const {
        return m_commands.empty();
    }

    // Write every command as one newline terminated line
    void writeTo(std::ostream& out) const;

    std::string toString() const;

private:
    std::vector<GCodeCommand> m_commands;
};

/**
 * Serializes per-layer toolpaths into a printer G-code program.
 * Temperatures and feed rates are fixed.
 */
class GCodeEmitter {
public:
    GCodeEmitter();
    ~GCodeEmitter();

    /**
     * Build the complete program.
     * Layer i is raised to (i + 1) * layerHeight regardless of the z the
     * slicer recorded for it.
     * @param toolpaths One toolpath per layer, bottom first
     * @param layerHeight Height step used for the Z moves
     * @return Preamble, per-layer moves and postamble
     * @throws InvalidParameterError when layerHeight is not a positive number
     */
    GCodeProgram generateProgram(const std::vector<Toolpath>& toolpaths, double layerHeight) const;

    /**
     * Generate G-code as a string without writing to a file
     */
    std::string generateGCodeString(const std::vector<Toolpath>& toolpaths, double layerHeight) const;

    /**
     * Write the G-code to a file.
     * The file is opened right before writing and closed before returning,
     * also when an error is thrown.
     * @throws IoError when the file cannot be opened or written
     */
    void generateGCode(const std::vector<Toolpath>& toolpaths, double layerHeight,
                       const std::string& outputFile) const;

    /**
     * Write an already generated program to a file
     * @throws IoError when the file cannot be opened or written
     */
    void writeProgram(const GCodeProgram& program, const std::string& outputFile) const;

private:
    void writeHeader(GCodeProgram& program) const;
    void writeFooter(GCodeProgram& program) const;
    void writeLayer(GCodeProgram& program, const Toolpath& toolpath, double z) const;

    // Axis letter followed by the value with two decimals, e.g. "X1.50"
    static std::string formatCoordinate(char axis, double value);
};

} // namespace fdm
} // namespace strata

#endif // STRATA_FDM_GCODE_EMITTER_H
