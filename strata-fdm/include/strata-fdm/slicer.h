#ifndef STRATA_FDM_SLICER_H
#define STRATA_FDM_SLICER_H

#include "strata-fdm/config.h"
#include "strata-fdm/gcode_emitter.h"
#include "strata-fdm/geometry.h"
#include "strata-fdm/layer_slicer.h"
#include "strata-fdm/mesh.h"
#include "strata-fdm/toolpath_builder.h"
#include <memory>
#include <string>
#include <vector>

namespace strata {
namespace fdm {

/**
 * Everything one pass of the pipeline produced
 */
struct SliceResult {
    std::vector<Layer> layers;
    std::vector<Toolpath> toolpaths;
    GCodeProgram program;

    size_t segmentCount() const;
    size_t pointCount() const;
};

/**
 * Runs slicing, toolpath ordering and G-code emission for one mesh
 */
class Slicer {
public:
    explicit Slicer(const SlicerConfig& config);
    ~Slicer();

    const SlicerConfig& getConfig() const { return m_config; }

    /**
     * Replace the toolpath ordering policy
     */
    void setOrdering(std::unique_ptr<ToolpathOrdering> ordering);

    /**
     * Print stage progress to stdout
     */
    void setVerbose(bool verbose) { m_verbose = verbose; }

    /**
     * Run the in-memory pipeline
     * @param mesh The mesh to slice
     * @return Layers, toolpaths and the G-code program
     * @throws InvalidParameterError, InvalidMeshError
     */
    SliceResult slice(const Mesh& mesh) const;

    /**
     * Write the program of a previous slice to a file
     * @throws IoError when the file cannot be written
     */
    void writeGCode(const SliceResult& result, const std::string& outputFile) const;

    /**
     * Load the configured input file, slice it and write the configured output file
     * @throws IoError, InvalidParameterError, InvalidMeshError
     */
    SliceResult run() const;

private:
    SlicerConfig m_config;
    LayerSlicer m_layerSlicer;
    ToolpathBuilder m_toolpathBuilder;
    GCodeEmitter m_emitter;
    bool m_verbose;
};

} // namespace fdm
} // namespace strata

#endif // STRATA_FDM_SLICER_H
