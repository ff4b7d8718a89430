#include "strata-fdm/slicer.h"
#include "strata-fdm/errors.h"
#include "strata-fdm/stl_loader.h"
#include "strata-fdm/utils.h"

#include <iostream>
#include <utility>

namespace strata {
namespace fdm {

size_t SliceResult::segmentCount() const {
    size_t count = 0;
    for (const auto& layer : layers) {
        count += layer.segments.size();
    }
    return count;
}

size_t SliceResult::pointCount() const {
    size_t count = 0;
    for (const auto& toolpath : toolpaths) {
        count += toolpath.size();
    }
    return count;
}

Slicer::Slicer(const SlicerConfig& config) : m_config(config), m_verbose(false) {
    m_layerSlicer.setHeightStepping(m_config.getHeightStepping());
}

Slicer::~Slicer() = default;

void Slicer::setOrdering(std::unique_ptr<ToolpathOrdering> ordering) {
    m_toolpathBuilder.setOrdering(std::move(ordering));
}

SliceResult Slicer::slice(const Mesh& mesh) const {
    m_config.validate();

    SliceResult result;
    double layerHeight = m_config.getLayerHeight();

    if (m_verbose) {
        std::cout << "Slicing " << mesh.size() << " triangles at " << layerHeight
                  << " mm (" << m_config.getHeightSteppingString() << " stepping)..." << std::endl;
    }
    result.layers = m_layerSlicer.slice(mesh, layerHeight);

    if (m_verbose) {
        std::cout << "  " << result.layers.size() << " layers, "
                  << result.segmentCount() << " segments" << std::endl;
        std::cout << "Ordering toolpaths (" << m_toolpathBuilder.getOrdering().name() << ")..." << std::endl;
    }
    result.toolpaths = m_toolpathBuilder.build(result.layers);

    if (m_verbose) {
        double travel = 0.0;
        for (const auto& toolpath : result.toolpaths) {
            travel += toolpath.length();
        }
        std::cout << "  " << result.pointCount() << " toolpath points, "
                  << Utils::formatNumber(travel, 2) << " mm of XY moves" << std::endl;
    }
    result.program = m_emitter.generateProgram(result.toolpaths, layerHeight);

    return result;
}

void Slicer::writeGCode(const SliceResult& result, const std::string& outputFile) const {
    m_emitter.writeProgram(result.program, outputFile);

    if (m_verbose) {
        std::cout << "Wrote " << result.program.size() << " G-code lines to " << outputFile << std::endl;
    }
}

SliceResult Slicer::run() const {
    if (m_config.getInputFile().empty()) {
        throw InvalidParameterError("No input file configured");
    }
    if (m_config.getOutputFile().empty()) {
        throw InvalidParameterError("No output file configured");
    }

    STLLoader loader;
    Mesh mesh = loader.loadSTL(m_config.getInputFile());
    if (m_verbose) {
        loader.printMeshInfo(mesh);
    }

    SliceResult result = slice(mesh);
    writeGCode(result, m_config.getOutputFile());
    return result;
}

} // namespace fdm
} // namespace strata
