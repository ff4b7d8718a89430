#include "strata-fdm/layer_slicer.h"
#include "strata-fdm/errors.h"
#include <cmath>
#include <string>

namespace strata {
namespace fdm {

LayerSlicer::LayerSlicer() : m_stepping(HeightStepping::INDEXED) {}

LayerSlicer::~LayerSlicer() = default;

void LayerSlicer::setHeightStepping(HeightStepping stepping) { m_stepping = stepping; }

HeightStepping LayerSlicer::getHeightStepping() const { return m_stepping; }

std::vector<Layer> LayerSlicer::slice(const Mesh& mesh, double layerHeight) const {
    checkLayerHeight(layerHeight);
    checkMesh(mesh);

    std::vector<double> heights = layerHeights(mesh.getMinZ(), mesh.getMaxZ(), layerHeight);

    std::vector<Layer> layers;
    layers.reserve(heights.size());
    for (double z : heights) {
        layers.push_back(sliceAt(mesh, z));
    }

    return layers;
}

std::vector<double> LayerSlicer::layerHeights(double zMin, double zMax, double layerHeight) const {
    checkLayerHeight(layerHeight);

    std::vector<double> heights;

    // Upper bound on the plane count, also when z + h rounds back to z
    const double maxLayers = std::floor((zMax - zMin) / layerHeight) + 2.0;

    if (m_stepping == HeightStepping::ACCUMULATED) {
        double z = zMin;
        for (size_t i = 0; z <= zMax && static_cast<double>(i) < maxLayers; ++i) {
            heights.push_back(z);
            z += layerHeight;
        }
        return heights;
    }

    for (size_t i = 0; static_cast<double>(i) < maxLayers; ++i) {
        double z = zMin + static_cast<double>(i) * layerHeight;
        if (z > zMax) {
            break;
        }
        heights.push_back(z);
    }

    return heights;
}

Layer LayerSlicer::sliceAt(const Mesh& mesh, double z) const {
    Layer layer(z);

    for (const auto& triangle : mesh.getTriangles()) {
        std::vector<Point2D> points = m_intersector.intersect(triangle, z);

        // Only clean crossings become segments
        if (points.size() == 2) {
            layer.segments.emplace_back(points[0], points[1]);
        }
    }

    return layer;
}

void LayerSlicer::checkLayerHeight(double layerHeight) {
    if (!std::isfinite(layerHeight) || layerHeight <= 0.0) {
        throw InvalidParameterError("Layer height must be greater than zero, got "
                                    + std::to_string(layerHeight));
    }
}

void LayerSlicer::checkMesh(const Mesh& mesh) {
    if (mesh.empty()) {
        throw InvalidMeshError("Mesh contains no triangles");
    }
    if (!(mesh.getMaxZ() > mesh.getMinZ())) {
        throw InvalidMeshError("Mesh has zero height (z_min == z_max == "
                               + std::to_string(mesh.getMinZ()) + ")");
    }
}

} // namespace fdm
} // namespace strata
