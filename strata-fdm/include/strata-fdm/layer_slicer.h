#ifndef STRATA_FDM_LAYER_SLICER_H
#define STRATA_FDM_LAYER_SLICER_H

#include "strata-fdm/config.h"
#include "strata-fdm/geometry.h"
#include "strata-fdm/mesh.h"
#include "strata-fdm/plane_intersector.h"
#include <vector>

namespace strata {
namespace fdm {

/**
 * Sweeps horizontal planes across a mesh, one Layer per plane height
 */
class LayerSlicer {
public:
    LayerSlicer();
    ~LayerSlicer();

    /**
     * Select how plane heights advance
     * @param stepping INDEXED (default) or ACCUMULATED
     */
    void setHeightStepping(HeightStepping stepping);
    HeightStepping getHeightStepping() const;

    /**
     * Slice the whole mesh.
     * Every triangle is tested against every plane. A layer is emitted for
     * each height even when it holds no segments.
     * @param mesh The mesh to slice
     * @param layerHeight Distance between planes
     * @return Layers ordered by height, starting at the mesh minimum z
     * @throws InvalidParameterError when layerHeight is not a positive number
     * @throws InvalidMeshError when the mesh is empty or has no height
     */
    std::vector<Layer> slice(const Mesh& mesh, double layerHeight) const;

    /**
     * Plane heights z_min, z_min+h, ... up to and including z_max.
     * At most floor((z_max - z_min) / h) + 2 heights are returned.
     * @throws InvalidParameterError when layerHeight is not a positive number
     */
    std::vector<double> layerHeights(double zMin, double zMax, double layerHeight) const;

    /**
     * Collect the clean two point crossings of every triangle at height z
     */
    Layer sliceAt(const Mesh& mesh, double z) const;

private:
    HeightStepping m_stepping;
    PlaneIntersector m_intersector;

    static void checkLayerHeight(double layerHeight);
    static void checkMesh(const Mesh& mesh);
};

} // namespace fdm
} // namespace strata

#endif // STRATA_FDM_LAYER_SLICER_H
