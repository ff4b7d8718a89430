#ifndef STRATA_FDM_MESH_H
#define STRATA_FDM_MESH_H

#include "strata-fdm/geometry.h"
#include <vector>

namespace strata {
namespace fdm {

/**
 * Read-only triangle soup with its derived bounds.
 * The bounds are computed once at construction.
 */
class Mesh {
public:
    Mesh() = default;
    explicit Mesh(std::vector<Triangle> triangles);

    const std::vector<Triangle>& getTriangles() const { return m_triangles; }

    size_t size() const { return m_triangles.size(); }
    bool empty() const { return m_triangles.empty(); }

    const BoundingBox& getBoundingBox() const { return m_bounds; }

    // Lowest vertex z, 0 for an empty mesh
    double getMinZ() const;

    // Highest vertex z, 0 for an empty mesh
    double getMaxZ() const;

    // Number of zero-area facets
    size_t countDegenerate() const;

private:
    std::vector<Triangle> m_triangles;
    BoundingBox m_bounds;
};

} // namespace fdm
} // namespace strata

#endif // STRATA_FDM_MESH_H
