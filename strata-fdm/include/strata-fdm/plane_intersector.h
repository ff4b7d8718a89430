#ifndef STRATA_FDM_PLANE_INTERSECTOR_H
#define STRATA_FDM_PLANE_INTERSECTOR_H

#include "strata-fdm/geometry.h"
#include <vector>

namespace strata {
namespace fdm {

/**
 * Computes where a triangle meets a horizontal plane
 */
class PlaneIntersector {
public:
    /**
     * Intersect the three edges of a triangle with the plane at height z.
     * Edges are visited as (v0,v1), (v1,v2), (v2,v0). An edge lying in the
     * plane contributes both endpoints, an edge crossing it contributes the
     * interpolated point, any other edge contributes nothing.
     * @param triangle The triangle to test
     * @param z Plane height
     * @return Between 0 and 6 points projected to XY, duplicates kept
     */
    std::vector<Point2D> intersect(const Triangle& triangle, double z) const;

private:
    // Point on the edge p1-p2 at height z, requires p1.z != p2.z
    static Point2D interpolate(const Vertex& p1, const Vertex& p2, double z);
};

} // namespace fdm
} // namespace strata

#endif // STRATA_FDM_PLANE_INTERSECTOR_H
