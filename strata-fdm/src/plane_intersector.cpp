#include "strata-fdm/plane_intersector.h"

namespace strata {
namespace fdm {

std::vector<Point2D> PlaneIntersector::intersect(const Triangle& triangle, double z) const {
    std::vector<Point2D> intersections;

    for (int i = 0; i < 3; ++i) {
        const Vertex& p1 = triangle.vertices[i];
        const Vertex& p2 = triangle.vertices[(i + 1) % 3];
        double z1 = p1.z;
        double z2 = p2.z;

        if (z1 == z && z2 == z) {
            // Edge lies on the plane
            intersections.push_back(p1.xy());
            intersections.push_back(p2.xy());
        } else if ((z1 < z && z <= z2) || (z2 < z && z <= z1)) {
            // Strict inequality on one side guarantees z1 != z2
            intersections.push_back(interpolate(p1, p2, z));
        }
    }

    return intersections;
}

Point2D PlaneIntersector::interpolate(const Vertex& p1, const Vertex& p2, double z) {
    double t = (z - p1.z) / (p2.z - p1.z);
    Point3D point = p1 + (p2 - p1) * t;
    return point.xy();
}

} // namespace fdm
} // namespace strata
