#include "strata-fdm/geometry.h"

namespace strata {
namespace fdm {

bool Triangle::isDegenerate(double tolerance) const {
    Point3D edge1 = vertices[1] - vertices[0];
    Point3D edge2 = vertices[2] - vertices[0];
    return edge1.cross(edge2).magnitude() <= tolerance;
}

void BoundingBox::update(const Point3D& point) {
    if (!defined) {
        min = point;
        max = point;
        defined = true;
        return;
    }

    if (point.x < min.x) min.x = point.x;
    if (point.y < min.y) min.y = point.y;
    if (point.z < min.z) min.z = point.z;
    if (point.x > max.x) max.x = point.x;
    if (point.y > max.y) max.y = point.y;
    if (point.z > max.z) max.z = point.z;
}

double Toolpath::length() const {
    if (m_points.size() < 2) {
        return 0.0;
    }

    double totalLength = 0.0;
    for (size_t i = 1; i < m_points.size(); ++i) {
        totalLength += m_points[i-1].distanceTo(m_points[i]);
    }

    return totalLength;
}

} // namespace fdm
} // namespace strata
