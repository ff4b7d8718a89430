#include "strata-fdm/mesh.h"
#include <algorithm>
#include <utility>

namespace strata {
namespace fdm {

Mesh::Mesh(std::vector<Triangle> triangles) : m_triangles(std::move(triangles)) {
    for (const auto& triangle : m_triangles) {
        for (int i = 0; i < 3; ++i) {
            m_bounds.update(triangle.vertices[i]);
        }
    }
}

double Mesh::getMinZ() const {
    return m_bounds.defined ? m_bounds.min.z : 0.0;
}

double Mesh::getMaxZ() const {
    return m_bounds.defined ? m_bounds.max.z : 0.0;
}

size_t Mesh::countDegenerate() const {
    return static_cast<size_t>(std::count_if(m_triangles.begin(), m_triangles.end(),
        [](const Triangle& triangle) { return triangle.isDegenerate(); }));
}

} // namespace fdm
} // namespace strata
