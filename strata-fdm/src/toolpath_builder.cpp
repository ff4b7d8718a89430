#include "strata-fdm/toolpath_builder.h"
#include <algorithm>
#include <utility>

namespace strata {
namespace fdm {

Toolpath SortedPointOrdering::order(const Layer& layer) const {
    std::vector<Point2D> points;
    points.reserve(layer.segments.size() * 2);

    for (const auto& segment : layer.segments) {
        points.push_back(segment.start);
        points.push_back(segment.end);
    }

    std::stable_sort(points.begin(), points.end(), [](const Point2D& a, const Point2D& b) {
        if (a.x != b.x) {
            return a.x < b.x;
        }
        return a.y < b.y;
    });

    return Toolpath(points);
}

ToolpathBuilder::ToolpathBuilder() : m_ordering(std::make_unique<SortedPointOrdering>()) {}

ToolpathBuilder::ToolpathBuilder(std::unique_ptr<ToolpathOrdering> ordering)
    : m_ordering(ordering ? std::move(ordering) : std::make_unique<SortedPointOrdering>()) {}

ToolpathBuilder::~ToolpathBuilder() = default;

void ToolpathBuilder::setOrdering(std::unique_ptr<ToolpathOrdering> ordering) {
    if (ordering) {
        m_ordering = std::move(ordering);
    }
}

const ToolpathOrdering& ToolpathBuilder::getOrdering() const {
    return *m_ordering;
}

std::vector<Toolpath> ToolpathBuilder::build(const std::vector<Layer>& layers) const {
    std::vector<Toolpath> toolpaths;
    toolpaths.reserve(layers.size());

    for (const auto& layer : layers) {
        toolpaths.push_back(m_ordering->order(layer));
    }

    return toolpaths;
}

} // namespace fdm
} // namespace strata
