#ifndef STRATA_FDM_TOOLPATH_BUILDER_H
#define STRATA_FDM_TOOLPATH_BUILDER_H

#include "strata-fdm/geometry.h"
#include <memory>
#include <string>
#include <vector>

namespace strata {
namespace fdm {

/**
 * Policy deciding the order in which a layer's points are visited
 */
class ToolpathOrdering {
public:
    virtual ~ToolpathOrdering() = default;

    // Short identifier used in log output
    virtual std::string name() const = 0;

    virtual Toolpath order(const Layer& layer) const = 0;
};

/**
 * Visits all segment endpoints sorted by x, then y.
 * This is not a path planner: segments are not chained and travel is not
 * minimized.
 */
class SortedPointOrdering : public ToolpathOrdering {
public:
    std::string name() const override { return "sorted"; }

    Toolpath order(const Layer& layer) const override;
};

/**
 * Turns slicer layers into per-layer toolpaths
 */
class ToolpathBuilder {
public:
    ToolpathBuilder();
    explicit ToolpathBuilder(std::unique_ptr<ToolpathOrdering> ordering);
    ~ToolpathBuilder();

    /**
     * Replace the ordering policy
     * @param ordering New policy, ignored when null
     */
    void setOrdering(std::unique_ptr<ToolpathOrdering> ordering);
    const ToolpathOrdering& getOrdering() const;

    /**
     * Build one toolpath per layer, in layer order
     * @param layers Output of the layer slicer
     * @return Toolpaths, same count and order as layers
     */
    std::vector<Toolpath> build(const std::vector<Layer>& layers) const;

private:
    std::unique_ptr<ToolpathOrdering> m_ordering;
};

} // namespace fdm
} // namespace strata

#endif // STRATA_FDM_TOOLPATH_BUILDER_H
