#include <catch2/catch.hpp>

#include <strata-fdm/errors.h>
#include <strata-fdm/layer_slicer.h>

#include <cmath>
#include <limits>

#include "test_data.h"

using namespace strata::fdm;
using namespace strata::fdm::test;

TEST_CASE("Unit cube sliced at 0.5", "[LayerSlicer]") {
    const Mesh mesh = cube_mesh(1.0);
    const LayerSlicer slicer;

    const std::vector<Layer> layers = slicer.slice(mesh, 0.5);

    REQUIRE(layers.size() == 3);
    CHECK(layers[0].z == 0.0);
    CHECK(layers[1].z == 0.5);
    CHECK(layers[2].z == 1.0);

    // Every side triangle crosses the middle plane on two edges
    REQUIRE(layers[1].segments.size() == 8);
    for (const Segment &segment : layers[1].segments) {
        for (const Point2D &p : { segment.start, segment.end }) {
            CHECK(p.x >= 0.0);
            CHECK(p.x <= 1.0);
            CHECK(p.y >= 0.0);
            CHECK(p.y <= 1.0);
        }
    }
}

TEST_CASE("Heights start at the mesh minimum", "[LayerSlicer]") {
    const Mesh mesh(std::vector<Triangle>{ Triangle(Vertex(0, 0, 1), Vertex(1, 0, 1), Vertex(0, 1, 2)) });
    const LayerSlicer slicer;

    const std::vector<Layer> layers = slicer.slice(mesh, 0.5);

    REQUIRE(layers.size() == 3);
    CHECK(layers[0].z == 1.0);
    CHECK(layers[1].z == 1.5);
    CHECK(layers[2].z == 2.0);
}

TEST_CASE("Layers without segments are kept", "[LayerSlicer]") {
    // Two slivers with a gap between z = 1 and z = 3
    const Mesh mesh(std::vector<Triangle>{
        Triangle(Vertex(0, 0, 0), Vertex(1, 0, 0), Vertex(0, 0, 1)),
        Triangle(Vertex(0, 0, 3), Vertex(1, 0, 3), Vertex(0, 0, 4)),
    });
    const LayerSlicer slicer;

    const std::vector<Layer> layers = slicer.slice(mesh, 1.0);

    REQUIRE(layers.size() == 5);
    CHECK(layers[2].z == 2.0);
    CHECK(layers[2].empty());
    CHECK(layers[0].segments.size() == 1);
    CHECK(layers[3].segments.size() == 1);
}

TEST_CASE("Intersections other than two points are dropped", "[LayerSlicer]") {
    // Flat facet in the plane produces six points
    const Mesh mesh(std::vector<Triangle>{
        Triangle(Vertex(0, 0, 0), Vertex(1, 0, 0), Vertex(0, 1, 0)),
        Triangle(Vertex(0, 0, 0), Vertex(1, 0, 0), Vertex(0, 0, 1)),
    });
    const LayerSlicer slicer;

    const Layer layer = slicer.sliceAt(mesh, 0.0);
    REQUIRE(layer.segments.size() == 1);
    CHECK(layer.segments[0].start == Point2D(0, 0));
    CHECK(layer.segments[0].end == Point2D(1, 0));
}

TEST_CASE("Height stepping modes", "[LayerSlicer]") {
    LayerSlicer slicer;

    SECTION("indexed is the default and reaches z_max exactly") {
        CHECK(slicer.getHeightStepping() == HeightStepping::INDEXED);
        const std::vector<double> heights = slicer.layerHeights(0.0, 2.0, 0.1);
        REQUIRE(heights.size() == 21);
        CHECK(heights.back() == Approx(2.0));
        CHECK(heights[7] == 7 * 0.1);
    }

    SECTION("accumulated drifts and loses the last layer") {
        slicer.setHeightStepping(HeightStepping::ACCUMULATED);
        const std::vector<double> heights = slicer.layerHeights(0.0, 2.0, 0.1);
        CHECK(heights.size() == 20);
    }

    SECTION("both agree when the step is exact") {
        const std::vector<double> indexed = slicer.layerHeights(0.0, 1.0, 0.5);
        slicer.setHeightStepping(HeightStepping::ACCUMULATED);
        const std::vector<double> accumulated = slicer.layerHeights(0.0, 1.0, 0.5);
        const std::vector<double> expected{ 0.0, 0.5, 1.0 };
        CHECK(indexed == accumulated);
        CHECK(indexed == expected);
    }
}

TEST_CASE("Steps below the resolution of z_min still terminate", "[LayerSlicer]") {
    // 1e-11 is less than half the spacing of doubles near 1e6, so z + h == z
    const double zMin = 1e6;
    const double zMax = std::nextafter(zMin, 2e6);
    const double h = 1e-11;
    REQUIRE(zMin + h == zMin);

    LayerSlicer slicer;

    SECTION("accumulated") {
        slicer.setHeightStepping(HeightStepping::ACCUMULATED);
        const std::vector<double> heights = slicer.layerHeights(zMin, zMax, h);
        REQUIRE_FALSE(heights.empty());
        CHECK(heights.size() <= 13);
        CHECK(heights.front() == zMin);
    }

    SECTION("indexed") {
        const std::vector<double> heights = slicer.layerHeights(zMin, zMax, h);
        REQUIRE_FALSE(heights.empty());
        CHECK(heights.size() <= 13);
        CHECK(heights.back() <= zMax);
    }
}

TEST_CASE("Invalid slicing input is rejected", "[LayerSlicer]") {
    const LayerSlicer slicer;
    const Mesh cube = cube_mesh(1.0);

    SECTION("non positive layer height") {
        CHECK_THROWS_AS(slicer.slice(cube, 0.0), InvalidParameterError);
        CHECK_THROWS_AS(slicer.slice(cube, -0.2), InvalidParameterError);
        CHECK_THROWS_AS(slicer.slice(cube, std::numeric_limits<double>::quiet_NaN()), InvalidParameterError);
        CHECK_THROWS_AS(slicer.layerHeights(0.0, 1.0, 0.0), InvalidParameterError);
    }

    SECTION("empty mesh") {
        CHECK_THROWS_AS(slicer.slice(Mesh(), 0.2), InvalidMeshError);
    }

    SECTION("mesh without height") {
        const Mesh flat(std::vector<Triangle>{ Triangle(Vertex(0, 0, 2), Vertex(1, 0, 2), Vertex(0, 1, 2)) });
        CHECK_THROWS_AS(slicer.slice(flat, 0.2), InvalidMeshError);
    }

    SECTION("errors share a common base") {
        CHECK_THROWS_AS(slicer.slice(Mesh(), 0.2), SlicerError);
    }
}
