#include <catch2/catch.hpp>

#include <strata-fdm/errors.h>
#include <strata-fdm/slicer.h>

#include <cstdio>
#include <iostream>
#include <memory>
#include <sstream>

#include "test_data.h"

using namespace strata::fdm;
using namespace strata::fdm::test;

namespace {

class EmptyOrdering : public ToolpathOrdering {
public:
    std::string name() const override { return "empty"; }

    Toolpath order(const Layer&) const override { return Toolpath(); }
};

// One 3-4-5 move per layer
class FixedMoveOrdering : public ToolpathOrdering {
public:
    std::string name() const override { return "fixed"; }

    Toolpath order(const Layer&) const override {
        Toolpath toolpath;
        toolpath.addPoint(Point2D(0, 0));
        toolpath.addPoint(Point2D(3, 4));
        return toolpath;
    }
};

} // namespace

TEST_CASE("Cube runs through the whole pipeline", "[Slicer]") {
    SlicerConfig config;
    config.setLayerHeight(0.5);
    const Slicer slicer(config);

    const SliceResult result = slicer.slice(cube_mesh(1.0));

    REQUIRE(result.layers.size() == 3);
    REQUIRE(result.toolpaths.size() == 3);
    CHECK(result.layers[1].segments.size() == 8);
    CHECK(result.toolpaths[1].size() == 16);
    CHECK(result.pointCount() == 2 * result.segmentCount());

    // Preamble, one Z move and the points per layer, postamble
    CHECK(result.program.size() == 6 + 3 + result.pointCount() + 3);
    const std::vector<GCodeCommand> &commands = result.program.getCommands();
    CHECK(commands.front().command == "G21");
    CHECK(commands.back().command == "M84");
}

TEST_CASE("Slicing is deterministic", "[Slicer]") {
    SlicerConfig config;
    config.setLayerHeight(0.25);
    const Slicer slicer(config);
    const Mesh mesh = cube_mesh(2.0);
    CHECK(slicer.getConfig().getLayerHeight() == 0.25);

    const std::string first = slicer.slice(mesh).program.toString();
    const std::string second = Slicer(config).slice(mesh).program.toString();

    CHECK(first == second);
}

TEST_CASE("Stepping mode reaches the layer slicer", "[Slicer]") {
    SlicerConfig config;
    config.setLayerHeight(0.1);

    SECTION("indexed") {
        CHECK(Slicer(config).slice(cube_mesh(2.0)).layers.size() == 21);
    }

    SECTION("accumulated") {
        config.setHeightStepping(HeightStepping::ACCUMULATED);
        CHECK(Slicer(config).slice(cube_mesh(2.0)).layers.size() == 20);
    }
}

TEST_CASE("Injected ordering is used by the pipeline", "[Slicer]") {
    SlicerConfig config;
    config.setLayerHeight(0.5);
    Slicer slicer(config);
    slicer.setOrdering(std::make_unique<EmptyOrdering>());

    const SliceResult result = slicer.slice(cube_mesh(1.0));

    CHECK(result.segmentCount() > 0);
    CHECK(result.pointCount() == 0);
    CHECK(result.program.size() == 6 + 3 + 3);
}

TEST_CASE("Verbose slicing reports the XY travel", "[Slicer]") {
    SlicerConfig config;
    config.setLayerHeight(0.5);
    Slicer slicer(config);
    slicer.setVerbose(true);
    slicer.setOrdering(std::make_unique<FixedMoveOrdering>());

    std::ostringstream captured;
    std::streambuf *previous = std::cout.rdbuf(captured.rdbuf());
    slicer.slice(cube_mesh(1.0));
    std::cout.rdbuf(previous);

    CHECK(captured.str().find("6 toolpath points, 15.00 mm of XY moves") != std::string::npos);
}

TEST_CASE("Invalid pipeline input", "[Slicer]") {
    SECTION("zero layer height") {
        SlicerConfig config;
        config.setLayerHeight(0.0);
        CHECK_THROWS_AS(Slicer(config).slice(cube_mesh(1.0)), InvalidParameterError);
    }

    SECTION("empty mesh") {
        CHECK_THROWS_AS(Slicer(SlicerConfig()).slice(Mesh()), InvalidMeshError);
    }

    SECTION("run without configured files") {
        CHECK_THROWS_AS(Slicer(SlicerConfig()).run(), InvalidParameterError);
    }

    SECTION("run with a missing input file") {
        SlicerConfig config;
        config.setInputFile(temp_path("no_such_input.stl"));
        config.setOutputFile(temp_path("no_such_output.gcode"));
        CHECK_THROWS_AS(Slicer(config).run(), IoError);
    }
}

TEST_CASE("Run converts an STL file into a G-code file", "[Slicer]") {
    const std::string input = temp_path("run_cube.stl");
    const std::string output = temp_path("run_cube.gcode");
    write_binary_stl(input, cube_triangles(1.0));

    SlicerConfig config;
    config.setInputFile(input);
    config.setOutputFile(output);
    config.setLayerHeight(0.5);

    const SliceResult result = Slicer(config).run();

    CHECK(result.layers.size() == 3);
    CHECK(read_file(output) == result.program.toString());

    std::remove(input.c_str());
    std::remove(output.c_str());
}
