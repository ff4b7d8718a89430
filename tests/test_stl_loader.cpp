#include <catch2/catch.hpp>

#include <strata-fdm/errors.h>
#include <strata-fdm/stl_loader.h>

#include <cstdio>
#include <fstream>
#include <limits>

#include "test_data.h"

using namespace strata::fdm;
using namespace strata::fdm::test;

namespace {

void check_same_triangles(const Mesh &mesh, const std::vector<Triangle> &expected)
{
    REQUIRE(mesh.size() == expected.size());
    for (size_t i = 0; i < expected.size(); ++i) {
        for (int j = 0; j < 3; ++j) {
            CHECK(mesh.getTriangles()[i].vertices[j].x == Approx(expected[i].vertices[j].x));
            CHECK(mesh.getTriangles()[i].vertices[j].y == Approx(expected[i].vertices[j].y));
            CHECK(mesh.getTriangles()[i].vertices[j].z == Approx(expected[i].vertices[j].z));
        }
    }
}

} // namespace

TEST_CASE("ASCII and binary cubes load the same triangles", "[STLLoader]") {
    const STLLoader loader;
    const std::vector<Triangle> cube = cube_triangles(2.0);

    SECTION("ASCII") {
        const std::string path = temp_path("cube_ascii.stl");
        write_ascii_stl(path, cube);

        CHECK_FALSE(loader.isBinarySTL(path));
        const Mesh mesh = loader.loadSTL(path);
        check_same_triangles(mesh, cube);
        CHECK(mesh.getMinZ() == 0.0);
        CHECK(mesh.getMaxZ() == 2.0);
        std::remove(path.c_str());
    }

    SECTION("binary with a header starting with solid") {
        const std::string path = temp_path("cube_binary.stl");
        write_binary_stl(path, cube);

        CHECK(loader.isBinarySTL(path));
        const Mesh mesh = loader.loadSTL(path);
        check_same_triangles(mesh, cube);
        std::remove(path.c_str());
    }

    SECTION("binary with a plain header") {
        const std::string path = temp_path("cube_plain.stl");
        write_binary_stl(path, cube, -1, "exported part");

        CHECK(loader.isBinarySTL(path));
        check_same_triangles(loader.loadSTL(path), cube);
        std::remove(path.c_str());
    }
}

TEST_CASE("Degenerate facets are kept", "[STLLoader]") {
    const STLLoader loader;
    const std::string path = temp_path("degenerate.stl");
    write_ascii_stl(path, { Triangle(Vertex(0, 0, 0), Vertex(1, 1, 1), Vertex(2, 2, 2)) });

    const Mesh mesh = loader.loadSTL(path);
    CHECK(mesh.size() == 1);
    CHECK(mesh.countDegenerate() == 1);
    std::remove(path.c_str());
}

TEST_CASE("Broken STL files are rejected", "[STLLoader]") {
    const STLLoader loader;

    SECTION("missing file") {
        CHECK_THROWS_AS(loader.loadSTL(temp_path("does_not_exist.stl")), IoError);
    }

    SECTION("binary shorter than its declared triangle count") {
        const std::string path = temp_path("truncated.stl");
        write_binary_stl(path, { cube_triangles()[0] }, 12, "exported part");

        CHECK_THROWS_AS(loader.loadSTL(path), InvalidMeshError);
        std::remove(path.c_str());
    }

    SECTION("ASCII vertex with a missing coordinate") {
        const std::string path = temp_path("malformed.stl");
        {
            std::ofstream out(path);
            out << "solid bad\n"
                   "facet normal 0 0 1\n"
                   "outer loop\n"
                   "vertex 0 0 0\n"
                   "vertex 1 0\n"
                   "vertex 0 1 0\n"
                   "endloop\n"
                   "endfacet\n"
                   "endsolid bad\n";
        }

        CHECK_THROWS_AS(loader.loadSTL(path), InvalidMeshError);
        std::remove(path.c_str());
    }

    SECTION("binary facet with a non-finite coordinate") {
        const std::string path = temp_path("nan_binary.stl");
        std::vector<Triangle> triangles = cube_triangles();
        triangles[3].vertices[1].x = std::numeric_limits<double>::quiet_NaN();
        triangles[5].vertices[2].z = std::numeric_limits<double>::infinity();
        write_binary_stl(path, triangles);

        CHECK_THROWS_AS(loader.loadSTL(path), InvalidMeshError);
        std::remove(path.c_str());
    }

    SECTION("ASCII vertex with a non-finite coordinate") {
        const std::string path = temp_path("nan_ascii.stl");
        {
            std::ofstream out(path);
            out << "solid bad\n"
                   "facet normal 0 0 1\n"
                   "outer loop\n"
                   "vertex nan 0 0\n"
                   "vertex 1 0 0\n"
                   "vertex 0 1 inf\n"
                   "endloop\n"
                   "endfacet\n"
                   "endsolid bad\n";
        }

        CHECK_THROWS_AS(loader.loadSTL(path), InvalidMeshError);
        std::remove(path.c_str());
    }

    SECTION("ASCII facet that is never closed") {
        const std::string path = temp_path("unterminated.stl");
        {
            std::ofstream out(path);
            out << "solid bad\n"
                   "facet normal 0 0 1\n"
                   "outer loop\n"
                   "vertex 0 0 0\n"
                   "vertex 1 0 0\n";
        }

        CHECK_THROWS_AS(loader.loadSTL(path), InvalidMeshError);
        std::remove(path.c_str());
    }
}
