#include "strata-fdm/stl_loader.h"
#include "strata-fdm/errors.h"

#include <cmath>
#include <iostream>
#include <sstream>
#include <utility>

namespace strata {
namespace fdm {

namespace {

const std::streamoff kBinaryHeaderSize = 80;
const std::streamoff kBinaryFacetSize = 50;

bool isFinite(const Vertex& vertex) {
    return std::isfinite(vertex.x) && std::isfinite(vertex.y) && std::isfinite(vertex.z);
}

} // namespace

STLLoader::STLLoader() {}

STLLoader::~STLLoader() {}

Mesh STLLoader::loadSTL(const std::string& filename) const {
    if (isBinarySTL(filename)) {
        std::cout << "Loading binary STL file: " << filename << std::endl;
        return loadBinarySTL(filename);
    } else {
        std::cout << "Loading ASCII STL file: " << filename << std::endl;
        return loadAsciiSTL(filename);
    }
}

bool STLLoader::isBinarySTL(const std::string& filename) const {
    std::ifstream file(filename, std::ios::binary);
    if (!file.is_open()) {
        throw IoError("Cannot open file " + filename);
    }

    char header[6] = {0};
    file.read(header, 5);

    if (std::string(header) != "solid") {
        return true;
    }

    // Some binary exporters put "solid" in the header, the size tells them apart
    file.clear();
    file.seekg(kBinaryHeaderSize);
    uint32_t triangleCount = 0;
    file.read(reinterpret_cast<char*>(&triangleCount), sizeof(uint32_t));
    if (!file) {
        return false;
    }

    file.seekg(0, std::ios::end);
    std::streamoff fileSize = file.tellg();
    std::streamoff expectedSize = kBinaryHeaderSize + 4
        + static_cast<std::streamoff>(triangleCount) * kBinaryFacetSize;

    return fileSize == expectedSize;
}

Mesh STLLoader::loadBinarySTL(const std::string& filename) const {
    std::ifstream file(filename, std::ios::binary);
    if (!file.is_open()) {
        throw IoError("Cannot open file " + filename);
    }

    file.seekg(kBinaryHeaderSize);

    uint32_t triangleCount = 0;
    file.read(reinterpret_cast<char*>(&triangleCount), sizeof(uint32_t));
    if (!file) {
        throw InvalidMeshError("Binary STL too short for header: " + filename);
    }

    std::cout << "Triangle count: " << triangleCount << std::endl;

    std::streamoff dataStart = file.tellg();
    file.seekg(0, std::ios::end);
    std::streamoff available = file.tellg() - dataStart;
    file.seekg(dataStart);
    if (available < static_cast<std::streamoff>(triangleCount) * kBinaryFacetSize) {
        throw InvalidMeshError("Binary STL is truncated: " + filename + " declares "
                               + std::to_string(triangleCount) + " triangles");
    }

    std::vector<Triangle> triangles;
    triangles.reserve(triangleCount);

    for (uint32_t i = 0; i < triangleCount; ++i) {
        Triangle triangle;

        // Facet normal is recomputable from the vertices, skip it
        file.seekg(3 * sizeof(float), std::ios::cur);

        for (int j = 0; j < 3; ++j) {
            triangle.vertices[j].x = readFloat(file, filename);
            triangle.vertices[j].y = readFloat(file, filename);
            triangle.vertices[j].z = readFloat(file, filename);
            if (!isFinite(triangle.vertices[j])) {
                throw InvalidMeshError("Non-finite vertex in facet " + std::to_string(i)
                                       + " of " + filename);
            }
        }

        // Skip attribute byte count (2 bytes)
        file.seekg(2, std::ios::cur);

        triangles.push_back(triangle);
    }

    return Mesh(std::move(triangles));
}

Mesh STLLoader::loadAsciiSTL(const std::string& filename) const {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw IoError("Cannot open file " + filename);
    }

    std::vector<Triangle> triangles;
    Triangle triangle;
    int vertexCount = 0;
    bool inFacet = false;
    size_t lineNumber = 0;

    std::string line;
    while (std::getline(file, line)) {
        ++lineNumber;
        std::istringstream iss(line);
        std::string keyword;
        iss >> keyword;

        if (keyword == "facet") {
            inFacet = true;
            vertexCount = 0;
        } else if (keyword == "vertex") {
            if (!inFacet || vertexCount >= 3) {
                throw InvalidMeshError("Unexpected vertex at line " + std::to_string(lineNumber)
                                       + " in " + filename);
            }
            Vertex& vertex = triangle.vertices[vertexCount];
            if (!(iss >> vertex.x >> vertex.y >> vertex.z)) {
                throw InvalidMeshError("Malformed vertex at line " + std::to_string(lineNumber)
                                       + " in " + filename);
            }
            if (!isFinite(vertex)) {
                throw InvalidMeshError("Non-finite vertex in facet " + std::to_string(triangles.size())
                                       + " at line " + std::to_string(lineNumber) + " in " + filename);
            }
            ++vertexCount;
        } else if (keyword == "endfacet") {
            if (vertexCount != 3) {
                throw InvalidMeshError("Facet ending at line " + std::to_string(lineNumber)
                                       + " has " + std::to_string(vertexCount) + " vertices");
            }
            triangles.push_back(triangle);
            inFacet = false;
        }
    }

    if (inFacet) {
        throw InvalidMeshError("Unterminated facet at end of " + filename);
    }

    return Mesh(std::move(triangles));
}

float STLLoader::readFloat(std::ifstream& file, const std::string& filename) const {
    float value = 0.0f;
    file.read(reinterpret_cast<char*>(&value), sizeof(float));
    if (!file) {
        throw InvalidMeshError("Binary STL is truncated: " + filename);
    }
    return value;
}

void STLLoader::printMeshInfo(const Mesh& mesh) const {
    const BoundingBox& bounds = mesh.getBoundingBox();
    Point3D size = bounds.getSize();

    std::cout << "\n=== Mesh Information ===" << std::endl;
    std::cout << "Triangle count: " << mesh.size() << std::endl;
    std::cout << "Bounding box:" << std::endl;
    std::cout << "  Min: (" << bounds.min.x << ", " << bounds.min.y << ", " << bounds.min.z << ")" << std::endl;
    std::cout << "  Max: (" << bounds.max.x << ", " << bounds.max.y << ", " << bounds.max.z << ")" << std::endl;
    std::cout << "  Size: " << size.x << " x " << size.y << " x " << size.z << std::endl;

    size_t degenerate = mesh.countDegenerate();
    if (degenerate > 0) {
        std::cerr << "Warning: " << degenerate << " degenerate triangle(s) kept as-is" << std::endl;
    }
    std::cout << "========================\n" << std::endl;
}

} // namespace fdm
} // namespace strata
