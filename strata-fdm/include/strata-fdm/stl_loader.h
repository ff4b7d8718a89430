#ifndef STRATA_FDM_STL_LOADER_H
#define STRATA_FDM_STL_LOADER_H

#include "strata-fdm/mesh.h"
#include <cstdint>
#include <fstream>
#include <string>
#include <vector>

namespace strata {
namespace fdm {

/**
 * Reads binary and ASCII STL files into a Mesh
 */
class STLLoader {
public:
    STLLoader();
    ~STLLoader();

    /**
     * Load STL file (auto-detects binary vs ASCII).
     * Degenerate facets are kept as they are.
     * @param filename Path to the STL file
     * @return The loaded mesh
     * @throws IoError when the file cannot be opened
     * @throws InvalidMeshError when the file content is malformed or truncated
     */
    Mesh loadSTL(const std::string& filename) const;

    // Print triangle count and bounds
    void printMeshInfo(const Mesh& mesh) const;

    // Check if file is binary STL
    bool isBinarySTL(const std::string& filename) const;

private:
    Mesh loadBinarySTL(const std::string& filename) const;
    Mesh loadAsciiSTL(const std::string& filename) const;

    // Read a float from binary file (little endian)
    float readFloat(std::ifstream& file, const std::string& filename) const;
};

} // namespace fdm
} // namespace strata

#endif // STRATA_FDM_STL_LOADER_H
