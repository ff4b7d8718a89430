#ifndef STRATA_FDM_ERRORS_H
#define STRATA_FDM_ERRORS_H

#include <stdexcept>
#include <string>

namespace strata {
namespace fdm {

/**
 * Base class for every error raised by the slicing pipeline
 */
class SlicerError : public std::runtime_error {
public:
    explicit SlicerError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * Mesh has no triangles, no height, or could not be decoded
 */
class InvalidMeshError : public SlicerError {
public:
    explicit InvalidMeshError(const std::string& message) : SlicerError(message) {}
};

/**
 * A slicing parameter is out of range or cannot be parsed
 */
class InvalidParameterError : public SlicerError {
public:
    explicit InvalidParameterError(const std::string& message) : SlicerError(message) {}
};

/**
 * Input could not be read or output sink could not be written
 */
class IoError : public SlicerError {
public:
    explicit IoError(const std::string& message) : SlicerError(message) {}
};

} // namespace fdm
} // namespace strata

#endif // STRATA_FDM_ERRORS_H
