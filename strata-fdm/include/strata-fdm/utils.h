#ifndef STRATA_FDM_UTILS_H
#define STRATA_FDM_UTILS_H

#include <string>
#include <vector>
#include "strata-fdm/geometry.h"

namespace strata {
namespace fdm {

class Utils {
public:
    // Save the segments of every layer to a CSV file
    static bool saveLayersToCSV(const std::vector<Layer>& layers, const std::string& filename);

    // Format a number with a specific precision
    static std::string formatNumber(double value, int precision = 4);

    // Get the file extension from a path
    static std::string getFileExtension(const std::string& path);

    // Get the filename without directory and extension
    static std::string getBaseName(const std::string& path);

    // Generate a filename with a different extension
    static std::string replaceExtension(const std::string& path, const std::string& newExtension);
};

} // namespace fdm
} // namespace strata

#endif // STRATA_FDM_UTILS_H
