#ifndef STRATA_FDM_CONFIG_H
#define STRATA_FDM_CONFIG_H

#include <string>

namespace strata {
namespace fdm {

/**
 * How successive plane heights are generated
 */
enum class HeightStepping {
    INDEXED,        // z = z_min + i * h
    ACCUMULATED     // z += h, drifts over many layers
};

/**
 * Slicing configuration passed explicitly through the pipeline
 */
class SlicerConfig {
public:
    SlicerConfig();
    ~SlicerConfig();

    /**
     * Initialize with default values
     */
    void setDefaults();

    /**
     * Load configuration from file
     * @param filename Path to the config file
     * @return True if loaded successfully, false if the file cannot be opened
     * @throws InvalidParameterError when a value cannot be parsed
     */
    bool loadFromFile(const std::string& filename);

    /**
     * Save configuration to file
     * @param filename Path where to save the config
     * @return True if saved successfully
     */
    bool saveToFile(const std::string& filename) const;

    /**
     * Check if this is the first run (no config file exists)
     * @param filename Path to the config file
     * @return True if the config file doesn't exist
     */
    static bool isFirstRun(const std::string& filename);

    /**
     * Reject values the pipeline cannot run with
     * @throws InvalidParameterError when layer height is not positive
     */
    void validate() const;

    const std::string& getInputFile() const { return m_inputFile; }
    void setInputFile(const std::string& path) { m_inputFile = path; }

    const std::string& getOutputFile() const { return m_outputFile; }
    void setOutputFile(const std::string& path) { m_outputFile = path; }

    double getLayerHeight() const { return m_layerHeight; }
    void setLayerHeight(double height) { m_layerHeight = height; }

    HeightStepping getHeightStepping() const { return m_heightStepping; }
    void setHeightStepping(HeightStepping stepping) { m_heightStepping = stepping; }
    std::string getHeightSteppingString() const;
    void setHeightSteppingFromString(const std::string& stepping);

    static std::string heightSteppingToString(HeightStepping stepping);
    static HeightStepping heightSteppingFromString(const std::string& stepping);

private:
    std::string m_inputFile;          // Mesh to slice
    std::string m_outputFile;         // G-code destination
    double m_layerHeight;             // Distance between slicing planes
    HeightStepping m_heightStepping;  // Plane height generation

    bool parseLine(const std::string& line, std::string& key, std::string& value) const;
    static std::string trim(const std::string& str);
    static double parseDouble(const std::string& key, const std::string& value);
};

} // namespace fdm
} // namespace strata

#endif // STRATA_FDM_CONFIG_H
