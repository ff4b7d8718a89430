#include "strata-fdm/config.h"
#include "strata-fdm/errors.h"
#include "strata-fdm/slicer.h"
#include "strata-fdm/stl_loader.h"
#include "strata-fdm/utils.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <iostream>
#include <string>
#include <vector>

using namespace strata::fdm;

void printUsage(const char* programName) {
    std::cout << "Usage: " << programName << " [options] <input.stl> [output.gcode]" << std::endl;
    std::cout << "\nOptions:" << std::endl;
    std::cout << "  -l, --layer-height <value>  Layer height (mm, default: 0.2)" << std::endl;
    std::cout << "  -c, --config <file>         Load settings from a config file first" << std::endl;
    std::cout << "  --stepping <mode>           Layer height stepping [indexed, accumulated] (default: indexed)" << std::endl;
    std::cout << "  --dump-layers <file>        Write the sliced segments to a CSV file" << std::endl;
    std::cout << "  --help                      Show this help message" << std::endl;
    std::cout << "\nExample:" << std::endl;
    std::cout << "  " << programName << " -l 0.3 part.stl part.gcode" << std::endl;
}

double parseNumber(const std::string& option, const std::string& value) {
    size_t consumed = 0;
    double result = 0.0;
    try {
        result = std::stod(value, &consumed);
    } catch (const std::logic_error&) {
        throw InvalidParameterError("Invalid value for " + option + ": '" + value + "'");
    }
    if (consumed != value.size()) {
        throw InvalidParameterError("Invalid value for " + option + ": '" + value + "'");
    }
    return result;
}

bool parseArguments(int argc, char* argv[], SlicerConfig& config, std::string& dumpFile, bool& helpRequested) {
    std::vector<std::string> positional;

    // Config file goes first so that command line options override it
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help") {
            helpRequested = true;
            return false;
        }
        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            std::string configFile = argv[i + 1];
            if (!config.loadFromFile(configFile)) {
                throw IoError("Failed to load configuration from: " + configFile);
            }
            std::cout << "Configuration loaded from: " << configFile << std::endl;
        }
    }

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            ++i;
        } else if ((arg == "-l" || arg == "--layer-height") && i + 1 < argc) {
            config.setLayerHeight(parseNumber(arg, argv[++i]));
        } else if (arg == "--stepping" && i + 1 < argc) {
            config.setHeightSteppingFromString(argv[++i]);
        } else if (arg == "--dump-layers" && i + 1 < argc) {
            dumpFile = argv[++i];
        } else if (!arg.empty() && arg[0] != '-') {
            positional.push_back(arg);
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            return false;
        }
    }

    if (positional.size() > 2) {
        std::cerr << "Too many arguments" << std::endl;
        return false;
    }
    if (positional.size() >= 1) {
        config.setInputFile(positional[0]);
    }
    if (positional.size() == 2) {
        config.setOutputFile(positional[1]);
    }

    if (config.getInputFile().empty()) {
        return false;
    }
    if (config.getOutputFile().empty()) {
        config.setOutputFile(Utils::replaceExtension(config.getInputFile(), "gcode"));
    }

    std::string extension = Utils::getFileExtension(config.getInputFile());
    std::transform(extension.begin(), extension.end(), extension.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (extension != "stl") {
        std::cerr << "Warning: Input file does not have an .stl extension: "
                  << config.getInputFile() << std::endl;
    }

    return true;
}

int main(int argc, char* argv[]) {
    std::cout << "==================================" << std::endl;
    std::cout << "strata-fdm STL to G-code slicer" << std::endl;
    std::cout << "==================================" << std::endl;

    auto startTime = std::chrono::steady_clock::now();

    try {
        SlicerConfig config;
        std::string dumpFile;
        bool helpRequested = false;

        if (!parseArguments(argc, argv, config, dumpFile, helpRequested)) {
            printUsage(argv[0]);
            return helpRequested ? 0 : 1;
        }
        config.validate();

        std::cout << "\n1. Loading STL file..." << std::endl;
        STLLoader loader;
        Mesh mesh = loader.loadSTL(config.getInputFile());
        loader.printMeshInfo(mesh);

        std::cout << "2. Slicing..." << std::endl;
        Slicer slicer(config);
        slicer.setVerbose(true);
        SliceResult result = slicer.slice(mesh);

        if (!dumpFile.empty()) {
            if (Utils::saveLayersToCSV(result.layers, dumpFile)) {
                std::cout << "Layer segments written to: " << dumpFile << std::endl;
            } else {
                std::cerr << "Warning: Could not write layer dump to: " << dumpFile << std::endl;
            }
        }

        std::cout << "3. Writing G-code..." << std::endl;
        slicer.writeGCode(result, config.getOutputFile());

        auto endTime = std::chrono::steady_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(endTime - startTime);

        std::cout << "\n=== Slicing Complete ===" << std::endl;
        std::cout << "Part: " << Utils::getBaseName(config.getInputFile()) << std::endl;
        std::cout << "Converted " << config.getInputFile() << " to " << config.getOutputFile() << std::endl;
        std::cout << "Layers: " << result.layers.size() << " at " << config.getLayerHeight() << " mm" << std::endl;
        std::cout << "Toolpath points: " << result.pointCount() << std::endl;
        std::cout << "Total processing time: " << duration.count() << " ms" << std::endl;
        std::cout << "========================" << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
