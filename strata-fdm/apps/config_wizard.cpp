#include "strata-fdm/config.h"
#include "strata-fdm/errors.h"
#include <iostream>
#include <limits>
#include <string>

using namespace strata::fdm;

// Helper function to get numeric input with validation
template<typename T>
T getNumericInput(const std::string& prompt, T minValue, T maxValue) {
    T value;
    while (true) {
        std::cout << prompt;

        if (std::cin >> value) {
            if (value >= minValue && value <= maxValue) {
                break;
            } else {
                std::cout << "Error: Value must be between " << minValue << " and " << maxValue << std::endl;
            }
        } else {
            if (std::cin.eof()) {
                throw IoError("Input closed before configuration was complete");
            }
            std::cin.clear();
            std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
            std::cout << "Error: Invalid input. Please enter a number." << std::endl;
        }
    }

    std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
    return value;
}

// Helper function to get yes/no input
bool getYesNoInput(const std::string& prompt, bool defaultValue) {
    std::string input;
    std::string defaultStr = defaultValue ? "Y/n" : "y/N";

    std::cout << prompt << " [" << defaultStr << "]: ";
    std::getline(std::cin, input);

    if (input.empty()) {
        return defaultValue;
    }

    return (input[0] == 'Y' || input[0] == 'y');
}

// Helper function to get string input with default value
std::string getStringInput(const std::string& prompt, const std::string& defaultValue) {
    std::string input;

    std::cout << prompt << " [" << defaultValue << "]: ";
    std::getline(std::cin, input);

    if (input.empty()) {
        return defaultValue;
    }

    return input;
}

void runConfigWizard(SlicerConfig& config) {
    std::cout << "\n====================================" << std::endl;
    std::cout << "strata-fdm Configuration Wizard" << std::endl;
    std::cout << "====================================" << std::endl;
    std::cout << "Press Enter to accept default values shown in brackets." << std::endl;
    std::cout << "------------------------------------" << std::endl;

    std::cout << "\n--- Files ---" << std::endl;
    config.setInputFile(getStringInput("Input STL file", config.getInputFile()));
    config.setOutputFile(getStringInput("Output G-code file", config.getOutputFile()));

    std::cout << "\n--- Slicing ---" << std::endl;
    std::cout << "Current layer height: " << config.getLayerHeight() << " mm" << std::endl;
    config.setLayerHeight(getNumericInput<double>("Enter layer height (mm): ", 0.01, 10.0));

    while (true) {
        std::string stepping = getStringInput("Height stepping (indexed/accumulated)",
                                              config.getHeightSteppingString());
        try {
            config.setHeightSteppingFromString(stepping);
            break;
        } catch (const InvalidParameterError& e) {
            std::cout << "Error: " << e.what() << std::endl;
        }
    }

    std::cout << "\nConfiguration complete!" << std::endl;
}

int main(int argc, char* argv[]) {
    std::string configFile = "strata-fdm.cfg";

    // Check for custom config file path
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            configFile = argv[++i];
        }
    }

    SlicerConfig config;

    try {
        if (SlicerConfig::isFirstRun(configFile)) {
            std::cout << "No configuration file found. Starting setup wizard..." << std::endl;
            runConfigWizard(config);

            if (config.saveToFile(configFile)) {
                std::cout << "Configuration saved to: " << configFile << std::endl;
            } else {
                std::cerr << "Error: Failed to save configuration." << std::endl;
                return 1;
            }
        } else {
            if (!config.loadFromFile(configFile)) {
                std::cerr << "Error: Failed to load configuration from: " << configFile << std::endl;
                return 1;
            }

            std::cout << "Configuration loaded from: " << configFile << std::endl;

            if (getYesNoInput("Would you like to modify the configuration?", false)) {
                runConfigWizard(config);

                if (config.saveToFile(configFile)) {
                    std::cout << "Configuration updated and saved to: " << configFile << std::endl;
                } else {
                    std::cerr << "Error: Failed to save configuration." << std::endl;
                    return 1;
                }
            }
        }
    } catch (const SlicerError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "\n====================================" << std::endl;
    std::cout << "Current Configuration" << std::endl;
    std::cout << "====================================" << std::endl;
    std::cout << "Files:" << std::endl;
    std::cout << "  Input: " << (config.getInputFile().empty() ? "(none)" : config.getInputFile()) << std::endl;
    std::cout << "  Output: " << (config.getOutputFile().empty() ? "(none)" : config.getOutputFile()) << std::endl;
    std::cout << "Slicing:" << std::endl;
    std::cout << "  Layer Height: " << config.getLayerHeight() << " mm" << std::endl;
    std::cout << "  Height Stepping: " << config.getHeightSteppingString() << std::endl;

    return 0;
}
