#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "Initializer.hpp"
#include "OutputModes.hpp"

using json = nlohmann::ordered_json;

// Structure to hold all configuration parameters
struct Config {
    std::string initSelected;
    InitializerMethod initMethod;
    json initParams;
    double dt;
    long steps;
    long snapshotEvery;
    std::string outputDir;
    std::string outputFile;
    std::string finalStateFile;
    OutputMode outputMode;
};

// Parse a JSON configuration document
Config parseConfig(const json& j);

// Parse the JSON configuration file at `path`
Config parseConfigFile(const std::string& path);

// Create the initial system selected by the config
InitResult createInitializerFromConfig(const Config& cfg);
