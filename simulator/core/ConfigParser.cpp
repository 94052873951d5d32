#include "ConfigParser.hpp"
#include <fstream>
#include <stdexcept>

Config parseConfig(const json& j)
{
    Config cfg;

    // Basic parameters
    cfg.initSelected = j.at("init").at("selected").get<std::string>();
    if (cfg.initSelected == "RING") {
        cfg.initMethod = InitializerMethod::RING;
    } else if (cfg.initSelected == "STICKY_CLOUD") {
        cfg.initMethod = InitializerMethod::STICKY_CLOUD;
    } else if (cfg.initSelected == "FROM_FILE") {
        cfg.initMethod = InitializerMethod::FROM_FILE;
    } else {
        throw std::runtime_error("Unknown initialization method: " + cfg.initSelected);
    }
    if (!j.at("init").contains(cfg.initSelected)) {
        throw std::runtime_error("Missing parameters for initialization method: " + cfg.initSelected);
    }
    cfg.initParams = j.at("init").at(cfg.initSelected);
    cfg.dt = j.at("dt").get<double>();
    cfg.steps = j.at("steps").get<long>();
    cfg.snapshotEvery = j.at("snapshotEvery").get<long>();
    cfg.outputDir = j.at("output").at("dir").get<std::string>();
    cfg.outputFile = j.at("output").at("file").get<std::string>();
    cfg.finalStateFile = j.at("output").value("finalState", std::string());

    if (!(cfg.dt > 0.0)) {
        throw std::runtime_error("dt must be positive");
    }
    if (cfg.steps < 0) {
        throw std::runtime_error("steps must not be negative");
    }
    if (cfg.snapshotEvery <= 0) {
        throw std::runtime_error("snapshotEvery must be positive");
    }

    // Parse output mode
    std::string output = j.at("outputMode").get<std::string>();
    if (output == "NONE") {
        cfg.outputMode = OutputMode::NONE;
    } else if (output == "FILE_CSV") {
        cfg.outputMode = OutputMode::FILE_CSV;
    } else if (output == "FILE_JSONL") {
        cfg.outputMode = OutputMode::FILE_JSONL;
    } else {
        throw std::runtime_error("Unknown output mode: " + output);
    }

    return cfg;
}

Config parseConfigFile(const std::string& path)
{
    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }

    json j;
    in >> j;
    return parseConfig(j);
}

InitResult createInitializerFromConfig(const Config& cfg)
{
    switch (cfg.initMethod) {
        case InitializerMethod::RING: {
            int n = cfg.initParams.at("nParticles").get<int>();
            double radius = cfg.initParams.at("radius").get<double>();
            double mass = cfg.initParams.at("mass").get<double>();
            double k = cfg.initParams.at("k").get<double>();
            double d0 = cfg.initParams.at("d0").get<double>();
            double c = cfg.initParams.at("c").get<double>();
            double containerRadius = cfg.initParams.at("containerRadius").get<double>();
            return Initializer::initRing(n, radius, mass, k, d0, c, containerRadius);
        }
        case InitializerMethod::STICKY_CLOUD: {
            int n = cfg.initParams.at("nParticles").get<int>();
            double halfWidth = cfg.initParams.at("halfWidth").get<double>();
            std::uint32_t seed = cfg.initParams.at("seed").get<std::uint32_t>();
            double gravityY = cfg.initParams.at("gravityY").get<double>();
            double drag = cfg.initParams.at("drag").get<double>();
            Sticky sticky{cfg.initParams.at("dWell").get<double>(),
                          cfg.initParams.at("dMax").get<double>(),
                          cfg.initParams.at("fSticky").get<double>(),
                          cfg.initParams.at("fRepulsive").get<double>()};
            double containerRadius = cfg.initParams.at("containerRadius").get<double>();
            return Initializer::initStickyCloud(n, halfWidth, seed, gravityY, drag, sticky, containerRadius);
        }
        case InitializerMethod::FROM_FILE: {
            std::string filePath = cfg.initParams.at("filePath").get<std::string>();
            return Initializer::initFromFile(filePath);
        }
    }

    throw std::runtime_error("Unknown initialization method: " + cfg.initSelected);
}
