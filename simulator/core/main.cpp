#include "System.hpp"
#include <iostream>
#include <filesystem>
#include <chrono>
#include <memory>
#include <string>
#include "ConfigParser.hpp"
#include "OutputUtils.hpp"
#include "SnapshotExporter.hpp"
#include "SystemSerializer.hpp"

int main(int argc, char* argv[])
{
    std::string configPath = (argc > 1) ? argv[1] : "config.json";

    try
    {
        // Load configuration from JSON file
        auto cfg = parseConfigFile(configPath);

        auto init_start = std::chrono::high_resolution_clock::now();

        // Use the helper function to create the system based on config
        InitResult result = createInitializerFromConfig(cfg);
        ParticlesSystem& sys = result.system;

        auto init_end = std::chrono::high_resolution_clock::now();
        std::chrono::duration<double> init_elapsed = init_end - init_start;
        std::cout << "Initialization time: " << init_elapsed.count() << " seconds\n";

        std::string metadata = result.metadata;
        appendMetadata(metadata, "dt", std::to_string(cfg.dt));
        appendMetadata(metadata, "steps", std::to_string(cfg.steps));
        appendMetadata(metadata, "snapshot frequency (steps)", std::to_string(cfg.snapshotEvery));
        appendMetadata(metadata, "interactions", std::to_string(sys.getInteractions().size()));
        appendMetadata(metadata, "constraints", std::to_string(sys.getConstraints().size()));

        std::string outputModeName;
        switch (cfg.outputMode) {
            case OutputMode::NONE:
                outputModeName = "None (Benchmark)";
                break;
            case OutputMode::FILE_CSV:
                outputModeName = "CSV File";
                break;
            case OutputMode::FILE_JSONL:
                outputModeName = "JSON Lines File";
                break;
        }
        appendMetadata(metadata, "output mode", outputModeName);

        if (!cfg.outputDir.empty()) {
            std::filesystem::create_directories(cfg.outputDir);
        }
        std::string outputPath = (std::filesystem::path(cfg.outputDir) / cfg.outputFile).string();

        std::unique_ptr<SnapshotExporter> exporter;
        switch (cfg.outputMode) {
            case OutputMode::NONE:
                break;
            case OutputMode::FILE_CSV:
                exporter = std::make_unique<CsvSnapshotExporter>(outputPath, metadata);
                break;
            case OutputMode::FILE_JSONL:
                exporter = std::make_unique<JsonLinesSnapshotExporter>(outputPath);
                break;
        }

        // Output some relevant information
        std::cout << "Initialization mode: " << cfg.initSelected << "\n";
        std::cout << "Particles: " << sys.getParticles().size()
                  << ", interactions: " << sys.getInteractions().size()
                  << ", constraints: " << sys.getConstraints().size() << "\n";
        std::cout << "Output mode: " << outputModeName << "\n";
        std::cout << "Initial kinetic energy: " << sys.computeKineticEnergy() << "\n";

        auto start = std::chrono::high_resolution_clock::now();

        sys.runSimulation(cfg.dt, cfg.steps, cfg.snapshotEvery, exporter.get());

        auto end = std::chrono::high_resolution_clock::now();
        std::chrono::duration<double> elapsed = end - start;
        std::cout << "Simulation time: " << elapsed.count() << " seconds\n";
        std::cout << "Final simulated time: " << sys.getSimulationTime()
                  << ", kinetic energy: " << sys.computeKineticEnergy() << "\n";

        if (!cfg.finalStateFile.empty()) {
            std::string statePath = (std::filesystem::path(cfg.outputDir) / cfg.finalStateFile).string();
            saveSystem(sys, statePath);
            std::cout << "System state written to " << statePath << "\n";
        }

        return 0;
    }
    catch(const std::exception &ex)
    {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}
