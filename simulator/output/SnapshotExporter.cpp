#include "SnapshotExporter.hpp"
#include "SystemSerializer.hpp"
#include <iomanip>
#include <iostream>
#include <limits>
#include <stdexcept>

CsvSnapshotExporter::CsvSnapshotExporter(const std::string& filename, const std::string& metadata)
    : filename(filename), csvFile(filename)
{
    if (!csvFile) {
        throw std::runtime_error("Could not open CSV file " + filename + " for writing");
    }

    csvFile << metadata;
    csvFile << "sequence,time,particle,x,y,z,vx,vy,vz,mass\n";
    csvFile << std::setprecision(std::numeric_limits<double>::max_digits10);
}

void CsvSnapshotExporter::write(const Snapshot& snapshot)
{
    for (const auto& p : snapshot.particles) {
        csvFile << snapshot.sequenceIndex << ","
                << snapshot.time << ","
                << p.index << ","
                << p.position.x << "," << p.position.y << "," << p.position.z << ","
                << p.velocity.x << "," << p.velocity.y << "," << p.velocity.z << ","
                << p.mass << "\n";
    }
    if (!csvFile) {
        throw std::runtime_error("Failed writing snapshot " + std::to_string(snapshot.sequenceIndex) +
                                 " to " + filename);
    }
}

void CsvSnapshotExporter::finish()
{
    csvFile.close();
    std::cout << "CSV output written to " << filename << "\n";
}

JsonLinesSnapshotExporter::JsonLinesSnapshotExporter(const std::string& filename)
    : filename(filename), jsonFile(filename)
{
    if (!jsonFile) {
        throw std::runtime_error("Could not open JSON Lines file " + filename + " for writing");
    }
}

void JsonLinesSnapshotExporter::write(const Snapshot& snapshot)
{
    jsonFile << snapshotToJson(snapshot).dump() << "\n";
    if (!jsonFile) {
        throw std::runtime_error("Failed writing snapshot " + std::to_string(snapshot.sequenceIndex) +
                                 " to " + filename);
    }
}

void JsonLinesSnapshotExporter::finish()
{
    jsonFile.close();
    std::cout << "JSON Lines output written to " << filename << "\n";
}
