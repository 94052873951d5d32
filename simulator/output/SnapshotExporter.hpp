#pragma once
#include "Snapshot.hpp"
#include <fstream>
#include <string>

// Consumer of snapshots produced between simulation steps.
class SnapshotExporter {
public:
    virtual ~SnapshotExporter() = default;

    virtual void write(const Snapshot& snapshot) = 0;

    // Called once after the last snapshot.
    virtual void finish() {}
};

// CSV file: a metadata block, a header, then one row per particle per snapshot.
class CsvSnapshotExporter : public SnapshotExporter {
public:
    CsvSnapshotExporter(const std::string& filename, const std::string& metadata);

    void write(const Snapshot& snapshot) override;
    void finish() override;

private:
    std::string filename;
    std::ofstream csvFile;
};

// JSON Lines file: one snapshot document per line.
class JsonLinesSnapshotExporter : public SnapshotExporter {
public:
    explicit JsonLinesSnapshotExporter(const std::string& filename);

    void write(const Snapshot& snapshot) override;
    void finish() override;

private:
    std::string filename;
    std::ofstream jsonFile;
};
