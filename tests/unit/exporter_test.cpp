#include <gtest/gtest.h>
#include "SnapshotExporter.hpp"
#include "SystemSerializer.hpp"
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

class SnapshotExporterTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = std::filesystem::temp_directory_path() / "particles_exporter_test";
        std::filesystem::create_directories(dir);

        first = Snapshot{0, 0.0, {
            ParticleState{0, PositionVector(1.0, 2.0, 3.0), VelocityVector(0.0, 0.0, 0.0), 1.0},
            ParticleState{1, PositionVector(-1.0, 0.5, 0.0), VelocityVector(0.1, 0.0, 0.0), 2.0}}};
        second = Snapshot{1, 0.25, {
            ParticleState{0, PositionVector(1.0, 2.0, 3.0), VelocityVector(0.0, -0.5, 0.0), 1.0},
            ParticleState{1, PositionVector(-0.975, 0.5, 0.0), VelocityVector(0.1, 0.0, 0.0), 2.0}}};
    }

    void TearDown() override {
        std::filesystem::remove_all(dir);
    }

    static std::vector<std::string> readLines(const std::filesystem::path& path) {
        std::ifstream in(path);
        std::vector<std::string> lines;
        std::string line;
        while (std::getline(in, line)) lines.push_back(line);
        return lines;
    }

    std::filesystem::path dir;
    Snapshot first;
    Snapshot second;
};

TEST_F(SnapshotExporterTest, CsvLayout) {
    const auto path = dir / "snapshots.csv";
    {
        CsvSnapshotExporter exporter(path.string(), "# Initializer: Test\n");
        exporter.write(first);
        exporter.write(second);
        exporter.finish();
    }

    auto lines = readLines(path);
    ASSERT_EQ(lines.size(), 6u);
    EXPECT_EQ(lines[0], "# Initializer: Test");
    EXPECT_EQ(lines[1], "sequence,time,particle,x,y,z,vx,vy,vz,mass");
    EXPECT_EQ(lines[2], "0,0,0,1,2,3,0,0,0,1");
    EXPECT_EQ(lines[3], "0,0,1,-1,0.5,0,0.10000000000000001,0,0,2");
    EXPECT_EQ(lines[4].substr(0, 7), "1,0.25,");
    EXPECT_EQ(lines[5].substr(0, 9), "1,0.25,1,");
}

TEST_F(SnapshotExporterTest, JsonLinesParseBack) {
    const auto path = dir / "snapshots.jsonl";
    {
        JsonLinesSnapshotExporter exporter(path.string());
        exporter.write(first);
        exporter.write(second);
        exporter.finish();
    }

    auto lines = readLines(path);
    ASSERT_EQ(lines.size(), 2u);

    json a = json::parse(lines[0]);
    json b = json::parse(lines[1]);
    EXPECT_EQ(a["sequenceIndex"].get<std::uint64_t>(), 0u);
    EXPECT_EQ(b["sequenceIndex"].get<std::uint64_t>(), 1u);
    EXPECT_EQ(b["time"].get<double>(), 0.25);
    ASSERT_EQ(b["particles"].size(), 2u);
    EXPECT_EQ(b["particles"][1]["position"]["x"].get<double>(), -0.975);
    EXPECT_EQ(b["particles"][0]["velocity"]["y"].get<double>(), -0.5);
    EXPECT_EQ(b["particles"][1]["mass"].get<double>(), 2.0);
}

TEST_F(SnapshotExporterTest, UnwritablePathThrows) {
    const auto path = dir / "missing" / "snapshots.csv";
    EXPECT_THROW(CsvSnapshotExporter(path.string(), ""), std::runtime_error);
    EXPECT_THROW(JsonLinesSnapshotExporter(path.string()), std::runtime_error);
}
