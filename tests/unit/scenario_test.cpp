#include <gtest/gtest.h>
#include "Initializer.hpp"
#include "SimulationErrors.hpp"
#include "SnapshotExporter.hpp"

namespace {
    class RecordingExporter : public SnapshotExporter {
    public:
        void write(const Snapshot& snapshot) override { snapshots.push_back(snapshot); }
        std::vector<Snapshot> snapshots;
    };
}

TEST(ScenarioTest, RingLayout) {
    InitResult result = Initializer::initRing(4, 1.0, 1.0, 1.0, 0.5, 0.5, 1.0);
    const ParticlesSystem& sys = result.system;

    ASSERT_EQ(sys.getParticles().size(), 4u);
    EXPECT_EQ(sys.getParticles().get(0).position, PositionVector(1.0, 0.0, 0.0));
    EXPECT_EQ(sys.getParticles().get(1).position, PositionVector(0.0, 1.0, 0.0));
    EXPECT_EQ(sys.getParticles().get(2).position, PositionVector(-1.0, 0.0, 0.0));
    EXPECT_EQ(sys.getParticles().get(3).position, PositionVector(0.0, -1.0, 0.0));

    // Elastic and damping per bond, four bonds closing the ring
    EXPECT_EQ(sys.getInteractions().size(), 8u);
    EXPECT_EQ(sys.getConstraints().size(), 4u);
    EXPECT_NE(result.metadata.find("# Initializer: Ring"), std::string::npos);
}

TEST(ScenarioTest, RingStaysInsideContainer) {
    InitResult result = Initializer::initRing(4, 1.0, 1.0, 1.0, 0.5, 0.5, 1.0);
    ParticlesSystem& sys = result.system;
    RecordingExporter exporter;

    sys.runSimulation(1e-5, 99999, 9999, &exporter, false);

    // Initial state plus one snapshot every 9999 steps
    ASSERT_EQ(exporter.snapshots.size(), 11u);
    const double eps = 1e-6;
    for (const auto& snapshot : exporter.snapshots) {
        for (const auto& p : snapshot.particles) {
            EXPECT_LE(p.position.length(), 1.0 + eps)
                << "particle " << p.index << " at snapshot " << snapshot.sequenceIndex;
        }
    }
    EXPECT_NEAR(sys.getSimulationTime(), 0.99999, 1e-9);
}

TEST(ScenarioTest, StickyCloudWiring) {
    const Sticky sticky{0.2, 0.21, 10.0, 99.0};
    InitResult result = Initializer::initStickyCloud(5, 0.5, 42, -1.0, 1.0, sticky, 1.0);
    const ParticlesSystem& sys = result.system;

    ASSERT_EQ(sys.getParticles().size(), 5u);
    // Gravity and drag per particle plus one sticky bond per pair
    EXPECT_EQ(sys.getInteractions().size(), 5u * 2u + 10u);
    EXPECT_EQ(sys.getConstraints().size(), 5u);

    for (const auto& p : sys.getParticles()) {
        EXPECT_GE(p.position.x, -0.5);
        EXPECT_LT(p.position.x, 0.5);
        EXPECT_GE(p.position.y, -0.5);
        EXPECT_LT(p.position.y, 0.5);
        EXPECT_EQ(p.position.z, 0.0);
        EXPECT_EQ(p.mass, 1.0);
    }
}

TEST(ScenarioTest, StickyCloudIsReproducibleFromSeed) {
    const Sticky sticky{0.2, 0.21, 10.0, 99.0};
    InitResult first = Initializer::initStickyCloud(6, 0.5, 7, -1.0, 1.0, sticky, 1.0);
    InitResult second = Initializer::initStickyCloud(6, 0.5, 7, -1.0, 1.0, sticky, 1.0);

    for (std::size_t i = 0; i < 6; ++i) {
        EXPECT_EQ(first.system.getParticles().get(i).position,
                  second.system.getParticles().get(i).position);
    }
}

TEST(ScenarioTest, InvalidScenarioParameters) {
    EXPECT_THROW(Initializer::initRing(1, 1.0, 1.0, 1.0, 0.5, 0.5, 1.0), InvalidParameter);
    EXPECT_THROW(Initializer::initRing(4, 1.0, 0.0, 1.0, 0.5, 0.5, 1.0), InvalidParameter);
    EXPECT_THROW(Initializer::initRing(4, 1.0, 1.0, 1.0, 0.5, 0.5, -1.0), InvalidParameter);
    EXPECT_THROW(Initializer::initFromFile("does/not/exist.json"), std::runtime_error);
}
