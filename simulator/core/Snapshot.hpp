#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>
#include "Vector3.hpp"

struct ParticleState {
    std::size_t index;
    PositionVector position;
    VelocityVector velocity;
    double mass;
};

// Read-only copy of the system state at one point in simulated time.
struct Snapshot {
    std::uint64_t sequenceIndex = 0;
    double time = 0.0;
    std::vector<ParticleState> particles;
};
