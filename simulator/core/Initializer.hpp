#pragma once
#include <cstdint>
#include <string>
#include "System.hpp"

enum class InitializerMethod {
    RING,
    STICKY_CLOUD,
    FROM_FILE
};

// Structure to hold initialization result and metadata
struct InitResult {
    ParticlesSystem system;
    std::string metadata;
};

class Initializer {
public:
    // n particles evenly spaced on a circle of `radius` in the z=0 plane.
    // Neighbours (closing the ring) are joined by Elastic(k, d0) and Damping(c);
    // every particle is confined to a sphere of `containerRadius` at the origin.
    static InitResult initRing(int n,
                               double radius,
                               double mass,
                               double k,
                               double d0,
                               double c,
                               double containerRadius);

    // n unit-mass particles at rest, sampled uniformly in [-halfWidth, halfWidth]^2
    // at z=0. Each one feels uniform gravity along y and linear drag and is kept
    // inside a sphere at the origin; every pair is joined by a Sticky force.
    static InitResult initStickyCloud(int n,
                                      double halfWidth,
                                      std::uint32_t seed,
                                      double gravityY,
                                      double drag,
                                      const Sticky& sticky,
                                      double containerRadius);

    // Restores a system previously written by saveSystem().
    static InitResult initFromFile(const std::string& filePath);
};
