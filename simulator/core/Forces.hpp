#pragma once
#include "Particles.hpp"
#include <cstddef>
#include <variant>
#include <vector>

// Pairwise force kinds. With r = b.position - a.position and d = |r| each gives
// the force acting on particle a; the force on b is its negation.

// Ideal spring: normalize(r) * (d - d0) * k.
struct Elastic {
    double k;
    double d0;
};

// Linear damping of the relative velocity along the separation.
struct Damping {
    double c;
};

// Newtonian attraction: normalize(r) * G * ma * mb / d^2.
struct Gravitational {
    double gravitationalConstant = 1.0;
};

// Attractive plateau between dWell and dMax, repulsive plateau below dWell,
// nothing beyond dMax. Discontinuous at both zone boundaries.
struct Sticky {
    double dWell;
    double dMax;
    double fSticky;
    double fRepulsive;
};

using ForceKind = std::variant<Elastic, Damping, Gravitational, Sticky>;

// Single-particle forces from an external agent.
struct LinearDrag {
    double coefficient;
};

struct UniformGravitational {
    AccelerationVector acceleration;
};

using ExternalForceKind = std::variant<LinearDrag, UniformGravitational>;

// Registered interactions. Immutable once added to a ParticlesSystem.
struct PairwiseForce {
    std::size_t indexA;
    std::size_t indexB;
    ForceKind kind;
};

struct ExternalForce {
    std::size_t index;
    ExternalForceKind kind;
};

using Interaction = std::variant<PairwiseForce, ExternalForce>;

// One accumulated acceleration per particle, zero-initialized.
struct Accelerations {
    std::vector<AccelerationVector> accel;

    explicit Accelerations(std::size_t nParticles) : accel(nParticles) {}

    std::size_t size() const { return accel.size(); }
};

// Force on a due to b. Throws DegenerateGeometry when a and b coincide.
ForceVector forceOnA(const ForceKind& kind, const Particle& a, const Particle& b);

// Force on b due to a, always -forceOnA(kind, a, b).
ForceVector forceOnB(const ForceKind& kind, const Particle& a, const Particle& b);

ForceVector forceOn(const ExternalForceKind& kind, const Particle& p);

// Sums force / mass over all interactions in registration order. Throws
// IndexOutOfRange for a stale index and DegenerateGeometry (carrying the
// interaction position) for coincident particles. Does not modify `p`.
Accelerations calculateAccelerations(const Particles& p, const std::vector<Interaction>& interactions);
