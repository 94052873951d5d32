#pragma once
#include <cstddef>
#include <vector>
#include "Vector3.hpp"

// A point mass in classical mechanics.
struct Particle {
    PositionVector position;
    VelocityVector velocity;
    double mass = 1.0;
};

// Ordered, index-addressable particle store. Indices are stable: particles are
// only ever appended.
class Particles {
public:
    Particles() = default;

    // Appends a particle and returns its index. Throws InvalidParameter unless
    // mass > 0 and every component is finite.
    std::size_t add(const Particle& p);

    // Bounds-checked access, throws IndexOutOfRange.
    const Particle& get(std::size_t i) const;
    void set(std::size_t i, const Particle& p);

    void checkIndex(std::size_t i) const;

    std::size_t size() const { return particles.size(); }
    bool empty() const { return particles.empty(); }

    std::vector<Particle>::const_iterator begin() const { return particles.begin(); }
    std::vector<Particle>::const_iterator end() const { return particles.end(); }

    // Unchecked element access for the integrator hot loop
    const Particle& operator[](std::size_t i) const { return particles[i]; }
    Particle& operator[](std::size_t i) { return particles[i]; }

private:
    std::vector<Particle> particles;
};
