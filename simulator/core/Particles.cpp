#include "Particles.hpp"
#include "SimulationErrors.hpp"
#include <cmath>
#include <string>

namespace {
    template <class Unit>
    bool isFinite(const Vector3<Unit>& v)
    {
        return std::isfinite(v.x) && std::isfinite(v.y) && std::isfinite(v.z);
    }

    void checkParticle(const Particle& p)
    {
        if (!(p.mass > 0.0) || !std::isfinite(p.mass)) {
            throw InvalidParameter("Particle mass must be finite and positive, got " + std::to_string(p.mass));
        }
        if (!isFinite(p.position)) {
            throw InvalidParameter("Particle position must be finite");
        }
        if (!isFinite(p.velocity)) {
            throw InvalidParameter("Particle velocity must be finite");
        }
    }
}

std::size_t Particles::add(const Particle& p)
{
    checkParticle(p);
    particles.push_back(p);
    return particles.size() - 1;
}

const Particle& Particles::get(std::size_t i) const
{
    checkIndex(i);
    return particles[i];
}

void Particles::set(std::size_t i, const Particle& p)
{
    checkIndex(i);
    checkParticle(p);
    particles[i] = p;
}

void Particles::checkIndex(std::size_t i) const
{
    if (i >= particles.size()) throw IndexOutOfRange(i, particles.size());
}
