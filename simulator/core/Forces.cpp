#include "Forces.hpp"
#include "Overloaded.hpp"
#include "SimulationErrors.hpp"

ForceVector forceOnA(const ForceKind& kind, const Particle& a, const Particle& b)
{
    const PositionVector r = b.position - a.position;
    const double d = r.length();
    if (d == 0.0) {
        throw DegenerateGeometry("Zero separation between particles: force direction is undefined");
    }
    const PositionVector direction = r.normalize();

    const PositionVector f = std::visit(Overloaded{
        [&](const Elastic& e) {
            return direction * (d - e.d0) * e.k;
        },
        [&](const Damping& damping) {
            const PositionVector relativeVelocity =
                (b.velocity - a.velocity).castUnit<units::Position>();
            return direction * relativeVelocity.dot(direction) * damping.c;
        },
        [&](const Gravitational& g) {
            return direction * g.gravitationalConstant * a.mass * b.mass / r.squareLength();
        },
        [&](const Sticky& s) {
            if (d > s.dMax) {
                return PositionVector::zero();
            }
            if (d > s.dWell) {
                return direction * s.fSticky;
            }
            return -direction * s.fRepulsive;
        },
    }, kind);

    return f.castUnit<units::Force>();
}

ForceVector forceOnB(const ForceKind& kind, const Particle& a, const Particle& b)
{
    return -forceOnA(kind, a, b);
}

ForceVector forceOn(const ExternalForceKind& kind, const Particle& p)
{
    return std::visit(Overloaded{
        [&](const LinearDrag& drag) {
            return (-p.velocity * drag.coefficient).castUnit<units::Force>();
        },
        [&](const UniformGravitational& g) {
            return (g.acceleration * p.mass).castUnit<units::Force>();
        },
    }, kind);
}

Accelerations calculateAccelerations(const Particles& p, const std::vector<Interaction>& interactions)
{
    Accelerations accel(p.size());

    for (std::size_t n = 0; n < interactions.size(); ++n) {
        std::visit(Overloaded{
            [&](const PairwiseForce& pair) {
                const Particle& a = p.get(pair.indexA);
                const Particle& b = p.get(pair.indexB);
                ForceVector f;
                try {
                    f = forceOnA(pair.kind, a, b);
                } catch (const DegenerateGeometry&) {
                    throw DegenerateGeometry(n, pair.indexA, pair.indexB);
                }
                accel.accel[pair.indexA] += f.castUnit<units::Acceleration>() / a.mass;
                accel.accel[pair.indexB] += (-f).castUnit<units::Acceleration>() / b.mass;
            },
            [&](const ExternalForce& ext) {
                const Particle& a = p.get(ext.index);
                accel.accel[ext.index] += forceOn(ext.kind, a).castUnit<units::Acceleration>() / a.mass;
            },
        }, interactions[n]);
    }

    return accel;
}
