#include "System.hpp"
#include "Overloaded.hpp"
#include "SimulationErrors.hpp"
#include "SnapshotExporter.hpp"
#include "OutputUtils.hpp"
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>

ParticlesSystem ParticlesSystem::fromState(const std::vector<Particle>& particles,
                                           const std::vector<Interaction>& interactions,
                                           const std::vector<Constraint>& constraints,
                                           double time, std::uint64_t snapshotsSaved)
{
    if (!(time >= 0.0) || !std::isfinite(time)) {
        throw InvalidParameter("Simulation time must be finite and non-negative, got " +
                               std::to_string(time));
    }

    ParticlesSystem sys;
    for (const auto& p : particles) sys.addParticle(p);
    for (const auto& i : interactions) sys.addInteraction(i);
    for (const auto& c : constraints) sys.addConstraint(c);

    sys.m_simulationTime = time;
    sys.m_snapshotsSaved = snapshotsSaved;
    sys.m_started = time > 0.0;
    return sys;
}

std::size_t ParticlesSystem::addParticle(const Particle& p)
{
    if (m_started) {
        throw std::logic_error("Particles cannot be added once the simulation has started");
    }
    return particles.add(p);
}

void ParticlesSystem::addInteraction(const Interaction& interaction)
{
    std::visit(Overloaded{
        [&](const PairwiseForce& pair) {
            particles.checkIndex(pair.indexA);
            particles.checkIndex(pair.indexB);
            if (pair.indexA == pair.indexB) {
                throw InvalidParameter("Pairwise interaction needs two distinct particles, got " +
                                       std::to_string(pair.indexA) + " twice");
            }
        },
        [&](const ExternalForce& ext) {
            particles.checkIndex(ext.index);
        },
    }, interaction);

    interactions.push_back(interaction);
}

void ParticlesSystem::addConstraint(const Constraint& constraint)
{
    std::visit(Overloaded{
        [&](const ExternalConstraint& ext) {
            particles.checkIndex(ext.index);
        },
    }, constraint);

    constraints.push_back(constraint);
}

void ParticlesSystem::advance(double dt)
{
    if (!(dt > 0.0) || !std::isfinite(dt)) {
        throw InvalidParameter("Time step must be finite and positive, got " + std::to_string(dt));
    }

    // Everything below works on copies; the system is only touched at the end.
    const Accelerations accel = calculateAccelerations(particles, interactions);

    Particles next = particles;
    for (std::size_t i = 0; i < particles.size(); ++i) {
        const Particle& p = particles[i];
        const VelocityVector dv = accel.accel[i].castUnit<units::Velocity>() * dt;
        const PositionVector dp = p.velocity.castUnit<units::Position>() * dt +
                                  dv.castUnit<units::Position>() * dt / 2.0;
        next[i].position = p.position + dp;
        next[i].velocity = p.velocity + dv;
    }

    for (const auto& constraint : constraints) {
        std::visit(Overloaded{
            [&](const ExternalConstraint& ext) {
                const KinematicState state = resolve(ext.geometry, next.get(ext.index));
                next[ext.index].position = state.position;
                next[ext.index].velocity = state.velocity;
            },
        }, constraint);
    }

    particles = std::move(next);
    m_simulationTime += dt;
    m_started = true;
}

Snapshot ParticlesSystem::snapshot()
{
    Snapshot s;
    s.sequenceIndex = m_snapshotsSaved;
    s.time = m_simulationTime;
    s.particles.reserve(particles.size());
    for (std::size_t i = 0; i < particles.size(); ++i) {
        const Particle& p = particles[i];
        s.particles.push_back(ParticleState{i, p.position, p.velocity, p.mass});
    }
    ++m_snapshotsSaved;
    return s;
}

void ParticlesSystem::runSimulation(double dt, long steps, long snapshotEvery,
                                    SnapshotExporter* exporter, bool showProgress)
{
    if (snapshotEvery <= 0) {
        throw InvalidParameter("Snapshot frequency must be positive, got " +
                               std::to_string(snapshotEvery));
    }

    // Store initial state
    if (exporter) exporter->write(snapshot());

    for (long i = 0; i < steps; ++i) {
        advance(dt);

        if (exporter && (i + 1) % snapshotEvery == 0) {
            exporter->write(snapshot());
        }

        if (showProgress) printProgressBar(i + 1, steps);
    }

    if (showProgress) std::cout << std::endl;
    if (exporter) exporter->finish();
}

double ParticlesSystem::computeKineticEnergy() const
{
    double totalKinetic = 0.0;
    for (const auto& p : particles) {
        totalKinetic += 0.5 * p.mass * p.velocity.squareLength();
    }
    return totalKinetic;
}

MomentumVector ParticlesSystem::computeTotalMomentum() const
{
    MomentumVector total;
    for (const auto& p : particles) {
        total += (p.velocity * p.mass).castUnit<units::Momentum>();
    }
    return total;
}
