#pragma once

#include "Particles.hpp"
#include "Forces.hpp"
#include "Constraints.hpp"
#include "Snapshot.hpp"
#include <cstdint>
#include <vector>

class SnapshotExporter;

// A set of particles together with the interactions acting on them and the
// constraints confining them, advanced in discrete time steps.
class ParticlesSystem
{
public:
    ParticlesSystem() = default;

    // Rebuilds a system from previously exported state. Every particle,
    // interaction and constraint goes through the regular validation.
    static ParticlesSystem fromState(const std::vector<Particle>& particles,
                                     const std::vector<Interaction>& interactions,
                                     const std::vector<Constraint>& constraints,
                                     double time, std::uint64_t snapshotsSaved);

    // Prevent accidental copies of the whole simulation state
    ParticlesSystem(const ParticlesSystem&) = delete;
    ParticlesSystem& operator=(const ParticlesSystem&) = delete;
    ParticlesSystem(ParticlesSystem&&) noexcept = default;
    ParticlesSystem& operator=(ParticlesSystem&&) noexcept = default;

    // Setup. Particles can only be added before the first advance().
    std::size_t addParticle(const Particle& p);
    void addInteraction(const Interaction& interaction);
    void addConstraint(const Constraint& constraint);

    // One explicit step: accelerations from all interactions, kinematic update,
    // constraint resolution, clock advance. Either the whole step is applied or,
    // if an exception escapes, nothing is.
    void advance(double dt);

    // Exports the current state; the sequence counter moves on for the next call.
    Snapshot snapshot();

    // Exports the initial state, then advances `steps` times exporting every
    // `snapshotEvery` steps. A null exporter runs without output.
    void runSimulation(double dt, long steps, long snapshotEvery,
                       SnapshotExporter* exporter, bool showProgress = true);

    double computeKineticEnergy() const;
    MomentumVector computeTotalMomentum() const;

    const Particles& getParticles() const { return particles; }
    const std::vector<Interaction>& getInteractions() const { return interactions; }
    const std::vector<Constraint>& getConstraints() const { return constraints; }
    double getSimulationTime() const { return m_simulationTime; }
    std::uint64_t getSnapshotsSaved() const { return m_snapshotsSaved; }
    bool hasStarted() const { return m_started; }

private:
    Particles particles;
    std::vector<Interaction> interactions;
    std::vector<Constraint> constraints;

    double m_simulationTime = 0.0;
    std::uint64_t m_snapshotsSaved = 0;
    bool m_started = false;
};
