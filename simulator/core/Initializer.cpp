#include "Initializer.hpp"
#include "SimulationErrors.hpp"
#include "SystemSerializer.hpp"
#include <cmath>
#include <random>
#include <sstream>

using namespace std;

namespace {
    const double PI = 3.14159265358979323846;

    void checkCount(int n, int minimum, const string& what)
    {
        if (n < minimum) {
            throw InvalidParameter(what + " needs at least " + to_string(minimum) +
                                   " particles, got " + to_string(n));
        }
    }
}

//------------------------------------------------------------------------------
// initRing:
// Particle i sits at angle 2*pi*i/n, so n=4 with radius 1 gives
// (1,0,0), (0,1,0), (-1,0,0), (0,-1,0).
InitResult Initializer::initRing(int n,
                                 double radius,
                                 double mass,
                                 double k,
                                 double d0,
                                 double c,
                                 double containerRadius)
{
    checkCount(n, 2, "Ring");

    ParticlesSystem sys;
    const Sphere container(PositionVector(0.0, 0.0, 0.0), containerRadius);

    for (int i = 0; i < n; ++i) {
        double angle = 2.0 * PI * i / n;
        // Snap to exact axis values so quarter turns do not carry cos/sin rounding
        double px = std::round(std::cos(angle) * 1e15) / 1e15 * radius;
        double py = std::round(std::sin(angle) * 1e15) / 1e15 * radius;
        sys.addParticle(Particle{PositionVector(px, py, 0.0), VelocityVector(0.0, 0.0, 0.0), mass});
    }

    for (int i = 0; i < n; ++i) {
        size_t a = static_cast<size_t>(i);
        size_t b = static_cast<size_t>((i + 1) % n);
        // A ring of two is a single bond
        if (n == 2 && i == 1) break;
        sys.addInteraction(PairwiseForce{a, b, Elastic{k, d0}});
        sys.addInteraction(PairwiseForce{a, b, Damping{c}});
    }

    for (int i = 0; i < n; ++i) {
        sys.addConstraint(ExternalConstraint{static_cast<size_t>(i), container});
    }

    ostringstream metaStream;
    metaStream << "# Initializer: Ring\n"
               << "# Total particle count: " << n << "\n"
               << "# radius: " << radius << "\n"
               << "# mass: " << mass << "\n"
               << "# elastic k: " << k << "\n"
               << "# elastic d0: " << d0 << "\n"
               << "# damping c: " << c << "\n"
               << "# container radius: " << containerRadius << "\n";

    return { std::move(sys), metaStream.str() };
}

//------------------------------------------------------------------------------
// initStickyCloud:
// Interaction order per particle: gravity, drag, then the sticky bonds to every
// later particle.
InitResult Initializer::initStickyCloud(int n,
                                        double halfWidth,
                                        std::uint32_t seed,
                                        double gravityY,
                                        double drag,
                                        const Sticky& sticky,
                                        double containerRadius)
{
    checkCount(n, 1, "Sticky cloud");

    ParticlesSystem sys;
    const Sphere container(PositionVector(0.0, 0.0, 0.0), containerRadius);

    mt19937 gen(seed);
    uniform_real_distribution<double> step(-halfWidth, halfWidth);

    for (int i = 0; i < n; ++i) {
        double px = step(gen);
        double py = step(gen);
        sys.addParticle(Particle{PositionVector(px, py, 0.0), VelocityVector(0.0, 0.0, 0.0), 1.0});
    }

    for (size_t i = 0; i < static_cast<size_t>(n); ++i) {
        sys.addInteraction(ExternalForce{i, UniformGravitational{AccelerationVector(0.0, gravityY, 0.0)}});
        sys.addInteraction(ExternalForce{i, LinearDrag{drag}});
        sys.addConstraint(ExternalConstraint{i, container});
        for (size_t j = i + 1; j < static_cast<size_t>(n); ++j) {
            sys.addInteraction(PairwiseForce{i, j, sticky});
        }
    }

    ostringstream metaStream;
    metaStream << "# Initializer: Sticky cloud\n"
               << "# Total particle count: " << n << "\n"
               << "# half width: " << halfWidth << "\n"
               << "# seed: " << seed << "\n"
               << "# gravity y: " << gravityY << "\n"
               << "# linear drag: " << drag << "\n"
               << "# sticky (dWell, dMax, fSticky, fRepulsive): " << sticky.dWell << ", "
               << sticky.dMax << ", " << sticky.fSticky << ", " << sticky.fRepulsive << "\n"
               << "# container radius: " << containerRadius << "\n";

    return { std::move(sys), metaStream.str() };
}

InitResult Initializer::initFromFile(const string& filePath)
{
    ParticlesSystem sys = loadSystem(filePath);

    ostringstream metaStream;
    metaStream << "# Initializer: From file\n"
               << "# filePath: " << filePath << "\n"
               << "# Total particle count: " << sys.getParticles().size() << "\n"
               << "# restored time: " << sys.getSimulationTime() << "\n"
               << "# restored snapshots: " << sys.getSnapshotsSaved() << "\n";

    return { std::move(sys), metaStream.str() };
}
