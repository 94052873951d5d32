#include "Constraints.hpp"
#include "Overloaded.hpp"

KinematicState resolve(const GeometryKind& geometry, const Particle& p)
{
    return std::visit(Overloaded{
        [&](const Plane& plane) {
            if (plane.isOutside(p.position)) {
                return KinematicState{p.position, p.velocity};
            }
            // Crossed to the forbidden side: mirror the velocity about the plane
            const VelocityVector n = plane.getUnitNormal().castUnit<units::Velocity>();
            return KinematicState{p.position, p.velocity - n * 2.0 * p.velocity.dot(n)};
        },
        [&](const Sphere& sphere) {
            if (sphere.isInside(p.position)) {
                return KinematicState{p.position, p.velocity};
            }
            const VelocityVector radial = (p.position - sphere.getCenter()).castUnit<units::Velocity>();
            return KinematicState{p.position, p.velocity - p.velocity.projectOnto(radial) * 2.0};
        },
    }, geometry);
}
