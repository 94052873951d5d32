#pragma once
#include "Geometry.hpp"
#include "Particles.hpp"
#include <cstddef>
#include <variant>

using GeometryKind = std::variant<Plane, Sphere>;

// Keeps one particle on the permitted side of an external boundary.
struct ExternalConstraint {
    std::size_t index;
    GeometryKind geometry;
};

using Constraint = std::variant<ExternalConstraint>;

struct KinematicState {
    PositionVector position;
    VelocityVector velocity;
};

// Corrected (position, velocity) for a particle against a boundary. Only the
// velocity is ever reflected; a particle past the boundary stays where it is.
KinematicState resolve(const GeometryKind& geometry, const Particle& p);
