#include "Geometry.hpp"
#include "SimulationErrors.hpp"
#include <algorithm>
#include <cmath>

Plane::Plane(const PositionVector& position, const PositionVector& normal)
    : position(position), normal(normal)
{
    if (!std::isfinite(normal.x) || !std::isfinite(normal.y) || !std::isfinite(normal.z)) {
        throw InvalidParameter("Plane normal must be finite");
    }
    // Scale by the largest component first so length() neither overflows nor underflows
    const double largest = std::max({std::abs(normal.x), std::abs(normal.y), std::abs(normal.z)});
    if (largest == 0.0) {
        throw InvalidParameter("Plane normal must have a non-zero length");
    }
    unitNormal = (normal / largest).normalize();
}

double Plane::signedDistance(const PositionVector& point) const
{
    return (point - position).dot(unitNormal);
}

Sphere::Sphere(const PositionVector& center, double radius)
    : center(center), radius(radius)
{
    if (!(radius > 0.0)) {
        throw InvalidParameter("Sphere radius must be positive, got " + std::to_string(radius));
    }
}

bool Sphere::isInside(const PositionVector& point) const
{
    return (center - point).length() < radius;
}

double Sphere::signedDistance(const PositionVector& point) const
{
    return (point - center).length() - radius;
}
