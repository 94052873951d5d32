#pragma once
#include "Vector3.hpp"

// Infinite plane. The normal points to the permitted half-space.
class Plane {
public:
    // Throws InvalidParameter for a zero or non-finite normal. Any other
    // magnitude is accepted, however large or small.
    Plane(const PositionVector& position, const PositionVector& normal);

    const PositionVector& getPosition() const { return position; }
    const PositionVector& getNormal() const { return normal; }
    const PositionVector& getUnitNormal() const { return unitNormal; }

    // Distance from the plane, negative on the forbidden side.
    double signedDistance(const PositionVector& point) const;
    bool isOutside(const PositionVector& point) const { return signedDistance(point) >= 0.0; }

private:
    PositionVector position;
    PositionVector normal;
    PositionVector unitNormal;
};

class Sphere {
public:
    // Throws InvalidParameter unless radius > 0.
    Sphere(const PositionVector& center, double radius);

    const PositionVector& getCenter() const { return center; }
    double getRadius() const { return radius; }

    // Strictly inside: points on the surface are not inside.
    bool isInside(const PositionVector& point) const;

    // Distance from the surface, negative inside.
    double signedDistance(const PositionVector& point) const;

private:
    PositionVector center;
    double radius;
};
