#pragma once
#include <cmath>
#include <ostream>

// Tags for the physical quantity a vector carries. They are never instantiated.
namespace units {
    struct Position;
    struct Velocity;
    struct Acceleration;
    struct Force;
    struct Momentum;
}

// Three-component vector tagged with a physical unit. Vectors of different units
// do not mix unless converted explicitly with castUnit().
template <class Unit>
struct Vector3 {
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;

    Vector3() = default;
    Vector3(double xVal, double yVal, double zVal) : x(xVal), y(yVal), z(zVal) {}

    static Vector3 zero() { return Vector3(); }

    Vector3& operator+=(const Vector3& v) {
        x += v.x;
        y += v.y;
        z += v.z;
        return *this;
    }
    Vector3& operator-=(const Vector3& v) {
        x -= v.x;
        y -= v.y;
        z -= v.z;
        return *this;
    }
    Vector3& operator*=(double a) {
        x *= a;
        y *= a;
        z *= a;
        return *this;
    }
    Vector3& operator/=(double a) {
        x /= a;
        y /= a;
        z /= a;
        return *this;
    }

    Vector3 operator+(const Vector3& v) const { Vector3 res(*this); res += v; return res; }
    Vector3 operator-(const Vector3& v) const { Vector3 res(*this); res -= v; return res; }
    Vector3 operator*(double a) const { Vector3 res(*this); res *= a; return res; }
    Vector3 operator/(double a) const { Vector3 res(*this); res /= a; return res; }
    Vector3 operator-() const { return Vector3(-x, -y, -z); }

    bool operator==(const Vector3& v) const { return x == v.x && y == v.y && z == v.z; }
    bool operator!=(const Vector3& v) const { return !(*this == v); }

    double dot(const Vector3& v) const { return x * v.x + y * v.y + z * v.z; }
    double squareLength() const { return dot(*this); }
    double length() const { return std::sqrt(squareLength()); }

    // Undefined for the zero vector; callers check length() first.
    Vector3 normalize() const { return *this / length(); }

    // Component of this vector along `onto` (which must be non-zero).
    Vector3 projectOnto(const Vector3& onto) const {
        return onto * (dot(onto) / onto.squareLength());
    }

    // Reinterpret the components as a different physical quantity.
    template <class Other>
    Vector3<Other> castUnit() const { return Vector3<Other>(x, y, z); }
};

template <class Unit>
Vector3<Unit> operator*(double a, const Vector3<Unit>& v) { return v * a; }

template <class Unit>
std::ostream& operator<<(std::ostream& out, const Vector3<Unit>& v) {
    return out << "(" << v.x << ", " << v.y << ", " << v.z << ")";
}

using PositionVector = Vector3<units::Position>;
using VelocityVector = Vector3<units::Velocity>;
using AccelerationVector = Vector3<units::Acceleration>;
using ForceVector = Vector3<units::Force>;
using MomentumVector = Vector3<units::Momentum>;
