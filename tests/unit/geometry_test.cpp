#include <gtest/gtest.h>
#include "Geometry.hpp"
#include "SimulationErrors.hpp"
#include <limits>

TEST(GeometryTest, SphereInsideIsStrict) {
    Sphere s(PositionVector(1.0, 0.0, 0.0), 2.0);

    EXPECT_TRUE(s.isInside(PositionVector(1.0, 0.0, 0.0)));
    EXPECT_TRUE(s.isInside(PositionVector(2.5, 0.0, 0.0)));
    EXPECT_FALSE(s.isInside(PositionVector(3.0, 0.0, 0.0)));   // On the surface
    EXPECT_FALSE(s.isInside(PositionVector(1.0, 5.0, 0.0)));

    EXPECT_DOUBLE_EQ(s.signedDistance(PositionVector(1.0, 0.0, 4.0)), 2.0);
    EXPECT_DOUBLE_EQ(s.signedDistance(PositionVector(1.0, 0.0, 0.0)), -2.0);
}

TEST(GeometryTest, PlaneSignedDistance) {
    Plane plane(PositionVector(0.0, 1.0, 0.0), PositionVector(0.0, 2.0, 0.0));

    EXPECT_DOUBLE_EQ(plane.signedDistance(PositionVector(5.0, 3.0, -1.0)), 2.0);
    EXPECT_DOUBLE_EQ(plane.signedDistance(PositionVector(0.0, 0.5, 0.0)), -0.5);
    EXPECT_TRUE(plane.isOutside(PositionVector(0.0, 1.0, 0.0)));
    EXPECT_FALSE(plane.isOutside(PositionVector(0.0, 0.0, 0.0)));
    EXPECT_EQ(plane.getUnitNormal(), PositionVector(0.0, 1.0, 0.0));
}

TEST(GeometryTest, InvalidParametersRejected) {
    EXPECT_THROW(Sphere(PositionVector(), 0.0), InvalidParameter);
    EXPECT_THROW(Sphere(PositionVector(), -1.0), InvalidParameter);
    EXPECT_THROW(Plane(PositionVector(), PositionVector(0.0, 0.0, 0.0)), InvalidParameter);
    EXPECT_NO_THROW(Plane(PositionVector(), PositionVector(0.0, 0.0, 1e-3)));
    EXPECT_THROW(Plane(PositionVector(), PositionVector(0.0, std::numeric_limits<double>::infinity(), 0.0)),
                 InvalidParameter);
    EXPECT_THROW(Plane(PositionVector(), PositionVector(std::numeric_limits<double>::quiet_NaN(), 1.0, 0.0)),
                 InvalidParameter);
}

TEST(GeometryTest, PlaneAcceptsExtremeNormalMagnitudes) {
    Plane huge(PositionVector(), PositionVector(0.0, 1e200, 0.0));
    EXPECT_EQ(huge.getUnitNormal(), PositionVector(0.0, 1.0, 0.0));
    EXPECT_DOUBLE_EQ(huge.signedDistance(PositionVector(0.0, -2.0, 0.0)), -2.0);

    Plane tiny(PositionVector(), PositionVector(0.0, 1e-170, 0.0));
    EXPECT_EQ(tiny.getUnitNormal(), PositionVector(0.0, 1.0, 0.0));
    EXPECT_TRUE(tiny.isOutside(PositionVector(0.0, 3.0, 0.0)));

    Plane tilted(PositionVector(), PositionVector(3e200, 4e200, 0.0));
    EXPECT_NEAR(tilted.getUnitNormal().x, 0.6, 1e-15);
    EXPECT_NEAR(tilted.getUnitNormal().y, 0.8, 1e-15);
    EXPECT_EQ(tilted.getNormal(), PositionVector(3e200, 4e200, 0.0));
}
