#include <gtest/gtest.h>
#include <cmath>
#include "puffer/core/constants.hpp"
#include "puffer/math/vector_math.hpp"

TEST(VectorMathTest, VectorConstruction) {
    Vector v1;  // Default constructor
    EXPECT_DOUBLE_EQ(v1.x, 0.0);
    EXPECT_DOUBLE_EQ(v1.y, 0.0);

    Vector v2(3.0, 4.0);
    EXPECT_DOUBLE_EQ(v2.x, 3.0);
    EXPECT_DOUBLE_EQ(v2.y, 4.0);
}

TEST(VectorMathTest, VectorArithmetic) {
    Vector v1(1.0, 2.0);
    Vector v2(3.0, 4.0);

    Vector sum = v1 + v2;
    EXPECT_DOUBLE_EQ(sum.x, 4.0);
    EXPECT_DOUBLE_EQ(sum.y, 6.0);

    Vector diff = v2 - v1;
    EXPECT_DOUBLE_EQ(diff.x, 2.0);
    EXPECT_DOUBLE_EQ(diff.y, 2.0);

    Vector scaled = v1 * 2.0;
    EXPECT_DOUBLE_EQ(scaled.x, 2.0);
    EXPECT_DOUBLE_EQ(scaled.y, 4.0);

    Vector halved = v2 / 2.0;
    EXPECT_DOUBLE_EQ(halved.x, 1.5);
    EXPECT_DOUBLE_EQ(halved.y, 2.0);

    Vector negated = -v1;
    EXPECT_DOUBLE_EQ(negated.x, -1.0);
    EXPECT_DOUBLE_EQ(negated.y, -2.0);

    v1 += v2;
    EXPECT_DOUBLE_EQ(v1.x, 4.0);
    EXPECT_DOUBLE_EQ(v1.y, 6.0);
}

TEST(VectorMathTest, LengthAndNormalization) {
    Vector v(3.0, 4.0);
    EXPECT_DOUBLE_EQ(v.length(), 5.0);

    Vector n = v.normalized();
    EXPECT_NEAR(n.length(), 1.0, EPSILON);
    EXPECT_DOUBLE_EQ(n.x, 0.6);
    EXPECT_DOUBLE_EQ(n.y, 0.8);

    // Zero vector has no direction; falls back to +x
    Vector zero;
    Vector z = zero.normalized();
    EXPECT_DOUBLE_EQ(z.x, 1.0);
    EXPECT_DOUBLE_EQ(z.y, 0.0);
}

TEST(VectorMathTest, FromAngle) {
    // Straight up in screen space (y grows downward)
    Vector up = Vector::fromAngle(-GameConstants::Pi / 2.0, 8.0);
    EXPECT_NEAR(up.x, 0.0, 1e-12);
    EXPECT_NEAR(up.y, -8.0, 1e-12);

    Vector diag = Vector::fromAngle(GameConstants::Pi / 4.0, std::sqrt(2.0));
    EXPECT_NEAR(diag.x, 1.0, 1e-12);
    EXPECT_NEAR(diag.y, 1.0, 1e-12);
}

TEST(VectorMathTest, PositionOperations) {
    Position p(10.0, 20.0);
    Position moved = p + Vector(2.0, -3.0);
    EXPECT_DOUBLE_EQ(moved.x, 12.0);
    EXPECT_DOUBLE_EQ(moved.y, 17.0);

    Position back = moved - Vector(2.0, -3.0);
    EXPECT_DOUBLE_EQ(back.x, 10.0);
    EXPECT_DOUBLE_EQ(back.y, 20.0);

    p += Vector(3.0, 4.0);
    EXPECT_DOUBLE_EQ(p.dist(Position(13.0, 24.0)), 0.0);
    EXPECT_DOUBLE_EQ(p.dist(Position(10.0, 20.0)), 5.0);

    Vector asVector = p;
    EXPECT_DOUBLE_EQ(asVector.x, 13.0);
    EXPECT_DOUBLE_EQ(asVector.y, 24.0);
}

TEST(VectorMathTest, NearlyEqual) {
    EXPECT_TRUE(nearlyEqual(1.0, 1.0 + 1e-12));
    EXPECT_FALSE(nearlyEqual(1.0, 1.001));
}
