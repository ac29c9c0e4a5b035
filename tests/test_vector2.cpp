#include <gtest/gtest.h>
#include "vector2.hpp"

// ============================================================================
// Vector2 Tests
// ============================================================================

TEST(Vector2Test, Magnitude) {
    EXPECT_FLOAT_EQ(Vector2(3.0f, 4.0f).magnitude(), 5.0f);
    EXPECT_FLOAT_EQ(Vector2().magnitude(), 0.0f);
}

TEST(Vector2Test, RotateQuarterTurnIsClockwiseOnScreen) {
    Vector2 v = Vector2(1.0f, 0.0f).rotated(90.0f);
    EXPECT_NEAR(v.x, 0.0f, 1e-6f);
    EXPECT_NEAR(v.y, 1.0f, 1e-6f);

    Vector2 w(2.0f, 0.0f);
    w.rotate(-90.0f);
    EXPECT_NEAR(w.x, 0.0f, 1e-6f);
    EXPECT_NEAR(w.y, -2.0f, 1e-6f);
}

TEST(Vector2Test, RotatePreservesLength) {
    Vector2 v(3.0f, -7.0f);
    EXPECT_NEAR(v.rotated(33.0f).magnitude(), v.magnitude(), 1e-5f);
}

TEST(Vector2Test, ScaleToLength) {
    Vector2 v = Vector2(3.0f, 4.0f).scaledToLength(10.0f);
    EXPECT_NEAR(v.x, 6.0f, 1e-5f);
    EXPECT_NEAR(v.y, 8.0f, 1e-5f);
}

TEST(Vector2Test, ScaleToNonPositiveLengthIsZero) {
    EXPECT_EQ(Vector2(3.0f, 4.0f).scaledToLength(0.0f), Vector2());
    EXPECT_EQ(Vector2(3.0f, 4.0f).scaledToLength(-1.0f), Vector2());
}

TEST(Vector2Test, ScaleNearZeroVectorIsZero) {
    EXPECT_EQ(Vector2(0.000001f, 0.0f).scaledToLength(5.0f), Vector2());
}

TEST(Vector2Test, Arithmetic) {
    Vector2 a(1.0f, 2.0f), b(3.0f, 5.0f);
    EXPECT_EQ(a + b, Vector2(4.0f, 7.0f));
    EXPECT_EQ(b - a, Vector2(2.0f, 3.0f));
    EXPECT_EQ(a * 2.0f, Vector2(2.0f, 4.0f));
    a += b;
    EXPECT_EQ(a, Vector2(4.0f, 7.0f));
}
