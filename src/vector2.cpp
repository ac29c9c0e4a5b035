#include "vector2.hpp"

#include <cmath>

static const float DEG2RAD = 3.14159265358979f / 180.0f;

float Vector2::magnitude() const {
    return std::sqrt(x*x + y*y);
}

Vector2 Vector2::rotated(float degrees) const {
    float r = degrees * DEG2RAD;
    float c = std::cos(r), s = std::sin(r);
    return Vector2(x*c - y*s, x*s + y*c);
}

Vector2 Vector2::scaledToLength(float length) const {
    float m = magnitude();
    if (length <= 0 || m < VEC_EPSILON) return Vector2();
    return *this * (length / m);
}
