#pragma once

// Magnitudes below this are treated as zero.
constexpr float VEC_EPSILON = 0.00001f;

struct Vector2 {
    float x=0, y=0;
    Vector2() {}
    Vector2(float xx, float yy):x(xx),y(yy){}

    Vector2 operator+(const Vector2 &o) const { return Vector2(x+o.x, y+o.y); }
    Vector2 operator-(const Vector2 &o) const { return Vector2(x-o.x, y-o.y); }
    Vector2 operator*(float s) const { return Vector2(x*s, y*s); }
    Vector2& operator+=(const Vector2 &o){ x+=o.x; y+=o.y; return *this; }
    Vector2& operator-=(const Vector2 &o){ x-=o.x; y-=o.y; return *this; }
    bool operator==(const Vector2 &o) const { return x==o.x && y==o.y; }
    bool operator!=(const Vector2 &o) const { return !(*this==o); }

    float magnitude() const;
    // Positive degrees turn clockwise on a y-down screen.
    Vector2 rotated(float degrees) const;
    void rotate(float degrees) { *this = rotated(degrees); }
    Vector2 scaledToLength(float length) const;
};
