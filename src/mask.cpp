#include "mask.hpp"

#include "errors.hpp"
#include "surface.hpp"

#include <algorithm>
#include <string>

using namespace std;

SilhouetteMask::SilhouetteMask(int ww, int hh, bool filled) : w(ww), h(hh) {
    if (w < 0 || h < 0) throw InvalidConfiguration("mask size must not be negative");
    bits.assign((size_t)w*h, filled);
}

SilhouetteMask SilhouetteMask::fromSurface(const Surface &s, int threshold) {
    SilhouetteMask m(s.width(), s.height());
    for (int y = 0; y < m.h; ++y)
        for (int x = 0; x < m.w; ++x)
            if (s.pixel(x, y).a > threshold) m.bits[(size_t)y*m.w + x] = true;
    return m;
}

bool SilhouetteMask::get(int x, int y) const {
    if (x < 0 || y < 0 || x >= w || y >= h) return false;
    return bits[(size_t)y*w + x];
}

void SilhouetteMask::set(int x, int y, bool v) {
    if (x < 0 || y < 0 || x >= w || y >= h)
        throw OutOfBounds("mask bit (" + to_string(x) + "," + to_string(y) + ") outside mask");
    bits[(size_t)y*w + x] = v;
}

int SilhouetteMask::count() const {
    return (int)std::count(bits.begin(), bits.end(), true);
}

bool SilhouetteMask::overlaps(const SilhouetteMask &other, int dx, int dy) const {
    // Intersection of the two rectangles in this mask's coordinates.
    int x0 = max(0, dx), y0 = max(0, dy);
    int x1 = min(w, dx + other.w), y1 = min(h, dy + other.h);
    for (int y = y0; y < y1; ++y)
        for (int x = x0; x < x1; ++x)
            if (bits[(size_t)y*w + x] && other.bits[(size_t)(y-dy)*other.w + (x-dx)]) return true;
    return false;
}
