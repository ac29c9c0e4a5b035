#pragma once

#include <vector>

class Surface;

// Per-pixel occupancy bitmap used for exact collision tests.
class SilhouetteMask {
public:
    SilhouetteMask() {}
    SilhouetteMask(int w, int h, bool filled=false);

    // A pixel is set when its alpha is above threshold.
    static SilhouetteMask fromSurface(const Surface &s, int threshold=127);

    bool get(int x, int y) const;
    void set(int x, int y, bool v=true);
    int count() const;

    // True when any set pixel here coincides with a set pixel of other
    // placed at (dx,dy) relative to this mask.
    bool overlaps(const SilhouetteMask &other, int dx, int dy) const;

    int width() const { return w; }
    int height() const { return h; }
    bool operator==(const SilhouetteMask &o) const { return w==o.w && h==o.h && bits==o.bits; }
    bool operator!=(const SilhouetteMask &o) const { return !(*this==o); }

private:
    int w=0, h=0;
    std::vector<bool> bits;
};
