#pragma once

#include <SDL2/SDL.h>

#include <string>

struct Colour {
    Uint8 r=0,g=0,b=0,a=255;
    Colour() {}
    Colour(Uint8 rr,Uint8 gg,Uint8 bb,Uint8 aa=255):r(rr),g(gg),b(bb),a(aa){}
    bool operator==(const Colour &o) const { return r==o.r && g==o.g && b==o.b && a==o.a; }
    bool operator!=(const Colour &o) const { return !(*this==o); }
};

namespace Colours {
    const Colour BLACK(0,0,0);
    const Colour GRAY(190,190,190);
    const Colour RED(255,0,0);
}

// Owned RGBA32 pixel buffer. Every surface is kept in SDL_PIXELFORMAT_RGBA32
// so pixels can be addressed as R,G,B,A bytes.
class Surface {
public:
    Surface() {}
    // Opaque black surface, like a freshly created display surface.
    Surface(int w, int h);
    // Takes ownership of s.
    explicit Surface(SDL_Surface* s);
    ~Surface();

    Surface(Surface &&o);
    Surface& operator=(Surface &&o);
    Surface(const Surface&) = delete;
    Surface& operator=(const Surface&) = delete;

    static Surface load(const std::string &path);
    static Surface transparent(int w, int h);

    Surface copy() const;
    Surface scaled(int w, int h) const;
    // Counter-clockwise on screen; the result grows to hold the rotated image.
    Surface rotated(float degrees) const;

    void fill(const Colour &c);
    // Alpha-blended draw of src with its top-left at (x,y).
    void blit(const Surface &src, int x, int y);
    // Raw copy of region of src to (x,y); parts of region outside src are left untouched.
    void copyRegion(const Surface &src, const SDL_Rect &region, int x, int y);

    Colour pixel(int x, int y) const;
    void setPixel(int x, int y, const Colour &c);

    int width() const { return surf ? surf->w : 0; }
    int height() const { return surf ? surf->h : 0; }
    bool empty() const { return width()==0 || height()==0; }
    SDL_Surface* raw() const { return surf; }

private:
    const Uint8* at(int x, int y) const { return static_cast<const Uint8*>(surf->pixels) + y*surf->pitch + x*4; }
    Uint8* at(int x, int y) { return static_cast<Uint8*>(surf->pixels) + y*surf->pitch + x*4; }

    SDL_Surface* surf = nullptr;
};
