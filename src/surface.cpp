#include "surface.hpp"

#include "errors.hpp"
#include "log.hpp"

#include <SDL2/SDL_image.h>

#include <algorithm>
#include <cmath>
#include <utility>

using namespace std;

static SDL_Surface* createRGBA(int w, int h) {
    if (w < 0 || h < 0)
        throw InvalidConfiguration("surface size must not be negative, got " + to_string(w) + "x" + to_string(h));
    SDL_Surface* s = SDL_CreateRGBSurfaceWithFormat(0, w, h, 32, SDL_PIXELFORMAT_RGBA32);
    if (!s) throw runtime_error(string("SDL_CreateRGBSurfaceWithFormat failed: ") + SDL_GetError());
    return s;
}

static SDL_Surface* toRGBA(SDL_Surface* s) {
    if (s->format->format == SDL_PIXELFORMAT_RGBA32) return s;
    SDL_Surface* conv = SDL_ConvertSurfaceFormat(s, SDL_PIXELFORMAT_RGBA32, 0);
    SDL_FreeSurface(s);
    if (!conv) throw runtime_error(string("SDL_ConvertSurfaceFormat failed: ") + SDL_GetError());
    return conv;
}

Surface::Surface(int w, int h) : surf(createRGBA(w, h)) {
    fill(Colours::BLACK);
}

Surface::Surface(SDL_Surface* s) : surf(s ? toRGBA(s) : nullptr) {}

Surface::~Surface() { if (surf) SDL_FreeSurface(surf); }

Surface::Surface(Surface &&o) : surf(o.surf) { o.surf = nullptr; }

Surface& Surface::operator=(Surface &&o) {
    if (this != &o) {
        if (surf) SDL_FreeSurface(surf);
        surf = o.surf;
        o.surf = nullptr;
    }
    return *this;
}

Surface Surface::load(const string &path) {
    SDL_Surface* s = IMG_Load(path.c_str());
    if (!s) throw AssetError("Failed to load image " + path + ": " + IMG_GetError());
    Surface out(s);
    LOGI("Loaded image '%s' %dx%d", path.c_str(), out.width(), out.height());
    return out;
}

Surface Surface::transparent(int w, int h) {
    return Surface(createRGBA(w, h));
}

Surface Surface::copy() const {
    if (!surf) return Surface();
    Surface out = transparent(width(), height());
    out.copyRegion(*this, SDL_Rect{0, 0, width(), height()}, 0, 0);
    return out;
}

Surface Surface::scaled(int w, int h) const {
    Surface out = transparent(w, h);
    if (empty() || out.empty()) return out;
    SDL_BlendMode mode;
    SDL_GetSurfaceBlendMode(surf, &mode);
    SDL_SetSurfaceBlendMode(surf, SDL_BLENDMODE_NONE);
    SDL_Rect dst = {0, 0, w, h};
    int rc = SDL_BlitScaled(surf, nullptr, out.surf, &dst);
    SDL_SetSurfaceBlendMode(surf, mode);
    if (rc < 0) throw runtime_error(string("SDL_BlitScaled failed: ") + SDL_GetError());
    return out;
}

Surface Surface::rotated(float degrees) const {
    const float r = degrees * 3.14159265358979f / 180.0f;
    const float c = cos(r), s = sin(r);
    const int w = width(), h = height();
    // Trim float noise so right angles give exact bounds.
    const int nw = (int)ceil(fabs(w*c) + fabs(h*s) - 0.001f);
    const int nh = (int)ceil(fabs(w*s) + fabs(h*c) - 0.001f);
    Surface out = transparent(max(nw, 0), max(nh, 0));
    if (empty() || out.empty()) return out;

    const float scx = w * 0.5f, scy = h * 0.5f;
    const float dcx = nw * 0.5f, dcy = nh * 0.5f;
    for (int y = 0; y < nh; ++y) {
        for (int x = 0; x < nw; ++x) {
            // Inverse map: rotate the destination pixel centre back into the source.
            float dx = x + 0.5f - dcx, dy = y + 0.5f - dcy;
            int sx = (int)floor(dx*c - dy*s + scx);
            int sy = (int)floor(dx*s + dy*c + scy);
            if (sx < 0 || sy < 0 || sx >= w || sy >= h) continue;
            const Uint8* src = at(sx, sy);
            Uint8* dst = out.at(x, y);
            dst[0]=src[0]; dst[1]=src[1]; dst[2]=src[2]; dst[3]=src[3];
        }
    }
    return out;
}

void Surface::fill(const Colour &c) {
    if (!surf) return;
    SDL_FillRect(surf, nullptr, SDL_MapRGBA(surf->format, c.r, c.g, c.b, c.a));
}

void Surface::blit(const Surface &src, int x, int y) {
    if (!surf || src.empty()) return;
    SDL_Rect dst = {x, y, 0, 0};
    if (SDL_BlitSurface(src.surf, nullptr, surf, &dst) < 0)
        LOGW("SDL_BlitSurface failed: %s", SDL_GetError());
}

void Surface::copyRegion(const Surface &src, const SDL_Rect &region, int x, int y) {
    if (!surf || src.empty()) return;
    SDL_BlendMode mode;
    SDL_GetSurfaceBlendMode(src.surf, &mode);
    SDL_SetSurfaceBlendMode(src.surf, SDL_BLENDMODE_NONE);
    SDL_Rect dst = {x, y, 0, 0};
    int rc = SDL_BlitSurface(src.surf, &region, surf, &dst);
    SDL_SetSurfaceBlendMode(src.surf, mode);
    if (rc < 0) LOGW("SDL_BlitSurface failed: %s", SDL_GetError());
}

Colour Surface::pixel(int x, int y) const {
    if (!surf || x < 0 || y < 0 || x >= width() || y >= height())
        throw OutOfBounds("pixel (" + to_string(x) + "," + to_string(y) + ") outside surface");
    const Uint8* p = at(x, y);
    return Colour(p[0], p[1], p[2], p[3]);
}

void Surface::setPixel(int x, int y, const Colour &c) {
    if (!surf || x < 0 || y < 0 || x >= width() || y >= height())
        throw OutOfBounds("pixel (" + to_string(x) + "," + to_string(y) + ") outside surface");
    Uint8* p = at(x, y);
    p[0]=c.r; p[1]=c.g; p[2]=c.b; p[3]=c.a;
}
