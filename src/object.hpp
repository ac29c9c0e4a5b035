#pragma once

#include "surface.hpp"
#include "vector2.hpp"

#include <SDL2/SDL.h>

#include <set>
#include <string>

// Layer tag, either a number or a name.
struct CollisionLayer {
    bool named=false;
    int id=0;
    std::string name;
    CollisionLayer(int i):named(false),id(i){}
    CollisionLayer(const char *n):named(true),name(n){}
    CollisionLayer(const std::string &n):named(true),name(n){}
    bool operator<(const CollisionLayer &o) const {
        if (named != o.named) return !named;
        return named ? name < o.name : id < o.id;
    }
    bool operator==(const CollisionLayer &o) const { return named==o.named && id==o.id && name==o.name; }
};

using LayerSet = std::set<CollisionLayer>;

namespace CollisionLayers {
    const CollisionLayer CAR(0);
}

bool layersIntersect(const LayerSet &a, const LayerSet &b);

// Optional target size for an object's image.
struct Scale {
    bool set=false;
    int w=0, h=0;
    Scale() {}
    Scale(int uniform);
    Scale(int ww, int hh);
    // "50x28", "50" or "" (no scaling).
    static Scale parse(const std::string &text);
};

// Anything placed in the world. Objects only collide with objects they
// share at least one collision layer with.
class Object {
public:
    Object(Vector2 pos, const LayerSet &layers, const std::string &imgPath="", Scale scale=Scale());
    virtual ~Object() {}
    Object(Object&&) = default;
    Object& operator=(Object&&) = default;

    virtual void update(bool tick) { (void)tick; }
    virtual void draw(Surface &target) const;

    const SDL_Rect& rect() const { return bounds; }
    SDL_Point center() const;
    const Surface& image() const { return img; }
    const LayerSet& collisionLayers() const { return layers; }
    const Scale& scale() const { return imgScale; }

protected:
    void setCenter(int x, int y);

    SDL_Rect bounds;
    Surface img;
    LayerSet layers;
    Scale imgScale;
};
