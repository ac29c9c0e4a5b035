#include "object.hpp"

#include "errors.hpp"

#include <algorithm>
#include <cstdlib>

using namespace std;

bool layersIntersect(const LayerSet &a, const LayerSet &b) {
    for (auto &l : a) if (b.count(l)) return true;
    return false;
}

Scale::Scale(int uniform) : Scale(uniform, uniform) {}

Scale::Scale(int ww, int hh) : set(true), w(ww), h(hh) {
    if (w < 0 || h < 0)
        throw InvalidConfiguration("scale must not be negative, got " + to_string(w) + "x" + to_string(h));
}

Scale Scale::parse(const string &text) {
    if (text.empty()) return Scale();
    auto number = [&](const string &s) {
        if (s.empty() || s.find_first_not_of("0123456789") != string::npos)
            throw InvalidConfiguration("scale must be an int or a WxH pair. Got '" + text + "'");
        return atoi(s.c_str());
    };
    size_t x = text.find_first_of("xX");
    if (x == string::npos) return Scale(number(text));
    return Scale(number(text.substr(0, x)), number(text.substr(x+1)));
}

Object::Object(Vector2 pos, const LayerSet &l, const string &imgPath, Scale scale)
    : layers(l), imgScale(scale) {
    if (imgPath.empty()) {
        img = scale.set ? Surface(scale.w, scale.h) : Surface(0, 0);
    } else {
        img = Surface::load(imgPath);
        if (scale.set) img = img.scaled(scale.w, scale.h);
    }
    bounds = SDL_Rect{(int)pos.x, (int)pos.y, img.width(), img.height()};
}

void Object::draw(Surface &target) const {
    target.blit(img, bounds.x, bounds.y);
}

SDL_Point Object::center() const {
    return SDL_Point{bounds.x + bounds.w/2, bounds.y + bounds.h/2};
}

void Object::setCenter(int x, int y) {
    bounds.x = x - bounds.w/2;
    bounds.y = y - bounds.h/2;
}
