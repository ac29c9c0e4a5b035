#include "camera.hpp"

#include "errors.hpp"

#include <cmath>
#include <string>

using namespace std;

Camera::Camera(const World &w, int width, int height, Vector2 p, shared_ptr<const Object> f, float s)
    : world(w), viewW(0), viewH(0), pos(p), focus(f), smooth(0.1f) {
    setViewportSize(width, height);
    setSmoothing(s);
}

void Camera::setViewportSize(int width, int height) {
    if (width <= 0 || height <= 0)
        throw InvalidConfiguration("viewport must be positive, got " + to_string(width) + "x" + to_string(height));
    viewW = width;
    viewH = height;
}

void Camera::setSmoothing(float s) {
    if (!(s > 0 && s <= 1))
        throw InvalidConfiguration("camera smoothing must be in (0, 1], got " + to_string(s));
    smooth = s;
}

void Camera::update() {
    auto target = focus.lock();
    if (!target) return;
    SDL_Point c = target->center();
    Vector2 d = Vector2((float)c.x, (float)c.y) - pos;
    pos += d * smooth;
}

Surface Camera::getFrame() const {
    Surface frame(viewW, viewH);
    int cx = (int)lround(pos.x), cy = (int)lround(pos.y);
    SDL_Rect region = {cx - viewW/2, cy - viewH/2, viewW, viewH};
    frame.copyRegion(world.image(), region, 0, 0);
    return frame;
}
