#include "entity.hpp"

#include <algorithm>
#include <cmath>

using namespace std;

Entity::Entity(Vector2 pos, const LayerSet &l, const string &imgPath, Scale scale)
    : Object(pos, l, imgPath, scale) {
    SDL_Point c = center();
    truePos = Vector2((float)c.x, (float)c.y);
    originalImage = img.copy();
    silhouette = SilhouetteMask::fromSurface(img);
}

void Entity::update(bool tick) {
    Object::update(tick);
    if (!tick) return;

    truePos += vel;
    setCenter((int)lround(truePos.x), (int)lround(truePos.y));
    applyFriction();

    if (controls) applyControls(controls());
}

void Entity::applyFriction() {
    float speed = vel.magnitude();
    if (speed <= 0 || friction <= 0) return;
    float f = max(friction*mass, friction*mass*speed/3);
    // Never let friction push the entity backwards.
    if (speed - f <= 0) vel = Vector2();
    else brake(f);
}

void Entity::applyControls(const ControlSignals &c) {
    if (c.accelerate) accelerate(tuning.acceleration);
    if (c.brake) brake(tuning.braking);
    if (c.turnRight) turn(tuning.handling);
    if (c.turnLeft) turn(-tuning.handling);
}

void Entity::accelerate(float magnitude) {
    vel += Vector2(magnitude, 0).rotated(ang);
}

void Entity::brake(float magnitude) {
    float speed = vel.magnitude();
    if (speed > VEC_EPSILON) vel = vel.scaledToLength(max(0.0f, speed - magnitude));
    else vel = Vector2();
}

void Entity::turn(float degrees) {
    // Stationary entities cannot pivot.
    if (vel.magnitude() <= VEC_EPSILON || fabs(degrees) < VEC_EPSILON) return;
    ang = fmod(ang + degrees, 360.0f);
    if (ang < 0) ang += 360.0f;
    if (ang >= 360.0f) ang -= 360.0f;
    vel.rotate(degrees);
    img = originalImage.rotated(-ang);
    bounds.w = img.width();
    bounds.h = img.height();
    setCenter((int)lround(truePos.x), (int)lround(truePos.y));
    silhouette = SilhouetteMask::fromSurface(img);
}

bool Entity::collidesWith(const Entity &other) const {
    if (!layersIntersect(layers, other.layers)) return false;
    return silhouette.overlaps(other.silhouette, other.bounds.x - bounds.x, other.bounds.y - bounds.y);
}
