#pragma once

#include "mask.hpp"
#include "object.hpp"

#include <functional>

// One tick's worth of driving input.
struct ControlSignals {
    bool accelerate=false, brake=false, turnLeft=false, turnRight=false;
};

using ControlSource = std::function<ControlSignals()>;

// How strongly control signals act, in units/tick/tick and degrees/tick.
struct DriveTuning {
    float acceleration=0.06f;
    float braking=0.05f;
    float handling=4.0f;
};

// An object with velocity and rotation. Velocity is in units/tick, angle in
// degrees within [0, 360), friction in units/tick/tick; mass scales friction.
// truePosition is the sub-pixel centre the rect is derived from.
class Entity : public Object {
public:
    Entity(Vector2 pos, const LayerSet &layers, const std::string &imgPath="", Scale scale=Scale());

    void update(bool tick) override;

    void accelerate(float magnitude);
    void brake(float magnitude);
    void turn(float degrees);
    // Detection only; what happens on contact is up to the caller.
    bool collidesWith(const Entity &other) const;

    void setControls(ControlSource src, DriveTuning t=DriveTuning()) { controls = src; tuning = t; }
    bool hasControls() const { return (bool)controls; }
    const DriveTuning& driveTuning() const { return tuning; }

    const Vector2& truePosition() const { return truePos; }
    const Vector2& velocity() const { return vel; }
    void setVelocity(Vector2 v) { vel = v; }
    float angle() const { return ang; }
    const SilhouetteMask& mask() const { return silhouette; }

    float friction=0.006f;
    float mass=1.0f;

private:
    void applyFriction();
    void applyControls(const ControlSignals &c);

    Vector2 truePos;
    Vector2 vel;
    float ang=0;
    Surface originalImage;
    SilhouetteMask silhouette;
    ControlSource controls;
    DriveTuning tuning;
};
