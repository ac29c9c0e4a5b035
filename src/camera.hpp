#pragma once

#include "object.hpp"
#include "surface.hpp"
#include "vector2.hpp"
#include "world.hpp"

#include <memory>

// Decides what part of the world is visible. With a focus object the
// camera eases toward it, closing `smoothing` of the gap each update.
class Camera {
public:
    Camera(const World &world, int width, int height, Vector2 pos=Vector2(450, 300),
           std::shared_ptr<const Object> focus=nullptr, float smoothing=0.1f);

    void update();
    Surface getFrame() const;

    void setViewportSize(int width, int height);
    void setFocus(std::shared_ptr<const Object> obj) { focus = obj; }
    void setSmoothing(float s);
    void setPosition(Vector2 p) { pos = p; }

    const Vector2& position() const { return pos; }
    int width() const { return viewW; }
    int height() const { return viewH; }
    float smoothing() const { return smooth; }

private:
    const World &world;
    int viewW, viewH;
    Vector2 pos;
    std::weak_ptr<const Object> focus;
    float smooth;
};
