#include <gtest/gtest.h>
#include "camera.hpp"
#include "errors.hpp"

#include <cmath>
#include <memory>

using namespace std;

namespace {

shared_ptr<Entity> block(Vector2 pos) {
    return make_shared<Entity>(pos, LayerSet{CollisionLayers::CAR}, "", Scale(50, 28));
}

float gap(Vector2 a, SDL_Point b) {
    return (Vector2((float)b.x, (float)b.y) - a).magnitude();
}

}

// ============================================================================
// Camera Follow Tests
// ============================================================================

TEST(CameraTest, RejectsBadSettings) {
    World w(1, 1);
    EXPECT_THROW(Camera(w, 0, 100), InvalidConfiguration);
    EXPECT_THROW(Camera(w, 100, 100, Vector2(), nullptr, 0.0f), InvalidConfiguration);
    EXPECT_THROW(Camera(w, 100, 100, Vector2(), nullptr, 1.5f), InvalidConfiguration);
    Camera c(w, 100, 100);
    EXPECT_THROW(c.setViewportSize(-5, 10), InvalidConfiguration);
    EXPECT_EQ(c.width(), 100);
}

TEST(CameraTest, WithoutFocusPositionIsStatic) {
    World w(1, 1);
    Camera c(w, 100, 100, Vector2(42, 17));
    for (int i = 0; i < 10; ++i) c.update();
    EXPECT_EQ(c.position(), Vector2(42, 17));
}

TEST(CameraTest, EasesTowardStationaryFocusWithoutOvershoot) {
    World w(1, 1);
    auto car = block(Vector2(400, 300));
    Camera c(w, 100, 100, Vector2(0, 0), car, 0.1f);
    SDL_Point target = car->center();

    float last = gap(c.position(), target);
    int updates = 0;
    while (gap(c.position(), target) > 0.5f) {
        c.update();
        float now = gap(c.position(), target);
        ASSERT_LT(now, last);
        ASSERT_LE(c.position().x, (float)target.x);
        ASSERT_LE(c.position().y, (float)target.y);
        last = now;
        ASSERT_LT(++updates, 200);
    }
}

TEST(CameraTest, FirstUpdateClosesSmoothingFraction) {
    World w(1, 1);
    auto car = block(Vector2(75, 86));   // centre (100, 100)
    Camera c(w, 100, 100, Vector2(0, 0), car, 0.25f);
    c.update();
    EXPECT_FLOAT_EQ(c.position().x, 25.0f);
    EXPECT_FLOAT_EQ(c.position().y, 25.0f);
}

TEST(CameraTest, FullSmoothingSnaps) {
    World w(1, 1);
    auto car = block(Vector2(75, 86));
    Camera c(w, 100, 100, Vector2(0, 0), car, 1.0f);
    c.update();
    EXPECT_EQ(c.position(), Vector2(100, 100));
}

TEST(CameraTest, ExpiredFocusLeavesCameraStill) {
    World w(1, 1);
    auto car = block(Vector2(75, 86));
    Camera c(w, 100, 100, Vector2(0, 0), car, 0.5f);
    car.reset();
    c.update();
    EXPECT_EQ(c.position(), Vector2(0, 0));
}

TEST(CameraTest, FreeCameraThenFocus) {
    World w(1, 1);
    Camera c(w, 100, 100);
    c.setPosition(Vector2(10, 10));
    c.update();
    EXPECT_EQ(c.position(), Vector2(10, 10));

    auto car = block(Vector2(75, 86));
    c.setFocus(car);
    c.setSmoothing(0.5f);
    c.update();
    EXPECT_EQ(c.position(), Vector2(55, 55));
}

// ============================================================================
// Camera Frame Tests
// ============================================================================

TEST(CameraTest, FrameIsCentredOnPosition) {
    World w(2, 2);
    w.addTile(make_shared<Tile>(Colours::GRAY), 0, 0);
    w.addTile(make_shared<Tile>(Colours::GRAY), 1, 1);
    Camera c(w, 100, 80, Vector2(TILE_SIZE, TILE_SIZE));

    Surface frame = c.getFrame();
    ASSERT_EQ(frame.width(), 100);
    ASSERT_EQ(frame.height(), 80);
    EXPECT_EQ(frame.pixel(0, 0), Colours::GRAY);      // tile (0,0)
    EXPECT_EQ(frame.pixel(99, 0), Colours::RED);      // empty (1,0)
    EXPECT_EQ(frame.pixel(0, 79), Colours::RED);      // empty (0,1)
    EXPECT_EQ(frame.pixel(99, 79), Colours::GRAY);    // tile (1,1)
}

TEST(CameraTest, FrameCentreIsRounded) {
    World w(1, 1);
    w.addTile(make_shared<Tile>(Colours::GRAY), 0, 0);
    // 49.6 rounds to 50, so the frame starts exactly at the world edge.
    Camera c(w, 100, 100, Vector2(49.6f, 49.6f));
    Surface frame = c.getFrame();
    EXPECT_EQ(frame.pixel(0, 0), Colours::GRAY);

    c.setPosition(Vector2(49.4f, 49.4f));
    frame = c.getFrame();
    EXPECT_EQ(frame.pixel(0, 0), Colours::BLACK);
    EXPECT_EQ(frame.pixel(1, 1), Colours::GRAY);
}

TEST(CameraTest, ViewportResizeAppliesToNextFrame) {
    World w(1, 1);
    w.redraw();
    Camera c(w, 100, 100, Vector2(250, 250));
    EXPECT_EQ(c.getFrame().width(), 100);
    c.setViewportSize(320, 240);
    Surface frame = c.getFrame();
    EXPECT_EQ(frame.width(), 320);
    EXPECT_EQ(frame.height(), 240);
}

TEST(CameraTest, PartlyOutsideWorldIsBlack) {
    World w(1, 1);
    w.addTile(make_shared<Tile>(Colours::GRAY), 0, 0);
    Camera c(w, 100, 100, Vector2(0, 0));
    Surface frame = c.getFrame();
    EXPECT_EQ(frame.pixel(0, 0), Colours::BLACK);
    EXPECT_EQ(frame.pixel(49, 49), Colours::BLACK);
    EXPECT_EQ(frame.pixel(50, 50), Colours::GRAY);
    EXPECT_EQ(frame.pixel(99, 99), Colours::GRAY);
}

TEST(CameraTest, EntirelyOutsideWorldIsBlack) {
    World w(1, 1);
    w.redraw();
    Camera c(w, 64, 64, Vector2(-5000, 9000));
    Surface frame = c.getFrame();
    EXPECT_EQ(frame.pixel(0, 0), Colours::BLACK);
    EXPECT_EQ(frame.pixel(63, 63), Colours::BLACK);
}

TEST(CameraTest, FrameBeforeFirstRedrawIsBlack) {
    World w(2, 2);
    Camera c(w, 10, 10, Vector2(5, 5));
    EXPECT_EQ(c.getFrame().pixel(5, 5), Colours::BLACK);
}

TEST(CameraTest, FollowsMovingCarThroughWorldUpdates) {
    World w(2, 2);
    auto car = w.addObject(block(Vector2(100, 100)));
    car->friction = 0;
    car->setVelocity(Vector2(3.0f, 0.0f));
    Camera c(w, 200, 200, Vector2(125, 114), car, 0.1f);
    for (int i = 0; i < 300; ++i) {
        w.update(true, false);
        c.update();
    }
    // Lag settles at velocity * (1 - s) / s behind the car.
    EXPECT_NEAR(car->center().x - c.position().x, 27.0f, 1.5f);
    EXPECT_NEAR(c.position().y, 114.0f, 1e-3f);
}
