#pragma once

#include "camera.hpp"
#include "config.hpp"
#include "entity.hpp"
#include "input.hpp"
#include "log.hpp"
#include "tick_scheduler.hpp"
#include "world.hpp"

#include <SDL2/SDL.h>

#include <memory>
#include <set>
#include <utility>

class Engine {
public:
    explicit Engine(const Settings &s);
    ~Engine();

    bool init();
    // Builds the world from settings. Asset and placement errors propagate.
    void createScene();
    void run();

private:
    ControlSignals pollControls() const;
    void reportCollisions();
    void present(const Surface &frame);
    void logStats(double now);
    void cleanup();

    Settings settings;
    SDL_Window* window=nullptr;
    SDL_Renderer* renderer=nullptr;
    SDL_Texture* texture=nullptr;
    int texW=0, texH=0;
    bool imgReady=false, sdlReady=false;

    std::unique_ptr<World> world;
    std::unique_ptr<Camera> camera;
    std::shared_ptr<Entity> player;
    std::set<std::pair<Entity*, Entity*>> contacts;

    InputState input;
    InputMap inputMap;
    TickScheduler scheduler;
    bool running=false;
    TimePoint lastTime;

    int frameCount=0, tickCount=0;
    double lastStatsTime=0;
};
