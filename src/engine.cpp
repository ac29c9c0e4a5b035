#include "engine.hpp"

#include "car.hpp"

#include <SDL2/SDL_image.h>

#include <chrono>

using namespace std;

Engine::Engine(const Settings &s) : settings(s), scheduler(s.tps) {}

Engine::~Engine() { cleanup(); }

bool Engine::init() {
    if(SDL_Init(SDL_INIT_VIDEO|SDL_INIT_TIMER) < 0){ LOGE("SDL_Init failed: %s", SDL_GetError()); return false; }
    sdlReady = true;
    int imgFlags = IMG_INIT_PNG;
    if(!(IMG_Init(imgFlags) & imgFlags)) LOGW("IMG_Init warning: %s", IMG_GetError());
    else imgReady = true;
    window = SDL_CreateWindow(settings.windowTitle.c_str(), SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
                              settings.windowWidth, settings.windowHeight, SDL_WINDOW_SHOWN | SDL_WINDOW_RESIZABLE);
    if(!window){ LOGE("CreateWindow failed: %s", SDL_GetError()); return false; }
    renderer = SDL_CreateRenderer(window, -1, SDL_RENDERER_ACCELERATED);
    if(!renderer){ LOGE("CreateRenderer failed: %s", SDL_GetError()); return false; }
    inputMap.bind("accelerate", SDL_SCANCODE_UP); inputMap.bind("accelerate", SDL_SCANCODE_W);
    inputMap.bind("brake", SDL_SCANCODE_DOWN); inputMap.bind("brake", SDL_SCANCODE_S);
    inputMap.bind("left", SDL_SCANCODE_LEFT); inputMap.bind("left", SDL_SCANCODE_A);
    inputMap.bind("right", SDL_SCANCODE_RIGHT); inputMap.bind("right", SDL_SCANCODE_D);
    LOGI("Engine initialized (%dx%d, %d tps, %d fps cap)", settings.windowWidth, settings.windowHeight, settings.tps, settings.fps);
    return true;
}

void Engine::createScene() {
    world = make_unique<World>(settings.worldCols, settings.worldRows);
    for(auto &t : settings.tiles)
        world->addTile(make_shared<Tile>(t.image), t.col, t.row);

    player = world->addObject(makeControlledCar(settings.carPosition, [this]{ return pollControls(); },
                                                settings.carImage, settings.carScale));
    for(auto &p : settings.npcCars)
        world->addObject(make_shared<Entity>(p, LayerSet{CollisionLayers::CAR}, settings.carImage, settings.carScale));

    camera = make_unique<Camera>(*world, settings.windowWidth, settings.windowHeight,
                                 settings.carPosition, player, settings.cameraSmoothing);
    world->redraw();
    LOGI("Scene ready: %dx%d tiles, %zu objects", world->cols(), world->rows(), world->allObjects().size());
}

ControlSignals Engine::pollControls() const {
    ControlSignals c;
    c.accelerate = inputMap.actionDown(input, "accelerate");
    c.brake = inputMap.actionDown(input, "brake");
    c.turnLeft = inputMap.actionDown(input, "left");
    c.turnRight = inputMap.actionDown(input, "right");
    return c;
}

void Engine::run() {
    running = true;
    lastTime = chrono::steady_clock::now();
    lastStatsTime = nowMillis();
    const double targetMs = 1000.0 / settings.fps;
    while(running){
        TimePoint frameStart = chrono::steady_clock::now();
        bool tick = scheduler.advance(ms(frameStart - lastTime).count());
        lastTime = frameStart;

        input.update();
        if(input.quit){ running=false; break; }
        if(input.resized && input.width > 0 && input.height > 0){
            camera->setViewportSize(input.width, input.height);
            LOGI("Viewport resized to %dx%d", input.width, input.height);
        }

        world->update(tick);
        if(tick){ tickCount++; reportCollisions(); }
        camera->update();
        present(camera->getFrame());
        frameCount++;
        logStats(nowMillis());

        ms elapsed = chrono::steady_clock::now() - frameStart;
        if(elapsed.count() < targetMs) SDL_Delay((Uint32)(targetMs - elapsed.count()));
    }
    LOGI("Quit requested");
}

void Engine::reportCollisions() {
    set<pair<Entity*, Entity*>> now;
    for(auto &p : world->collidingPairs()){
        now.insert(p);
        if(!contacts.count(p))
            LOGI("Collision at (%.1f, %.1f) <-> (%.1f, %.1f)", p.first->truePosition().x, p.first->truePosition().y,
                 p.second->truePosition().x, p.second->truePosition().y);
    }
    contacts.swap(now);
}

void Engine::present(const Surface &frame) {
    if(!texture || texW != frame.width() || texH != frame.height()){
        if(texture) SDL_DestroyTexture(texture);
        texture = SDL_CreateTexture(renderer, SDL_PIXELFORMAT_RGBA32, SDL_TEXTUREACCESS_STREAMING, frame.width(), frame.height());
        if(!texture){ LOGE("SDL_CreateTexture failed: %s", SDL_GetError()); running=false; return; }
        texW = frame.width(); texH = frame.height();
    }
    if(SDL_UpdateTexture(texture, nullptr, frame.raw()->pixels, frame.raw()->pitch) < 0)
        LOGW("SDL_UpdateTexture failed: %s", SDL_GetError());
    SDL_RenderClear(renderer);
    SDL_RenderCopy(renderer, texture, nullptr, nullptr);
    SDL_RenderPresent(renderer);
}

void Engine::logStats(double now) {
    if(now - lastStatsTime < settings.statsIntervalMs) return;
    double secs = (now - lastStatsTime) / 1000.0;
    LOGI("FPS: %.1f | TPS: %.1f | Speed: %.3f | Camera: (%.0f, %.0f)", frameCount/secs, tickCount/secs,
         player ? player->velocity().magnitude() : 0.0f, camera->position().x, camera->position().y);
    frameCount = 0; tickCount = 0; lastStatsTime = now;
}

void Engine::cleanup(){
    camera.reset(); player.reset(); world.reset(); contacts.clear();
    if(texture){ SDL_DestroyTexture(texture); texture=nullptr; }
    if(renderer){ SDL_DestroyRenderer(renderer); renderer=nullptr; }
    if(window){ SDL_DestroyWindow(window); window=nullptr; }
    if(imgReady){ IMG_Quit(); imgReady=false; }
    if(sdlReady){ SDL_Quit(); sdlReady=false; LOGI("Engine shut down"); }
}
