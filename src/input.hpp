#pragma once

#include <SDL2/SDL.h>

#include <string>
#include <unordered_map>
#include <vector>

struct InputState {
    std::unordered_map<int,bool> keys;
    bool quit=false;
    bool resized=false;
    int width=0, height=0;

    // Drains the SDL event queue.
    void update();
    void handle(const SDL_Event &e);
    bool down(SDL_Scancode s) const { auto it=keys.find(s); return it!=keys.end() && it->second; }
};

// Named actions, each bound to any number of keys.
class InputMap {
public:
    void bind(const std::string &action, SDL_Scancode key) { map[action].push_back(key); }
    bool actionDown(const InputState &st, const std::string &action) const;
private:
    std::unordered_map<std::string, std::vector<SDL_Scancode>> map;
};
