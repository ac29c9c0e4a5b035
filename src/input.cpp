#include "input.hpp"

void InputState::update() {
    resized = false;
    SDL_Event e;
    while(SDL_PollEvent(&e)) handle(e);
}

void InputState::handle(const SDL_Event &e) {
    if(e.type==SDL_QUIT) quit=true;
    else if(e.type==SDL_KEYDOWN) keys[e.key.keysym.scancode] = true;
    else if(e.type==SDL_KEYUP) keys[e.key.keysym.scancode] = false;
    else if(e.type==SDL_WINDOWEVENT && e.window.event==SDL_WINDOWEVENT_SIZE_CHANGED){
        resized = true; width = e.window.data1; height = e.window.data2;
    }
}

bool InputMap::actionDown(const InputState &st, const std::string &action) const {
    auto it = map.find(action);
    if(it==map.end()) return false;
    for(auto key : it->second) if(st.down(key)) return true;
    return false;
}
