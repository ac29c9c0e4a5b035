#pragma once

#include "object.hpp"

#include <string>
#include <unordered_map>
#include <vector>

std::string readFileAll(const std::string &path);

// `key = value` lines; '#' starts a comment line.
class Config {
public:
    bool load(const std::string &path);
    void parse(const std::string &text);

    std::string get(const std::string &k, const std::string &def="") const;
    int getInt(const std::string &k, int def=0) const;
    float getFloat(const std::string &k, float def=0.0f) const;
    bool has(const std::string &k) const { return data.count(k) > 0; }
    std::vector<std::string> keysWithPrefix(const std::string &prefix) const;

private:
    std::unordered_map<std::string, std::string> data;
};

struct TilePlacement {
    int col=0, row=0;
    std::string image;
};

struct Settings {
    int windowWidth=700, windowHeight=500;
    std::string windowTitle="TileDrive";
    int tps=60;
    int fps=60;
    float cameraSmoothing=0.1f;
    int worldCols=5, worldRows=5;
    std::vector<TilePlacement> tiles;
    Vector2 carPosition=Vector2(100, 100);
    std::string carImage="assets/images/blue_car.png";
    Scale carScale=Scale(50, 28);
    // Uncontrolled cars sharing the player's image.
    std::vector<Vector2> npcCars;
    int statsIntervalMs=2000;

    static Settings fromConfig(const Config &cfg);
    static std::vector<TilePlacement> demoMap();
};
