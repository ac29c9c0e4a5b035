#pragma once

#include "entity.hpp"
#include "object.hpp"
#include "surface.hpp"

#include <memory>
#include <string>
#include <utility>
#include <vector>

constexpr int TILE_SIZE = 500;

// A TILE_SIZE square segment of the world.
class Tile {
public:
    explicit Tile(const std::string &imgPath);
    explicit Tile(const Colour &colour=Colours::GRAY);
    virtual ~Tile() {}

    virtual void update(bool tick) { (void)tick; }
    const Surface& image() const { return img; }

private:
    Surface img;
};

// Drawn wherever a grid cell has no tile.
const Tile& emptyTile();

// Tiles are stored [col][row]; the grid stays rectangular and only grows.
class World {
public:
    World(int cols, int rows);

    void addTile(std::shared_ptr<Tile> tile, int col, int row);
    std::shared_ptr<Tile> tileAt(int col, int row) const;

    template<typename T>
    std::shared_ptr<T> addObject(std::shared_ptr<T> obj) { objects.push_back(obj); return obj; }

    void update(bool tick, bool redraw=true);
    void redraw();

    // Every entity pair currently in contact, in insertion order.
    std::vector<std::pair<Entity*, Entity*>> collidingPairs() const;

    int cols() const { return (int)tiles.size(); }
    int rows() const { return rowCount; }
    const std::vector<std::shared_ptr<Object>>& allObjects() const { return objects; }
    const Surface& image() const { return surface; }

private:
    std::vector<std::vector<std::shared_ptr<Tile>>> tiles;
    int rowCount = 0;
    std::vector<std::shared_ptr<Object>> objects;
    Surface surface;
};
