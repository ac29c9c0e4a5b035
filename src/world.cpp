#include "world.hpp"

#include "errors.hpp"
#include "log.hpp"

using namespace std;

Tile::Tile(const string &imgPath) : img(Surface::load(imgPath).scaled(TILE_SIZE, TILE_SIZE)) {}

Tile::Tile(const Colour &colour) : img(TILE_SIZE, TILE_SIZE) {
    img.fill(colour);
}

const Tile& emptyTile() {
    static const Tile tile(Colours::RED);
    return tile;
}

World::World(int cols, int rows) {
    if (cols < 0 || rows < 0)
        throw InvalidConfiguration("world size must not be negative, got " + to_string(cols) + "x" + to_string(rows));
    tiles.assign(cols, vector<shared_ptr<Tile>>(rows));
    rowCount = rows;
    LOGI("World created with %dx%d tiles", cols, rows);
}

void World::addTile(shared_ptr<Tile> tile, int col, int row) {
    if (col < 0 || row < 0)
        throw OutOfBounds("Tile out of bounds: col:" + to_string(col) + " row:" + to_string(row));

    // Grow to fit, rows first so new columns get the full height.
    if (row >= rowCount) {
        rowCount = row + 1;
        for (auto &c : tiles) c.resize(rowCount);
    }
    if (col >= cols()) tiles.resize(col + 1, vector<shared_ptr<Tile>>(rowCount));

    tiles[col][row] = tile;
    redraw();
}

shared_ptr<Tile> World::tileAt(int col, int row) const {
    if (col < 0 || row < 0 || col >= cols() || row >= rowCount)
        throw OutOfBounds("No cell at col:" + to_string(col) + " row:" + to_string(row));
    return tiles[col][row];
}

void World::update(bool tick, bool redrawSurface) {
    for (auto &col : tiles)
        for (auto &t : col)
            if (t) t->update(tick);
    for (auto &o : objects) o->update(tick);
    if (redrawSurface) redraw();
}

void World::redraw() {
    if (surface.width() != cols()*TILE_SIZE || surface.height() != rowCount*TILE_SIZE)
        surface = Surface(cols()*TILE_SIZE, rowCount*TILE_SIZE);
    for (int c = 0; c < cols(); ++c) {
        for (int r = 0; r < rowCount; ++r) {
            const Tile &t = tiles[c][r] ? *tiles[c][r] : emptyTile();
            surface.copyRegion(t.image(), SDL_Rect{0, 0, TILE_SIZE, TILE_SIZE}, c*TILE_SIZE, r*TILE_SIZE);
        }
    }
    for (auto &o : objects) o->draw(surface);
}

vector<pair<Entity*, Entity*>> World::collidingPairs() const {
    vector<Entity*> ents;
    for (auto &o : objects)
        if (auto e = dynamic_cast<Entity*>(o.get())) ents.push_back(e);

    vector<pair<Entity*, Entity*>> out;
    for (size_t i = 0; i < ents.size(); ++i)
        for (size_t j = i+1; j < ents.size(); ++j)
            if (ents[i]->collidesWith(*ents[j])) out.push_back(make_pair(ents[i], ents[j]));
    return out;
}
