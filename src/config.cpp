#include "config.hpp"

#include "errors.hpp"

#include <algorithm>
#include <cstdio>
#include <fstream>
#include <sstream>

using namespace std;

string readFileAll(const string &path) {
    ifstream ifs(path, ios::in | ios::binary);
    if(!ifs) return string();
    stringstream ss;
    ss << ifs.rdbuf();
    return ss.str();
}

static string trim(const string &s) {
    size_t a = s.find_first_not_of(" \t\r\n");
    if (a==string::npos) return string();
    size_t b = s.find_last_not_of(" \t\r\n");
    return s.substr(a,b-a+1);
}

bool Config::load(const string &path) {
    ifstream probe(path);
    if (!probe) return false;
    parse(readFileAll(path));
    return true;
}

void Config::parse(const string &text) {
    istringstream iss(text);
    string line;
    while (getline(iss, line)) {
        line = trim(line);
        if (line.empty() || line[0]=='#') continue;
        size_t eq = line.find('=');
        if (eq==string::npos) continue;
        data[trim(line.substr(0,eq))] = trim(line.substr(eq+1));
    }
}

string Config::get(const string &k, const string &def) const {
    auto it=data.find(k);
    return it==data.end()?def:it->second;
}

int Config::getInt(const string &k, int def) const {
    auto s=get(k);
    if(s.empty()) return def;
    size_t used = 0;
    int v = 0;
    try { v = stoi(s, &used); }
    catch (const logic_error &) { used = 0; }
    if (used != s.size()) throw InvalidConfiguration("'" + k + "' must be an integer, got '" + s + "'");
    return v;
}

float Config::getFloat(const string &k, float def) const {
    auto s=get(k);
    if(s.empty()) return def;
    size_t used = 0;
    float v = 0;
    try { v = stof(s, &used); }
    catch (const logic_error &) { used = 0; }
    if (used != s.size()) throw InvalidConfiguration("'" + k + "' must be a number, got '" + s + "'");
    return v;
}

vector<string> Config::keysWithPrefix(const string &prefix) const {
    vector<string> out;
    for (auto &kv : data)
        if (kv.first.compare(0, prefix.size(), prefix) == 0) out.push_back(kv.first);
    sort(out.begin(), out.end());
    return out;
}

// "tile.<col>.<row>"
static TilePlacement parseTileKey(const string &key, const string &image) {
    TilePlacement t;
    t.image = image;
    char tail = 0;
    if (sscanf(key.c_str(), "tile.%d.%d%c", &t.col, &t.row, &tail) != 2)
        throw InvalidConfiguration("tile keys look like tile.<col>.<row>, got '" + key + "'");
    if (t.col < 0 || t.row < 0)
        throw InvalidConfiguration("tile position must not be negative: '" + key + "'");
    return t;
}

// "x,y"
static Vector2 parsePoint(const string &key, const string &value) {
    float x = 0, y = 0;
    char tail = 0;
    if (sscanf(value.c_str(), " %f , %f %c", &x, &y, &tail) != 2)
        throw InvalidConfiguration("'" + key + "' must look like x,y, got '" + value + "'");
    return Vector2(x, y);
}

Settings Settings::fromConfig(const Config &cfg) {
    Settings s;
    s.windowWidth = cfg.getInt("window.width", s.windowWidth);
    s.windowHeight = cfg.getInt("window.height", s.windowHeight);
    s.windowTitle = cfg.get("window.title", s.windowTitle);
    s.tps = cfg.getInt("tps", s.tps);
    s.fps = cfg.getInt("fps", s.fps);
    s.cameraSmoothing = cfg.getFloat("camera.smoothing", s.cameraSmoothing);
    s.worldCols = cfg.getInt("world.cols", s.worldCols);
    s.worldRows = cfg.getInt("world.rows", s.worldRows);
    s.carPosition.x = cfg.getFloat("car.x", s.carPosition.x);
    s.carPosition.y = cfg.getFloat("car.y", s.carPosition.y);
    s.carImage = cfg.get("car.image", s.carImage);
    if (cfg.has("car.scale")) s.carScale = Scale::parse(cfg.get("car.scale"));
    s.statsIntervalMs = cfg.getInt("stats.interval_ms", s.statsIntervalMs);

    for (auto &k : cfg.keysWithPrefix("tile."))
        s.tiles.push_back(parseTileKey(k, cfg.get(k)));
    for (auto &k : cfg.keysWithPrefix("npc."))
        s.npcCars.push_back(parsePoint(k, cfg.get(k)));

    if (s.windowWidth <= 0 || s.windowHeight <= 0) throw InvalidConfiguration("window size must be positive");
    if (s.tps <= 0) throw InvalidConfiguration("tps must be positive");
    if (s.fps <= 0) throw InvalidConfiguration("fps must be positive");
    if (!(s.cameraSmoothing > 0 && s.cameraSmoothing <= 1)) throw InvalidConfiguration("camera.smoothing must be in (0, 1]");
    if (s.worldCols < 0 || s.worldRows < 0) throw InvalidConfiguration("world size must not be negative");
    if (s.statsIntervalMs <= 0) throw InvalidConfiguration("stats.interval_ms must be positive");
    return s;
}

vector<TilePlacement> Settings::demoMap() {
    vector<TilePlacement> m;
    const int cells[][2] = {{0,0},{0,1},{1,0},{1,1},{2,0}};
    for (auto &c : cells) {
        TilePlacement t;
        t.col = c[0]; t.row = c[1];
        t.image = "assets/maps/dev/" + to_string(c[0]) + to_string(c[1]) + ".png";
        m.push_back(t);
    }
    return m;
}
