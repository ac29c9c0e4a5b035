#include "config.hpp"
#include "engine.hpp"
#include "log.hpp"

#include <cstdlib>
#include <exception>
#include <string>

using namespace std;

int main(int argc, char** argv){
    string path = argc > 1 ? argv[1] : "tiledrive.cfg";
    try {
        Config cfg;
        bool loaded = cfg.load(path);
        if(!loaded) LOGW("Config '%s' not found, using defaults and the dev map", path.c_str());
        Settings settings = Settings::fromConfig(cfg);
        if(!loaded) settings.tiles = Settings::demoMap();

        Engine e(settings);
        if(!e.init()) return EXIT_FAILURE;
        e.createScene();
        e.run();
    } catch(const exception &ex){
        LOGE("%s", ex.what());
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
