#include "car.hpp"

using namespace std;

shared_ptr<Entity> makeControlledCar(Vector2 pos, ControlSource controls, const string &imgPath, Scale scale, const LayerSet &layers) {
    auto car = make_shared<Entity>(pos, layers, imgPath, scale);
    car->friction = 0.02f;
    car->setControls(controls);
    return car;
}
