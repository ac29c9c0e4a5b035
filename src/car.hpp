#pragma once

#include "entity.hpp"

#include <memory>
#include <string>

const char* const DEFAULT_CAR_IMAGE = "assets/images/blue_car.png";

// Player car: friction 0.02, tuned for keyboard driving.
std::shared_ptr<Entity> makeControlledCar(Vector2 pos, ControlSource controls,
                                          const std::string &imgPath=DEFAULT_CAR_IMAGE,
                                          Scale scale=Scale(50, 28),
                                          const LayerSet &layers=LayerSet{CollisionLayers::CAR});
