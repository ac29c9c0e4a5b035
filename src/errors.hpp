#pragma once

#include <stdexcept>
#include <string>

// Tile placement or lookup outside the grid.
struct OutOfBounds : public std::out_of_range {
    explicit OutOfBounds(const std::string &what) : std::out_of_range(what) {}
};

// Bad scale, size, rate or config value. Raised at construction time.
struct InvalidConfiguration : public std::invalid_argument {
    explicit InvalidConfiguration(const std::string &what) : std::invalid_argument(what) {}
};

// Image could not be decoded.
struct AssetError : public std::runtime_error {
    explicit AssetError(const std::string &what) : std::runtime_error(what) {}
};
