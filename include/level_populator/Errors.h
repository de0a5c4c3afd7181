#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace level_populator {

// Malformed AB genome. position() is the character offset of the failure.
class ParseError : public std::runtime_error {
public:
    ParseError(const std::string& message, size_t position)
        : std::runtime_error(message + " (at offset " + std::to_string(position) + ")")
        , position_(position) {}

    size_t position() const { return position_; }

private:
    size_t position_;
};

// The level or the placement request cannot produce a valid run
// (degenerate visibility, saturated rooms, bad resource config).
class ConfigurationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Room rectangles violating the reducer's invariants.
class GeometryError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace level_populator
