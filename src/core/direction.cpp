/// @file src/core/direction.cpp
/// @brief Direction construction from raw [inc, dec] component vectors.

#include "potfield/types.hpp"
#include "potfield/errors.hpp"

#include <string>

namespace potfield {

Direction Direction::from_components(std::span<const double> components) {
    // Exactly [inclination, declination]; anything else is ambiguous.
    if (components.size() != 2) {
        throw InvalidParameter(
            "direction vector must have only inclination and declination (got " +
            std::to_string(components.size()) + " components)");
    }
    return Direction{.inclination = components[0],
                     .declination = components[1]};
}

} // namespace potfield
