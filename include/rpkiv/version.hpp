#pragma once
/**
 * @file version.hpp
 * @brief Release identification and the RTR protocol versions this build speaks.
 */

#include <cstdint>

#include "rpkiv/config/constants.hpp"

namespace rpkiv {

    inline constexpr int version_major = 0;
    inline constexpr int version_minor = 1;
    inline constexpr int version_patch = 0;
    inline constexpr const char* version_string = "0.1.0";

    /// Lowest and highest RTR protocol version accepted in configuration and on the wire.
    inline constexpr std::uint8_t rtr_version_min = config::constants::RTR_VERSION_MIN;
    inline constexpr std::uint8_t rtr_version_max = config::constants::RTR_VERSION_MAX;

} // namespace rpkiv
