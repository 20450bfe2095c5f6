#pragma once

#include "raw_view/core/types.hpp"

namespace raw_view::synthetic {

// Every photosite reads `value`; black 0, white `white_level`, unit gains.
SensorFrame flat_field(int width, int height, BayerPattern pattern,
                       uint16_t value, float white_level);

// Each photosite reads the value of its own channel (r, g or b).
SensorFrame color_patch(int width, int height, BayerPattern pattern,
                        uint16_t r, uint16_t g, uint16_t b, float white_level);

// Horizontal luminance ramp from black to white across the frame.
SensorFrame ramp(int width, int height, BayerPattern pattern, float white_level);

} // namespace raw_view::synthetic
