#pragma once

#include "constants.hpp"

namespace ptzgw {

enum class Axis {
    Pan,
    Tilt,
    Zoom,
};

/// Velocity magnitudes for speed levels 3, 2 and 1 of one axis.
struct SpeedTable {
    double high   = 1.0;
    double medium = 0.5;
    double low    = 0.2;
};

/// Maps the 7-level controller speed (-3..+3) to a fractional device
/// velocity (-1.0..1.0) using a lookup table per axis.
///
/// Levels outside {-3,-2,-1,1,2,3} (including 0) yield 0.0.
class SpeedQuantizer {
public:
    SpeedQuantizer();
    SpeedQuantizer(const SpeedTable& pan, const SpeedTable& tilt,
                   const SpeedTable& zoom);

    double quantize(Axis axis, int level) const;

    const SpeedTable& table(Axis axis) const;

private:
    SpeedTable pan_;
    SpeedTable tilt_;
    SpeedTable zoom_;
};

/// Quantize with the default tables.
double quantize(Axis axis, int level);

const char* to_string(Axis axis);

} // namespace ptzgw
