#include "ptzgw/speed.hpp"

namespace ptzgw {

SpeedQuantizer::SpeedQuantizer()
    : pan_{PAN_HIGH_SPEED, PAN_MEDIUM_SPEED, PAN_LOW_SPEED}
    , tilt_{TILT_HIGH_SPEED, TILT_MEDIUM_SPEED, TILT_LOW_SPEED}
    , zoom_{ZOOM_HIGH_SPEED, ZOOM_MEDIUM_SPEED, ZOOM_LOW_SPEED} {
}

SpeedQuantizer::SpeedQuantizer(const SpeedTable& pan, const SpeedTable& tilt,
                               const SpeedTable& zoom)
    : pan_(pan), tilt_(tilt), zoom_(zoom) {
}

const SpeedTable& SpeedQuantizer::table(Axis axis) const {
    switch (axis) {
        case Axis::Tilt: return tilt_;
        case Axis::Zoom: return zoom_;
        case Axis::Pan:  break;
    }
    return pan_;
}

double SpeedQuantizer::quantize(Axis axis, int level) const {
    const SpeedTable& t = table(axis);
    switch (level) {
        case -HIGH_SPEED:   return -t.high;
        case -MEDIUM_SPEED: return -t.medium;
        case -LOW_SPEED:    return -t.low;
        case LOW_SPEED:     return t.low;
        case MEDIUM_SPEED:  return t.medium;
        case HIGH_SPEED:    return t.high;
        default:            return 0.0;
    }
}

double quantize(Axis axis, int level) {
    static const SpeedQuantizer defaults;
    return defaults.quantize(axis, level);
}

const char* to_string(Axis axis) {
    switch (axis) {
        case Axis::Pan:  return "pan";
        case Axis::Tilt: return "tilt";
        case Axis::Zoom: return "zoom";
    }
    return "unknown";
}

} // namespace ptzgw
