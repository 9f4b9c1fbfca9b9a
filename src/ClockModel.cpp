#include "ClockModel.hpp"

double position(const Anchor& anchor, double device_time_now) {
    return anchor.buffer_position + (device_time_now - anchor.device_time) * anchor.rate;
}
