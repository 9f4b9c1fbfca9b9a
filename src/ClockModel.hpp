#pragma once

// Reference point pinning a buffer offset to a device clock time.
// Recorded whenever playback (re)starts or the rate changes.
struct Anchor {
    double device_time{0.0};      // Device clock seconds at the anchor.
    double buffer_position{0.0};  // Seconds into the buffer at the anchor.
    double rate{1.0};             // Playback rate in effect since the anchor.
};

// Buffer position at device_time_now, extrapolated from the anchor.
// Device time is monotonic by contract of its source, so there are no error cases.
double position(const Anchor& anchor, double device_time_now);
