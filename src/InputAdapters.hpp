#pragma once

#include <string>

// Numeric range behind a slider. The page's sliders send a position in
// [0, 1] and read one back; the engine sees values within [min, max].
struct ControlRange {
    double min{0.0};
    double max{1.0};

    double clamp(double value) const;
    double from_fraction(double fraction) const;
    double to_fraction(double value) const;
};

constexpr ControlRange kRateControl{0.5, 1.5};
constexpr ControlRange kMixControl{0.0, 1.0};

// Seek target for a click at `x` on a waveform `width` pixels wide.
double scrub_target(double x, double width, double duration);

enum class CommandKind {
    None,
    Play,
    Pause,
    Toggle,
    Stop,
    Seek,
    Scrub,
    Rate,
    Mix,
    Load,
    Wave,
    Status,
    Help,
    Quit,
    Invalid,
};

struct Command {
    CommandKind kind{CommandKind::None};
    double value{0.0};
    std::string text;  // Load path, or the reason an input was invalid.
};

// Parses one line of terminal input ("seek 12.5", "rate 0.8", "load a.wav").
Command parse_command(const std::string& line);
