#pragma once

#include <ostream>
#include <string>

// Startup settings. Defaults match a browser page with an 800x150 canvas.
struct PlayerConfig {
    double sample_rate{44100.0};   // Device rate requested from the audio backend.
    double initial_rate{1.0};
    double initial_mix{0.0};
    int canvas_width{800};
    int canvas_height{150};
    double reverb_seconds{2.0};    // Length of the generated impulse response.
    std::string fetch_endpoint{"/api/process-youtube"};
    std::string source;            // File path or URL to load at startup.
    bool show_help{false};
};

// Fills `config` from command-line flags. Unknown flags and malformed values
// are reported to `err` and make the call return false.
bool parse_command_line(int argc, const char* const* argv, PlayerConfig& config, std::ostream& err);

void print_usage(std::ostream& out, const char* program);
