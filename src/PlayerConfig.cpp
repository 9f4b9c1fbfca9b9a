#include <charconv>
#include <string_view>
#include "PlayerConfig.hpp"

namespace {

template <typename T>
bool parse_number(std::string_view text, T& out) {
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, out);
    return ec == std::errc() && ptr == last;
}

} // namespace

bool parse_command_line(int argc, const char* const* argv, PlayerConfig& config, std::ostream& err) {
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            config.show_help = true;
            continue;
        }

        if (arg.size() > 2 && arg.substr(0, 2) == "--") {
            if (i + 1 >= argc) {
                err << "Missing value for " << arg << std::endl;
                return false;
            }
            const std::string_view value = argv[++i];
            bool ok = true;
            if (arg == "--rate") {
                ok = parse_number(value, config.initial_rate);
            } else if (arg == "--mix") {
                ok = parse_number(value, config.initial_mix);
            } else if (arg == "--width") {
                ok = parse_number(value, config.canvas_width) && config.canvas_width > 0;
            } else if (arg == "--height") {
                ok = parse_number(value, config.canvas_height) && config.canvas_height > 0;
            } else if (arg == "--sample-rate") {
                ok = parse_number(value, config.sample_rate) && config.sample_rate > 0.0;
            } else if (arg == "--endpoint") {
                config.fetch_endpoint = std::string(value);
            } else {
                err << "Unknown option " << arg << std::endl;
                return false;
            }
            if (!ok) {
                err << "Invalid value for " << arg << ": " << value << std::endl;
                return false;
            }
            continue;
        }

        if (!config.source.empty()) {
            err << "Only one source may be given (already have " << config.source << ")" << std::endl;
            return false;
        }
        config.source = std::string(arg);
    }
    return true;
}

void print_usage(std::ostream& out, const char* program) {
    out << "Usage: " << program << " [options] <file.wav>\n"
        << "  --rate <0.5..1.5>      initial playback rate (default 1.0)\n"
        << "  --mix <0..1>           initial reverb mix (default 0)\n"
        << "  --width <columns>      waveform width in characters\n"
        << "  --height <rows>        waveform height in characters\n"
        << "  --sample-rate <hz>     output device sample rate (default 44100)\n"
        << "  --endpoint <path>      transcoding endpoint for remote sources\n"
        << "  -h, --help             show this message" << std::endl;
}
