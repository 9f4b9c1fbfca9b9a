#include <algorithm>
#include <sstream>
#include "InputAdapters.hpp"

double ControlRange::clamp(double value) const {
    return std::clamp(value, min, max);
}

double ControlRange::from_fraction(double fraction) const {
    return min + std::clamp(fraction, 0.0, 1.0) * (max - min);
}

double ControlRange::to_fraction(double value) const {
    if (max <= min) {
        return 0.0;
    }
    return (clamp(value) - min) / (max - min);
}

double scrub_target(double x, double width, double duration) {
    if (width <= 0.0 || duration <= 0.0) {
        return 0.0;
    }
    return std::clamp(x / width, 0.0, 1.0) * duration;
}

Command parse_command(const std::string& line) {
    std::istringstream in(line);
    std::string word;
    if (!(in >> word)) {
        return {};
    }

    struct Named {
        const char* name;
        CommandKind kind;
        bool needs_value;
    };
    static const Named kCommands[] = {
        {"play", CommandKind::Play, false},   {"pause", CommandKind::Pause, false},
        {"toggle", CommandKind::Toggle, false}, {"p", CommandKind::Toggle, false},
        {"stop", CommandKind::Stop, false},   {"seek", CommandKind::Seek, true},
        {"scrub", CommandKind::Scrub, true},  {"rate", CommandKind::Rate, true},
        {"mix", CommandKind::Mix, true},      {"wave", CommandKind::Wave, false},
        {"status", CommandKind::Status, false}, {"help", CommandKind::Help, false},
        {"quit", CommandKind::Quit, false},   {"q", CommandKind::Quit, false},
    };

    if (word == "load") {
        std::string path;
        std::getline(in >> std::ws, path);
        if (path.empty()) {
            return Command{CommandKind::Invalid, 0.0, "load needs a path"};
        }
        return Command{CommandKind::Load, 0.0, path};
    }

    for (const Named& named : kCommands) {
        if (word != named.name) {
            continue;
        }
        Command command{named.kind, 0.0, {}};
        if (named.needs_value && !(in >> command.value)) {
            return Command{CommandKind::Invalid, 0.0, word + " needs a number"};
        }
        return command;
    }
    return Command{CommandKind::Invalid, 0.0, "unknown command: " + word};
}
