#include <cmath>
#include <cstdio>
#include "TimeFormat.hpp"

std::string format_time(double seconds) {
    if (!(seconds > 0.0)) {
        seconds = 0.0;
    }
    const long long whole = static_cast<long long>(std::floor(seconds));
    char text[32];
    std::snprintf(text, sizeof(text), "%lld:%02lld", whole / 60, whole % 60);
    return text;
}

std::string format_rate(double rate) {
    char text[32];
    std::snprintf(text, sizeof(text), "%.2fx", rate);
    return text;
}

std::string format_percent(double amount) {
    char text[32];
    std::snprintf(text, sizeof(text), "%ld%%", std::lround(amount * 100.0));
    return text;
}
