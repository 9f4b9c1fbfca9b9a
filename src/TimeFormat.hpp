#pragma once

#include <string>

// "m:ss", seconds truncated. Negative input renders as 0:00.
std::string format_time(double seconds);

// "1.00x"
std::string format_rate(double rate);

// Mix amount in [0, 1] as a rounded percentage, e.g. "35%".
std::string format_percent(double amount);
