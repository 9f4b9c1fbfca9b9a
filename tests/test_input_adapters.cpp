#include <iostream>
#include "FakeRenderSubsystem.hpp"
#include "InputAdapters.hpp"
#include "TimeFormat.hpp"

namespace {

bool test_ranges_and_scrub() {
    bool ok = expect(kRateControl.clamp(2.0) == 1.5 && kRateControl.clamp(0.1) == 0.5, "Rate control clamps.");
    ok &= expect(nearly_equal(kRateControl.from_fraction(0.5), 1.0), "Slider midpoint maps to rate 1.0.");
    ok &= expect(nearly_equal(kMixControl.to_fraction(0.35), 0.35), "Mix control maps directly to a fraction.");
    ok &= expect(nearly_equal(kRateControl.to_fraction(1.0), 0.5) && kRateControl.to_fraction(3.0) == 1.0,
                 "Rates map back to slider positions, clamped at the ends.");
    ok &= expect(kRateControl.from_fraction(-0.5) == 0.5, "Slider positions below 0 give the minimum rate.");

    ok &= expect(nearly_equal(scrub_target(200.0, 800.0, 60.0), 15.0), "Scrub maps x / width onto the duration.");
    ok &= expect(scrub_target(-10.0, 800.0, 60.0) == 0.0, "Scrub left of the canvas clamps to 0.");
    ok &= expect(scrub_target(10.0, 0.0, 60.0) == 0.0, "Scrub on a zero-width canvas is 0.");
    return ok;
}

bool test_parse_command() {
    bool ok = true;
    ok &= expect(parse_command("").kind == CommandKind::None, "Blank lines are ignored.");
    ok &= expect(parse_command("  play ").kind == CommandKind::Play, "Surrounding spaces are ignored.");
    ok &= expect(parse_command("p").kind == CommandKind::Toggle, "p toggles.");
    ok &= expect(parse_command("q").kind == CommandKind::Quit, "q quits.");

    const Command seek = parse_command("seek 12.5");
    ok &= expect(seek.kind == CommandKind::Seek && seek.value == 12.5, "seek takes seconds.");
    const Command rate = parse_command("rate 0.8");
    ok &= expect(rate.kind == CommandKind::Rate && rate.value == 0.8, "rate takes a value.");

    const Command load = parse_command("load my song.wav");
    ok &= expect(load.kind == CommandKind::Load && load.text == "my song.wav", "load keeps the whole path.");

    const Command missing = parse_command("mix");
    ok &= expect(missing.kind == CommandKind::Invalid && missing.text == "mix needs a number", "mix needs a value.");
    const Command unknown = parse_command("rewind");
    ok &= expect(unknown.kind == CommandKind::Invalid && unknown.text == "unknown command: rewind",
                 "Unknown commands are reported.");
    ok &= expect(parse_command("load").kind == CommandKind::Invalid, "load needs a path.");
    return ok;
}

bool test_time_format() {
    bool ok = true;
    ok &= expect(format_time(0.0) == "0:00", "Zero formats as 0:00.");
    ok &= expect(format_time(59.99) == "0:59", "Seconds are truncated.");
    ok &= expect(format_time(125.4) == "2:05", "Minutes and padded seconds.");
    ok &= expect(format_time(-3.0) == "0:00", "Negative times show 0:00.");
    ok &= expect(format_rate(1.0) == "1.00x" && format_rate(0.75) == "0.75x", "Rates show two decimals.");
    ok &= expect(format_percent(0.35) == "35%" && format_percent(1.0) == "100%", "Mix shows a whole percentage.");
    return ok;
}

} // namespace

int main() {
    bool ok = true;
    ok &= test_ranges_and_scrub();
    ok &= test_parse_command();
    ok &= test_time_format();
    if (!ok) {
        return 1;
    }
    std::cout << "[Test] Input adapter checks passed." << std::endl;
    return 0;
}
