#include <iostream>
#include <sstream>
#include "FakeRenderSubsystem.hpp"
#include "TerminalView.hpp"

int main() {
    bool ok = true;

    PlayerSnapshot snapshot;
    snapshot.transport = TransportState::Playing;
    snapshot.position = 75.9;
    snapshot.duration = 200.0;
    snapshot.rate = 0.85;
    snapshot.mix = 0.35;
    snapshot.load_state = LoadState::Ready;
    snapshot.source_name = "night.wav";
    ok &= expect(TerminalView::status_line(snapshot) == "> 1:15 / 3:20  speed 0.85x  reverb 35%  night.wav",
                 "Status line shows state, times, rate, mix and source.");

    snapshot.transport = TransportState::Paused;
    snapshot.load_state = LoadState::Loading;
    snapshot.source_name = "next.wav";
    ok &= expect(TerminalView::status_line(snapshot).find("loading next.wav...") != std::string::npos,
                 "Loading shows the pending source.");

    std::ostringstream out;
    TerminalView view(out);
    WaveformRenderer waveform;
    snapshot.load_state = LoadState::Ready;
    view.update(snapshot, waveform);
    const std::string first = out.str();
    view.update(snapshot, waveform);
    ok &= expect(out.str() == first, "An unchanged status line is not rewritten.");

    snapshot.message = "decode failure";
    view.update(snapshot, waveform);
    ok &= expect(out.str().find("Error: decode failure") != std::string::npos, "Load errors are printed once.");

    view.print_waveform(snapshot, waveform);
    ok &= expect(out.str().find("(no waveform)") != std::string::npos, "No audio prints a placeholder.");

    waveform.resize(10, 4);
    waveform.set_buffer(make_test_buffer(1.0));
    std::ostringstream drawn;
    TerminalView wave_view(drawn);
    snapshot.position = 0.0;
    snapshot.duration = 1.0;
    wave_view.print_waveform(snapshot, waveform);
    ok &= expect(drawn.str().find("##") != std::string::npos, "The waveform shows the playhead.");
    ok &= expect(drawn.str().find('|') != std::string::npos, "The waveform shows the envelope.");

    if (!ok) {
        return 1;
    }
    std::cout << "[Test] Terminal view checks passed." << std::endl;
    return 0;
}
