#include <iostream>
#include <vector>
#include "FakeRenderSubsystem.hpp"
#include "TerminalView.hpp"
#include "WaveformRenderer.hpp"

namespace {

struct Line {
    int x;
    double from;
    double to;
};

// Records draw calls instead of rasterizing them.
class RecordingCanvas final : public Canvas {
public:
    RecordingCanvas(int width, int height) : width_(width), height_(height) {}

    int width() const override { return width_; }
    int height() const override { return height_; }
    void clear() override {
        ++clears;
        lines.clear();
    }
    void draw_vertical_line(int x, double y_from, double y_to) override { lines.push_back({x, y_from, y_to}); }
    void fill_rect(double x, double y, double w, double h) override {
        marker_x = x;
        marker_y = y;
        marker_w = w;
        marker_h = h;
    }

    std::vector<Line> lines;
    int clears{0};
    double marker_x{-1.0};
    double marker_y{-1.0};
    double marker_w{0.0};
    double marker_h{0.0};

private:
    int width_;
    int height_;
};

SampleBuffer make_buffer(std::vector<float> samples) {
    return SampleBuffer({std::move(samples)}, 8.0);
}

bool test_ceil_windows() {
    // 10 samples over 4 columns: windows of 3, 3, 3, 1.
    const SampleBuffer buffer = make_buffer({0.1f, -0.2f, 0.3f, 0.5f, 0.4f, -0.6f, 0.0f, 0.9f, -0.1f, -0.7f});
    const WaveformEnvelope envelope = compute_envelope(buffer, 0, 4);
    bool ok = expect(envelope.size() == 4, "Envelope should have one column per pixel.");
    ok &= expect(envelope[0] == (EnvelopeColumn{-0.2f, 0.3f}), "First window spans samples 0..2.");
    ok &= expect(envelope[1] == (EnvelopeColumn{-0.6f, 0.5f}), "Second window spans samples 3..5.");
    ok &= expect(envelope[2] == (EnvelopeColumn{-0.1f, 0.9f}), "Third window spans samples 6..8.");
    ok &= expect(envelope[3] == (EnvelopeColumn{-0.7f, -0.7f}), "Final window holds the one remaining sample.");
    return ok;
}

bool test_empty_tail_windows() {
    // 3 samples over 5 columns: one sample per column, then two empty columns.
    const SampleBuffer buffer = make_buffer({0.5f, -0.5f, 0.25f});
    const WaveformEnvelope envelope = compute_envelope(buffer, 0, 5);
    bool ok = expect(envelope.size() == 5, "Short buffers still fill the width.");
    ok &= expect(envelope[2] == (EnvelopeColumn{0.25f, 0.25f}), "Column 2 holds the last sample.");
    ok &= expect(envelope[3] == EnvelopeColumn{} && envelope[4] == EnvelopeColumn{}, "Empty windows report (0, 0).");
    ok &= expect(compute_envelope(buffer, 0, 0).empty(), "Zero width gives an empty envelope.");
    ok &= expect(compute_envelope(buffer, 3, 4) == WaveformEnvelope(4), "A missing channel gives flat columns.");
    return ok;
}

bool test_determinism() {
    const auto buffer = make_test_buffer(3.0, 44100.0);
    const WaveformEnvelope first = compute_envelope(*buffer, 0, 800);
    const WaveformEnvelope second = compute_envelope(*buffer, 0, 800);
    return expect(first == second && first.size() == 800, "Same buffer and width must give the same envelope.");
}

bool test_resize_recomputes_only_on_width_change() {
    WaveformRenderer renderer;
    renderer.resize(100, 40);
    renderer.set_buffer(make_test_buffer(2.0));
    bool ok = expect(renderer.envelope().size() == 100, "The envelope follows the canvas width.");
    renderer.resize(100, 60);
    ok &= expect(renderer.height() == 60 && renderer.envelope().size() == 100, "Height-only resize keeps the envelope.");
    renderer.resize(50, 60);
    ok &= expect(renderer.envelope().size() == 50, "Width changes recompute the envelope.");
    renderer.set_buffer(nullptr);
    ok &= expect(renderer.envelope().empty(), "Clearing the buffer clears the envelope.");
    return ok;
}

bool test_draw_geometry() {
    WaveformRenderer renderer;
    renderer.resize(4, 100);
    renderer.set_buffer(std::make_shared<const SampleBuffer>(
        std::vector<std::vector<float>>{{-1.0f, 1.0f, -0.5f, 0.5f, 0.0f, 0.0f, 0.2f, 0.2f}}, 8.0));

    RecordingCanvas canvas(4, 100);
    renderer.draw(canvas, 0.5, 1.0);
    bool ok = expect(canvas.clears == 1 && canvas.lines.size() == 4, "One line per envelope column.");
    ok &= expect(nearly_equal(canvas.lines[0].from, 0.0) && nearly_equal(canvas.lines[0].to, 100.0),
                 "Full-scale column spans the whole height.");
    ok &= expect(nearly_equal(canvas.lines[1].from, 25.0) && nearly_equal(canvas.lines[1].to, 75.0),
                 "Half-scale column spans the middle half.");
    ok &= expect(nearly_equal(canvas.marker_x, 2.0) && canvas.marker_w == WaveformRenderer::kPlayheadWidth &&
                     canvas.marker_y == 0.0 && canvas.marker_h == 100.0,
                 "The playhead is a full-height 2px bar at position / duration * width.");

    renderer.draw(canvas, 5.0, 1.0);
    ok &= expect(nearly_equal(canvas.marker_x, 4.0), "The playhead never passes the right edge.");
    return ok;
}

bool test_text_canvas() {
    WaveformRenderer renderer;
    renderer.resize(8, 4);
    renderer.set_buffer(std::make_shared<const SampleBuffer>(
        std::vector<std::vector<float>>{std::vector<float>(8, 0.0f)}, 8.0));
    TextCanvas canvas(8, 4);
    renderer.draw(canvas, 0.0, 1.0);
    bool ok = expect(canvas.at(0, 0) == '#' && canvas.at(1, 3) == '#', "The playhead fills its columns.");
    ok &= expect(canvas.at(5, 2) == '|' && canvas.at(5, 0) == ' ', "Silence draws a one-cell line at the center.");
    ok &= expect(canvas.to_string().size() == 4 * 9, "Each row ends with a newline.");
    return ok;
}

} // namespace

int main() {
    bool ok = true;
    ok &= test_ceil_windows();
    ok &= test_empty_tail_windows();
    ok &= test_determinism();
    ok &= test_resize_recomputes_only_on_width_change();
    ok &= test_draw_geometry();
    ok &= test_text_canvas();
    if (!ok) {
        return 1;
    }
    std::cout << "[Test] Waveform renderer checks passed." << std::endl;
    return 0;
}
