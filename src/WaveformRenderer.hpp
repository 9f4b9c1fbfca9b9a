#pragma once

#include <memory>
#include <vector>

#include "SampleBuffer.hpp"

// Smallest and largest sample seen in one pixel column.
struct EnvelopeColumn {
    float min{0.0f};
    float max{0.0f};

    bool operator==(const EnvelopeColumn&) const = default;
};

using WaveformEnvelope = std::vector<EnvelopeColumn>;

// Splits the channel into pixel_width windows of ceil(frames / pixel_width)
// samples and records each window's extremes. Windows past the end of the
// data report (0, 0). Lossy, for display only.
WaveformEnvelope compute_envelope(const SampleBuffer& buffer, int channel, int pixel_width);

// Drawing surface for the waveform. Coordinates are in pixels, y grows down.
class Canvas {
public:
    virtual ~Canvas() = default;

    virtual int width() const = 0;
    virtual int height() const = 0;
    virtual void clear() = 0;
    virtual void draw_vertical_line(int x, double y_from, double y_to) = 0;
    virtual void fill_rect(double x, double y, double w, double h) = 0;
};

// Holds the envelope for the current buffer and canvas width and draws it
// together with the playhead marker.
class WaveformRenderer {
public:
    static constexpr double kPlayheadWidth = 2.0;

    // Replacing the buffer recomputes the envelope; null clears it.
    void set_buffer(std::shared_ptr<const SampleBuffer> buffer);

    // Recomputes the envelope only when the width changes.
    void resize(int width, int height);

    const WaveformEnvelope& envelope() const { return envelope_; }
    int width() const { return width_; }
    int height() const { return height_; }

    // Horizontal pixel of the playhead for a position in seconds.
    double playhead_x(double position, double duration) const;

    void draw(Canvas& canvas, double position, double duration) const;

private:
    void recompute();

    std::shared_ptr<const SampleBuffer> buffer_;
    WaveformEnvelope envelope_;
    int width_{0};
    int height_{0};
};
