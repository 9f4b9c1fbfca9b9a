#include <algorithm>
#include "WaveformRenderer.hpp"

WaveformEnvelope compute_envelope(const SampleBuffer& buffer, int channel, int pixel_width) {
    if (pixel_width <= 0) {
        return {};
    }

    const std::vector<float>& data = buffer.channel(channel);
    const std::size_t columns = static_cast<std::size_t>(pixel_width);
    WaveformEnvelope envelope(columns);
    if (data.empty()) {
        return envelope;
    }

    const std::size_t step = (data.size() + columns - 1) / columns;
    for (std::size_t column = 0; column < columns; ++column) {
        const std::size_t begin = column * step;
        if (begin >= data.size()) {
            break;
        }
        const std::size_t end = std::min(begin + step, data.size());
        const auto [lowest, highest] = std::minmax_element(data.begin() + static_cast<std::ptrdiff_t>(begin),
                                                           data.begin() + static_cast<std::ptrdiff_t>(end));
        envelope[column] = EnvelopeColumn{*lowest, *highest};
    }
    return envelope;
}

void WaveformRenderer::set_buffer(std::shared_ptr<const SampleBuffer> buffer) {
    buffer_ = std::move(buffer);
    recompute();
}

void WaveformRenderer::resize(int width, int height) {
    height_ = std::max(height, 0);
    const int new_width = std::max(width, 0);
    if (new_width != width_) {
        width_ = new_width;
        recompute();
    }
}

double WaveformRenderer::playhead_x(double position, double duration) const {
    if (duration <= 0.0) {
        return 0.0;
    }
    return std::clamp(position / duration, 0.0, 1.0) * width_;
}

void WaveformRenderer::draw(Canvas& canvas, double position, double duration) const {
    canvas.clear();
    if (!buffer_) {
        return;
    }

    // Sample range [-1, 1] maps onto [0, height].
    const double amp = canvas.height() / 2.0;
    for (std::size_t x = 0; x < envelope_.size(); ++x) {
        const EnvelopeColumn& column = envelope_[x];
        canvas.draw_vertical_line(static_cast<int>(x), (1.0 + column.min) * amp, (1.0 + column.max) * amp);
    }

    canvas.fill_rect(playhead_x(position, duration), 0.0, kPlayheadWidth, canvas.height());
}

void WaveformRenderer::recompute() {
    if (!buffer_ || width_ == 0) {
        envelope_.clear();
        return;
    }
    envelope_ = compute_envelope(*buffer_, 0, width_);
}
