#include <algorithm>
#include <cmath>
#include "TerminalView.hpp"
#include "TimeFormat.hpp"

TextCanvas::TextCanvas(int width, int height)
    : width_(std::max(width, 0)), height_(std::max(height, 0)),
      rows_(static_cast<std::size_t>(height_), std::string(static_cast<std::size_t>(width_), ' ')) {}

void TextCanvas::clear() {
    for (auto& row : rows_) {
        std::fill(row.begin(), row.end(), ' ');
    }
}

void TextCanvas::draw_vertical_line(int x, double y_from, double y_to) {
    if (x < 0 || x >= width_ || height_ == 0) {
        return;
    }
    const double top = std::min(y_from, y_to);
    const double bottom = std::max(y_from, y_to);
    const int first = std::clamp(static_cast<int>(std::floor(top)), 0, height_ - 1);
    const int last = std::clamp(static_cast<int>(std::ceil(bottom)) - 1, first, height_ - 1);
    for (int y = first; y <= last; ++y) {
        rows_[static_cast<std::size_t>(y)][static_cast<std::size_t>(x)] = '|';
    }
}

void TextCanvas::fill_rect(double x, double y, double w, double h) {
    if (width_ == 0 || height_ == 0) {
        return;
    }
    // Covers at least one cell, and a marker at the right edge stays visible.
    const int x0 = std::clamp(static_cast<int>(std::floor(x)), 0, width_ - 1);
    const int x1 = std::clamp(static_cast<int>(std::ceil(x + w)), x0 + 1, width_);
    const int y0 = std::clamp(static_cast<int>(std::floor(y)), 0, height_);
    const int y1 = std::clamp(static_cast<int>(std::ceil(y + h)), y0, height_);
    for (int row = y0; row < y1; ++row) {
        for (int col = x0; col < x1; ++col) {
            rows_[static_cast<std::size_t>(row)][static_cast<std::size_t>(col)] = '#';
        }
    }
}

char TextCanvas::at(int x, int y) const {
    if (x < 0 || x >= width_ || y < 0 || y >= height_) {
        return ' ';
    }
    return rows_[static_cast<std::size_t>(y)][static_cast<std::size_t>(x)];
}

std::string TextCanvas::to_string() const {
    std::string text;
    for (const auto& row : rows_) {
        text += row;
        text += '\n';
    }
    return text;
}

TerminalView::TerminalView(std::ostream& out) : out_(out) {}

std::string TerminalView::status_line(const PlayerSnapshot& snapshot) {
    std::string line;
    switch (snapshot.transport) {
    case TransportState::Playing: line = "> "; break;
    case TransportState::Paused: line = "= "; break;
    case TransportState::Stopped: line = ". "; break;
    }
    line += format_time(snapshot.position) + " / " + format_time(snapshot.duration);
    line += "  speed " + format_rate(snapshot.rate);
    line += "  reverb " + format_percent(snapshot.mix);
    if (snapshot.load_state == LoadState::Loading) {
        line += "  loading " + snapshot.source_name + "...";
    } else if (!snapshot.source_name.empty()) {
        line += "  " + snapshot.source_name;
    }
    return line;
}

void TerminalView::update(const PlayerSnapshot& snapshot, const WaveformRenderer& waveform) {
    (void)waveform;
    if (snapshot.message != last_message_ && !snapshot.message.empty()) {
        out_ << "\nError: " << snapshot.message << '\n';
        last_line_.clear();
    }
    last_message_ = snapshot.message;

    const std::string line = status_line(snapshot);
    if (line == last_line_) {
        return;
    }
    // Pad so a shorter line fully overwrites the previous one.
    const std::size_t width = std::max(line.size(), last_line_.size());
    out_ << '\r' << line << std::string(width - line.size(), ' ') << std::flush;
    last_line_ = line;
}

void TerminalView::print_waveform(const PlayerSnapshot& snapshot, const WaveformRenderer& waveform) {
    if (waveform.envelope().empty()) {
        out_ << "\n(no waveform)\n";
        last_line_.clear();
        return;
    }
    TextCanvas canvas(waveform.width(), waveform.height());
    waveform.draw(canvas, snapshot.position, snapshot.duration);
    out_ << '\n' << canvas.to_string();
    last_line_.clear();
    update(snapshot, waveform);
}
