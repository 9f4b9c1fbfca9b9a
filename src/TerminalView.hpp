#pragma once

#include <ostream>
#include <string>
#include <vector>

#include "PlayerSession.hpp"
#include "WaveformRenderer.hpp"

// Character-cell canvas. Each cell is one pixel; y grows down.
class TextCanvas final : public Canvas {
public:
    TextCanvas(int width, int height);

    int width() const override { return width_; }
    int height() const override { return height_; }
    void clear() override;
    void draw_vertical_line(int x, double y_from, double y_to) override;
    void fill_rect(double x, double y, double w, double h) override;

    char at(int x, int y) const;
    std::string to_string() const;

private:
    int width_;
    int height_;
    std::vector<std::string> rows_;
};

// Prints the UI contract to a terminal: a status line rewritten in place
// on every update, and the waveform on request.
class TerminalView final : public PlayerView {
public:
    explicit TerminalView(std::ostream& out);

    void update(const PlayerSnapshot& snapshot, const WaveformRenderer& waveform) override;

    // Draws the envelope and playhead below the status line.
    void print_waveform(const PlayerSnapshot& snapshot, const WaveformRenderer& waveform);

    static std::string status_line(const PlayerSnapshot& snapshot);

private:
    std::ostream& out_;
    std::string last_line_;
    std::string last_message_;
};
