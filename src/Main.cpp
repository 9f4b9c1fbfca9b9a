#include <iostream>
#include <memory>
#include "AudioEngine.hpp"
#include "PlayerConfig.hpp"

#ifdef __EMSCRIPTEN__
#include "WebAudioEngine.hpp"
#include "WebPlayer.hpp"
#else
#include "Decoder.hpp"
#include "InputAdapters.hpp"
#include "MixerRenderSubsystem.hpp"
#include "NativeEventLoop.hpp"
#include "PlayerSession.hpp"
#include "PortAudioEngine.hpp"
#include "SourceFetcher.hpp"
#include "TerminalView.hpp"
#include "TimeFormat.hpp"
#endif

// A unique_ptr to the engine to manage its lifetime.
std::unique_ptr<AudioEngine> engine;

// Startup settings; the browser overrides the sample rate.
static PlayerConfig g_config;

#ifdef __EMSCRIPTEN__
// This C function will be called from JavaScript to set the correct sample
// rate. The player is built once the page knows its AudioContext rate.
extern "C" void set_sample_rate(double sample_rate) {
    std::cout << "C++: Sample rate set to " << sample_rate << " Hz." << std::endl;
    g_config.sample_rate = sample_rate;
    if (engine) {
        start_web_player(*engine, g_config);
    }
}
#endif

// The factory function that selects the correct audio engine implementation.
std::unique_ptr<AudioEngine> create_audio_engine() {
#ifdef __EMSCRIPTEN__
    return std::make_unique<WebAudioEngine>();
#else
    return std::make_unique<PortAudioEngine>();
#endif
}

#ifndef __EMSCRIPTEN__
namespace {

void print_commands() {
    std::cout << "\nCommands: play | pause | toggle (p) | stop | seek <s> | scrub <column> | rate <0.5-1.5>\n"
              << "          mix <0-1> | wave | status | load <file> | help | quit (q)" << std::endl;
}

// Runs the terminal player until the user quits or input ends.
int run_terminal_player(AudioEngine& audio_engine, const PlayerConfig& config) {
    MixerRenderSubsystem renderer(audio_engine, config.sample_rate, config.reverb_seconds);
    if (!renderer.start()) {
        std::cerr << "Failed to start audio output." << std::endl;
        return 1;
    }

    NativeEventLoop loop;
    TerminalView view(std::cout);
    PlayerSession session(renderer, loop, view, config);
    FileFetcher fetcher;
    WavDecoder decoder;

    if (!config.source.empty()) {
        session.load_source(config.source, fetcher, decoder);
    }
    print_commands();

    loop.run([&](const std::string& line) {
        const Command command = parse_command(line);
        Status status = Status::Ok;
        switch (command.kind) {
        case CommandKind::None:
            break;
        case CommandKind::Play: status = session.play(); break;
        case CommandKind::Pause: session.pause(); break;
        case CommandKind::Toggle: status = session.toggle_play_pause(); break;
        case CommandKind::Stop: session.stop(); break;
        case CommandKind::Seek: status = session.seek(command.value); break;
        case CommandKind::Scrub: status = session.scrub(command.value, session.waveform().width()); break;
        case CommandKind::Rate: session.set_rate(command.value); break;
        case CommandKind::Mix: session.set_mix(command.value); break;
        case CommandKind::Load: session.load_source(command.text, fetcher, decoder); break;
        case CommandKind::Wave: {
            const PlayerSnapshot snapshot = session.snapshot();
            view.print_waveform(snapshot, session.waveform());
            break;
        }
        case CommandKind::Status: {
            const PlayerSnapshot snapshot = session.snapshot();
            std::cout << "\n" << to_string(snapshot.transport) << " at " << format_time(snapshot.position)
                      << " of " << format_time(snapshot.duration) << ", load " << to_string(snapshot.load_state)
                      << std::endl;
            break;
        }
        case CommandKind::Help: print_commands(); break;
        case CommandKind::Quit: loop.quit(); break;
        case CommandKind::Invalid:
            std::cout << "\n" << command.text << std::endl;
            break;
        }
        if (status != Status::Ok) {
            std::cout << "\nPlayer: " << to_string(status) << std::endl;
        }
    });

    session.stop();
    renderer.stop();
    return 0;
}

} // namespace
#endif

int main(int argc, char** argv) {
#ifndef __EMSCRIPTEN__
    if (!parse_command_line(argc, argv, g_config, std::cerr)) {
        print_usage(std::cerr, argv[0]);
        return 2;
    }
    if (g_config.show_help) {
        print_usage(std::cout, argv[0]);
        return 0;
    }
    // Terminal cells stand in for canvas pixels.
    if (g_config.canvas_width == PlayerConfig{}.canvas_width) {
        g_config.canvas_width = 72;
    }
    if (g_config.canvas_height == PlayerConfig{}.canvas_height) {
        g_config.canvas_height = 12;
    }
#else
    (void)argc;
    (void)argv;
#endif

    engine = create_audio_engine();
    if (!engine) {
        std::cerr << "Failed to create audio engine." << std::endl;
        return 1;
    }

#ifndef __EMSCRIPTEN__
    const int result = run_terminal_player(*engine, g_config);
    engine->stop();
    return result;
#else
    std::cout << "C++ audio engine initialized. Control playback from the web page." << std::endl;
    return 0;
#endif
}
