#pragma once

#include <string_view>

// Outcome of an engine operation. Out-of-range inputs are clamped and
// therefore never produce a status of their own.
enum class Status {
    Ok,
    NotReady,       // No buffer loaded, or rendering not yet permitted.
    DecodeFailure,  // Bytes could not be parsed as audio.
    FetchFailure,   // Source unreachable, invalid, or remote processing failed.
};

enum class TransportState {
    Stopped,
    Playing,
    Paused,
};

enum class LoadState {
    Idle,
    Loading,
    Ready,
    Error,
};

std::string_view to_string(Status status);
std::string_view to_string(TransportState state);
std::string_view to_string(LoadState state);
