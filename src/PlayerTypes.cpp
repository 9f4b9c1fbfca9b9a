#include "PlayerTypes.hpp"

std::string_view to_string(Status status) {
    switch (status) {
    case Status::Ok: return "ok";
    case Status::NotReady: return "not ready";
    case Status::DecodeFailure: return "decode failure";
    case Status::FetchFailure: return "fetch failure";
    }
    return "unknown";
}

std::string_view to_string(TransportState state) {
    switch (state) {
    case TransportState::Stopped: return "Stopped";
    case TransportState::Playing: return "Playing";
    case TransportState::Paused: return "Paused";
    }
    return "Unknown";
}

std::string_view to_string(LoadState state) {
    switch (state) {
    case LoadState::Idle: return "idle";
    case LoadState::Loading: return "loading";
    case LoadState::Ready: return "ready";
    case LoadState::Error: return "error";
    }
    return "unknown";
}
