#pragma once

#include "AudioEngine.hpp"
#include "PlayerConfig.hpp"

// Builds the browser player around `engine` (once; later calls keep it) and
// exposes it to the page through the player_* C entry points.
bool start_web_player(AudioEngine& engine, const PlayerConfig& config);
