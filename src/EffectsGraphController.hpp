#pragma once

#include "RenderSubsystem.hpp"

struct MixGains {
    double dry{1.0};
    double wet{0.0};
};

// Owns the reverb mix and keeps the live chain's gains in step with it.
class EffectsGraphController {
public:
    // The wet return is boosted: the reverb output is perceptually quiet next
    // to the dry signal, so the crossfade is linear on the dry side and doubled
    // on the wet side. It is not energy preserving.
    static constexpr double kWetBoost = 2.0;

    explicit EffectsGraphController(RenderSubsystem& renderer);

    // Asks the render subsystem to (re)build the dry/wet paths for a new buffer.
    bool on_buffer_loaded(const SampleBuffer& buffer);

    // Clamps to [0, 1]. Pushes new gains to the attached chain, if any.
    void set_mix(double amount);
    double mix() const { return mix_; }
    MixGains gains() const { return gains_for(mix_); }

    // Binds the controller to a freshly built chain and applies the current gains.
    void attach(ChainHandle chain);
    void detach();
    ChainHandle attached_chain() const { return chain_; }

    static MixGains gains_for(double amount);

private:
    RenderSubsystem& renderer_;
    double mix_{0.0};
    ChainHandle chain_{kNoChain};
};
