#include <algorithm>
#include <iostream>
#include "EffectsGraphController.hpp"

EffectsGraphController::EffectsGraphController(RenderSubsystem& renderer)
    : renderer_(renderer) {}

bool EffectsGraphController::on_buffer_loaded(const SampleBuffer& buffer) {
    detach();
    if (!renderer_.configure_effects(buffer.sample_rate())) {
        std::cerr << "Effects: could not configure reverb for " << buffer.sample_rate() << " Hz." << std::endl;
        return false;
    }
    return true;
}

void EffectsGraphController::set_mix(double amount) {
    mix_ = std::clamp(amount, 0.0, 1.0);
    if (chain_ != kNoChain) {
        const MixGains gains = gains_for(mix_);
        renderer_.set_gains(chain_, gains.dry, gains.wet);
    }
}

void EffectsGraphController::attach(ChainHandle chain) {
    chain_ = chain;
    if (chain_ != kNoChain) {
        const MixGains gains = gains_for(mix_);
        renderer_.set_gains(chain_, gains.dry, gains.wet);
    }
}

void EffectsGraphController::detach() {
    chain_ = kNoChain;
}

MixGains EffectsGraphController::gains_for(double amount) {
    const double clamped = std::clamp(amount, 0.0, 1.0);
    return MixGains{1.0 - clamped, clamped * kWetBoost};
}
