#include <iostream>
#include "EffectsGraphController.hpp"
#include "FakeRenderSubsystem.hpp"
#include "PlaybackStateMachine.hpp"

int main() {
    bool ok = true;

    const MixGains dry_only = EffectsGraphController::gains_for(0.0);
    ok &= expect(dry_only.dry == 1.0 && dry_only.wet == 0.0, "Mix 0 should give dry 1.0 and wet 0.0.");
    const MixGains wet_only = EffectsGraphController::gains_for(1.0);
    ok &= expect(wet_only.dry == 0.0 && wet_only.wet == 2.0, "Mix 1 should give dry 0.0 and wet 2.0.");
    const MixGains half = EffectsGraphController::gains_for(0.25);
    ok &= expect(nearly_equal(half.dry, 0.75) && nearly_equal(half.wet, 0.5), "Mix 0.25 should give 0.75 / 0.5.");

    FakeRenderSubsystem renderer;
    EffectsGraphController effects(renderer);
    effects.set_mix(1.7);
    ok &= expect(effects.mix() == 1.0, "Mix above 1 is clamped.");
    effects.set_mix(-0.2);
    ok &= expect(effects.mix() == 0.0, "Mix below 0 is clamped.");

    PlaybackStateMachine transport(renderer, effects);
    const auto buffer = make_test_buffer(4.0);
    ok &= expect(effects.on_buffer_loaded(*buffer), "Effects should configure for a valid buffer.");
    ok &= expect(renderer.configure_calls == 1, "Loading a buffer configures the effect path once.");
    transport.load(buffer);

    // Set before playing: applied when the chain attaches.
    effects.set_mix(0.5);
    transport.play();
    const auto* chain = renderer.live_chain();
    ok &= expect(chain && nearly_equal(chain->dry_gain, 0.5) && nearly_equal(chain->wet_gain, 1.0),
                 "A new chain should pick up the current mix.");

    // Changed while playing: pushed to the live chain at once.
    effects.set_mix(0.8);
    chain = renderer.live_chain();
    ok &= expect(chain && nearly_equal(chain->dry_gain, 0.2) && nearly_equal(chain->wet_gain, 1.6),
                 "Mix changes should reach the live chain immediately.");

    transport.pause();
    ok &= expect(effects.attached_chain() == kNoChain, "Tearing down the chain detaches the effects.");

    renderer.accept_effects = false;
    ok &= expect(!effects.on_buffer_loaded(*buffer), "A refused effect configuration reports failure.");

    if (!ok) {
        return 1;
    }
    std::cout << "[Test] Effects graph checks passed." << std::endl;
    return 0;
}
