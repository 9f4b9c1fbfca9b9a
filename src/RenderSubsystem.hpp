#pragma once

#include <cstdint>
#include <memory>

#include "SampleBuffer.hpp"

// Identifies one live render chain (source -> effects -> output).
// Zero never names a chain.
using ChainHandle = std::uint64_t;
constexpr ChainHandle kNoChain = 0;

// A freshly built chain and the device time of its first rendered frame.
struct BuiltChain {
    ChainHandle handle{kNoChain};
    double device_time{0.0};
};

// Abstract contract the playback core uses to drive audio rendering.
// The core never touches rendering primitives except through this interface.
class RenderSubsystem {
public:
    virtual ~RenderSubsystem() = default;

    // Whether the output device may currently render (e.g. a browser context
    // still waiting for a user gesture reports false).
    virtual bool rendering_permitted() const = 0;

    // Prepares the dry and wet (reverb) paths for buffers at this sample rate.
    // Called once per loaded buffer.
    virtual bool configure_effects(double sample_rate) = 0;

    // Starts a chain that plays `buffer` from `offset` seconds at `rate`.
    // The handle is kNoChain on failure; nothing is left half-built in that case.
    virtual BuiltChain build_chain(std::shared_ptr<const SampleBuffer> buffer,
                                   double offset,
                                   double rate) = 0;

    // Returns the device time from which the new rate applies.
    virtual double set_rate(ChainHandle chain, double rate) = 0;
    virtual void set_gains(ChainHandle chain, double dry_gain, double wet_gain) = 0;

    // Stops and releases a chain. Unknown handles are ignored.
    virtual void teardown(ChainHandle chain) = 0;

    // Monotonic device clock in seconds, unaffected by playback rate. It only
    // advances over frames the live chains actually consumed.
    virtual double now() const = 0;
};
