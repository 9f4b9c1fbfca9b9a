#include <iostream>
#include "InputAdapters.hpp"
#include "PlayerSession.hpp"

PlayerSession::PlayerSession(RenderSubsystem& renderer, FrameScheduler& scheduler, PlayerView& view,
                             const PlayerConfig& config)
    : config_(config),
      effects_(renderer),
      transport_(renderer, effects_),
      view_(view),
      progress_(scheduler, [this]() { return on_frame(); }),
      self_(std::make_shared<PlayerSession*>(this)) {
    transport_.set_rate(config_.initial_rate);
    effects_.set_mix(config_.initial_mix);
    waveform_.resize(config_.canvas_width, config_.canvas_height);
}

PlayerSession::~PlayerSession() {
    self_.reset();
}

LoadToken PlayerSession::begin_load(const std::string& source_name) {
    ++load_generation_;
    transport_.stop();
    load_state_ = LoadState::Loading;
    pending_name_ = source_name;
    message_.clear();
    std::cout << "Loader: loading " << source_name << " (#" << load_generation_ << ")" << std::endl;
    publish();
    return load_generation_;
}

bool PlayerSession::complete_load(LoadToken token, std::shared_ptr<const SampleBuffer> buffer) {
    if (!is_current(token)) {
        return false;
    }
    if (!buffer || buffer->channel_count() == 0 || buffer->frame_count() == 0) {
        fail_load(token, Status::DecodeFailure, "decoded audio contains no samples");
        return false;
    }
    if (!effects_.on_buffer_loaded(*buffer)) {
        fail_load(token, Status::DecodeFailure, "unsupported sample rate");
        return false;
    }

    transport_.load(buffer);
    waveform_.set_buffer(buffer);
    source_name_ = pending_name_;
    load_state_ = LoadState::Ready;
    message_.clear();

    std::cout << "Loader: " << source_name_ << " ready, " << buffer->duration() << " s, "
              << buffer->channel_count() << " ch @ " << buffer->sample_rate() << " Hz." << std::endl;
    publish();
    return true;
}

bool PlayerSession::complete_load(LoadToken token, const DecodeResult& result) {
    if (!result.ok()) {
        fail_load(token, Status::DecodeFailure, result.error);
        return false;
    }
    return complete_load(token, result.buffer);
}

bool PlayerSession::fail_load(LoadToken token, Status status, const std::string& message) {
    if (!is_current(token)) {
        return false;
    }
    // The previous buffer, if any, stays loaded and playable.
    load_state_ = transport_.has_buffer() ? LoadState::Ready : LoadState::Error;
    message_ = message;
    std::cerr << "Loader: " << to_string(status) << " for " << pending_name_ << ": " << message << std::endl;
    publish();
    return true;
}

LoadToken PlayerSession::load_source(const std::string& source, SourceFetcher& fetcher, Decoder& decoder) {
    const LoadToken token = begin_load(source);
    std::weak_ptr<PlayerSession*> weak = self_;
    fetcher.fetch(source, [weak, token, &decoder](FetchResult fetched) {
        auto self = weak.lock();
        if (!self) {
            return;
        }
        PlayerSession& session = **self;
        if (!fetched.ok()) {
            session.fail_load(token, Status::FetchFailure, fetched.message);
            return;
        }
        session.complete_load(token, decoder.decode(fetched.bytes));
    });
    return token;
}

Status PlayerSession::load_bytes(const std::string& source_name, const std::vector<std::uint8_t>& bytes,
                                 Decoder& decoder) {
    const LoadToken token = begin_load(source_name);
    const DecodeResult result = decoder.decode(bytes);
    return complete_load(token, result) ? Status::Ok : Status::DecodeFailure;
}

Status PlayerSession::play() {
    if (load_state_ == LoadState::Loading) {
        return Status::NotReady;
    }
    const Status status = transport_.play();
    if (status == Status::Ok) {
        progress_.start();
    }
    publish();
    return status;
}

void PlayerSession::pause() {
    transport_.pause();
    publish();
}

Status PlayerSession::toggle_play_pause() {
    if (transport_.is_playing()) {
        pause();
        return Status::Ok;
    }
    return play();
}

void PlayerSession::stop() {
    transport_.stop();
    publish();
}

Status PlayerSession::seek(double seconds) {
    if (load_state_ == LoadState::Loading) {
        return Status::NotReady;
    }
    const Status status = transport_.seek(seconds);
    publish();
    return status;
}

Status PlayerSession::scrub(double x, double width) {
    if (!transport_.has_buffer()) {
        return Status::NotReady;
    }
    return seek(scrub_target(x, width, transport_.duration()));
}

void PlayerSession::set_rate(double rate) {
    transport_.set_rate(rate);
    publish();
}

void PlayerSession::set_mix(double amount) {
    effects_.set_mix(amount);
    publish();
}

void PlayerSession::resize(int width, int height) {
    waveform_.resize(width, height);
    publish();
}

double PlayerSession::current_position() {
    return transport_.current_position();
}

PlayerSnapshot PlayerSession::snapshot() {
    PlayerSnapshot snap;
    // Read the position first: reaching the end stops the transport.
    snap.position = transport_.current_position();
    snap.transport = transport_.state();
    snap.duration = transport_.duration();
    snap.rate = transport_.rate();
    snap.mix = effects_.mix();
    snap.load_state = load_state_;
    snap.source_name = load_state_ == LoadState::Loading ? pending_name_ : source_name_;
    snap.message = message_;
    snap.controls_enabled = controls_enabled();
    return snap;
}

void PlayerSession::publish() {
    view_.update(snapshot(), waveform_);
}

bool PlayerSession::controls_enabled() const {
    return load_state_ != LoadState::Loading && transport_.has_buffer();
}

bool PlayerSession::is_current(LoadToken token) const {
    // A token is live only while its load is still in flight.
    if (token != load_generation_ || load_state_ != LoadState::Loading) {
        std::cout << "Loader: ignoring stale load #" << token << " (current #" << load_generation_ << ")"
                  << std::endl;
        return false;
    }
    return true;
}

bool PlayerSession::on_frame() {
    publish();
    return transport_.is_playing();
}
