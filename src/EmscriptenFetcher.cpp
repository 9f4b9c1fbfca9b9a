#include <cstring>
#include <iostream>
#include <memory>
#include <emscripten/fetch.h>
#include "EmscriptenFetcher.hpp"

namespace {

struct PendingFetch {
    std::string source;
    bool remote{false};
    FetchCallback done;
};

void on_fetch_success(emscripten_fetch_t* fetch) {
    std::unique_ptr<PendingFetch> pending(static_cast<PendingFetch*>(fetch->userData));
    FetchResult result;
    const auto* data = reinterpret_cast<const std::uint8_t*>(fetch->data);
    result.bytes.assign(data, data + fetch->numBytes);
    emscripten_fetch_close(fetch);
    pending->done(std::move(result));
}

void on_fetch_error(emscripten_fetch_t* fetch) {
    std::unique_ptr<PendingFetch> pending(static_cast<PendingFetch*>(fetch->userData));
    FetchResult result;
    if (fetch->status == 0) {
        result.error = FetchError::Network;
        result.message = "network error fetching " + pending->source;
    } else if (pending->remote && fetch->status == 400) {
        // The endpoint rejects URLs it cannot process.
        result.error = FetchError::InvalidUrl;
        result.message = "invalid URL: " + pending->source;
    } else if (pending->remote) {
        result.error = FetchError::RemoteProcessing;
        result.message = "failed to process " + pending->source + " (HTTP " + std::to_string(fetch->status) + ")";
    } else {
        result.error = FetchError::Network;
        result.message = "HTTP " + std::to_string(fetch->status) + " for " + pending->source;
    }
    emscripten_fetch_close(fetch);
    std::cerr << "Fetch: " << result.message << std::endl;
    pending->done(std::move(result));
}

} // namespace

EmscriptenFetcher::EmscriptenFetcher(std::string endpoint) : endpoint_(std::move(endpoint)) {}

void EmscriptenFetcher::fetch(const std::string& source, FetchCallback done) {
    const bool remote = is_remote_url(source);
    if (!remote && source.find("://") != std::string::npos) {
        FetchResult result;
        result.error = FetchError::InvalidUrl;
        result.message = "unsupported URL: " + source;
        done(std::move(result));
        return;
    }

    const std::string url = remote ? transcode_request_url(endpoint_, source) : source;

    emscripten_fetch_attr_t attr;
    emscripten_fetch_attr_init(&attr);
    std::strcpy(attr.requestMethod, "GET");
    attr.attributes = EMSCRIPTEN_FETCH_LOAD_TO_MEMORY;
    attr.onsuccess = on_fetch_success;
    attr.onerror = on_fetch_error;
    attr.userData = new PendingFetch{source, remote, std::move(done)};

    std::cout << "Fetch: requesting " << url << std::endl;
    emscripten_fetch(&attr, url.c_str());
}
