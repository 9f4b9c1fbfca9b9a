#pragma once

#include <string>

#include "SourceFetcher.hpp"

// Browser fetch through Emscripten's fetch API. Remote URLs go through the
// transcoding endpoint; anything else is requested as a same-origin path.
// Completion is delivered later on the main thread.
class EmscriptenFetcher final : public SourceFetcher {
public:
    explicit EmscriptenFetcher(std::string endpoint);

    void fetch(const std::string& source, FetchCallback done) override;

private:
    std::string endpoint_;
};
