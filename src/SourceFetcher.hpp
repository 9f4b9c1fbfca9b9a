#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

enum class FetchError {
    None,
    InvalidUrl,
    Network,
    RemoteProcessing,  // The transcoding endpoint answered with an error.
};

struct FetchResult {
    FetchError error{FetchError::None};
    std::vector<std::uint8_t> bytes;
    std::string message;

    bool ok() const { return error == FetchError::None; }
};

using FetchCallback = std::function<void(FetchResult)>;

// Retrieves the raw encoded bytes of a source. Completion may be synchronous
// (local files) or arrive later on the UI thread (browser fetch).
class SourceFetcher {
public:
    virtual ~SourceFetcher() = default;
    virtual void fetch(const std::string& source, FetchCallback done) = 0;
};

// True for http:// and https:// URLs with a non-empty host.
bool is_remote_url(const std::string& source);

// Request URL for the transcoding endpoint: `<endpoint>?url=<encoded source>`.
std::string transcode_request_url(const std::string& endpoint, const std::string& source);

std::string percent_encode(const std::string& text);

// Reads local paths and file:// URLs. Remote URLs fail with InvalidUrl
// because the native build has no transcoding endpoint.
class FileFetcher final : public SourceFetcher {
public:
    void fetch(const std::string& source, FetchCallback done) override;
};
