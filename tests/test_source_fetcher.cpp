#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include "FakeRenderSubsystem.hpp"
#include "SourceFetcher.hpp"

namespace {

FetchResult fetch_now(SourceFetcher& fetcher, const std::string& source) {
    FetchResult captured;
    bool called = false;
    fetcher.fetch(source, [&](FetchResult result) {
        captured = std::move(result);
        called = true;
    });
    if (!called) {
        captured.error = FetchError::Network;
        captured.message = "callback not invoked";
    }
    return captured;
}

bool test_url_validation() {
    bool ok = true;
    ok &= expect(is_remote_url("https://www.youtube.com/watch?v=abc"), "https URLs with a host are remote.");
    ok &= expect(is_remote_url("http://example.com"), "http URLs with a host are remote.");
    ok &= expect(!is_remote_url("https://"), "A URL needs a host.");
    ok &= expect(!is_remote_url("ftp://example.com/a.mp3"), "Only http and https are accepted.");
    ok &= expect(!is_remote_url("https://bad host/x"), "Hosts may not contain spaces.");
    ok &= expect(!is_remote_url("song.wav"), "Plain paths are not remote.");
    return ok;
}

bool test_transcode_url() {
    bool ok = true;
    ok &= expect(percent_encode("a-b_c.d~e") == "a-b_c.d~e", "Unreserved characters stay.");
    ok &= expect(percent_encode("a b/?&=") == "a%20b%2F%3F%26%3D", "Reserved characters are escaped.");
    ok &= expect(transcode_request_url("/api/process-youtube", "https://youtu.be/x?t=1") ==
                     "/api/process-youtube?url=https%3A%2F%2Fyoutu.be%2Fx%3Ft%3D1",
                 "The source is passed as the url query parameter.");
    ok &= expect(transcode_request_url("/convert?fmt=mp3", "http://a.b") == "/convert?fmt=mp3&url=http%3A%2F%2Fa.b",
                 "An endpoint with a query string gets another parameter.");
    return ok;
}

bool test_file_fetcher() {
    FileFetcher fetcher;
    bool ok = true;

    const FetchResult remote = fetch_now(fetcher, "https://example.com/song.mp3");
    ok &= expect(remote.error == FetchError::InvalidUrl, "The native fetcher rejects remote URLs.");

    const FetchResult empty = fetch_now(fetcher, "file://");
    ok &= expect(empty.error == FetchError::InvalidUrl, "An empty path is invalid.");

    const auto missing_path = std::filesystem::temp_directory_path() / "slowverb_missing_source.wav";
    std::filesystem::remove(missing_path);
    const FetchResult missing = fetch_now(fetcher, missing_path.string());
    ok &= expect(missing.error == FetchError::Network && missing.message.find("cannot open") == 0,
                 "An unreadable file is a fetch failure.");

    const auto path = std::filesystem::temp_directory_path() / "slowverb_fetch_test.bin";
    {
        std::ofstream out(path, std::ios::binary);
        out << "RIFF1234";
    }
    const FetchResult local = fetch_now(fetcher, path.string());
    ok &= expect(local.ok() && local.bytes.size() == 8 && local.bytes[0] == 'R', "Local files are read whole.");
    const FetchResult url = fetch_now(fetcher, "file://" + path.string());
    ok &= expect(url.ok() && url.bytes == local.bytes, "file:// URLs read the same file.");
    std::filesystem::remove(path);
    return ok;
}

} // namespace

int main() {
    bool ok = true;
    ok &= test_url_validation();
    ok &= test_transcode_url();
    ok &= test_file_fetcher();
    if (!ok) {
        return 1;
    }
    std::cout << "[Test] Source fetcher checks passed." << std::endl;
    return 0;
}
