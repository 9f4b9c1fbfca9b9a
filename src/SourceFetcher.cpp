#include <cctype>
#include <cstdio>
#include <fstream>
#include <iterator>
#include "SourceFetcher.hpp"

namespace {

FetchResult fetch_failure(FetchError error, std::string message) {
    FetchResult result;
    result.error = error;
    result.message = std::move(message);
    return result;
}

} // namespace

bool is_remote_url(const std::string& source) {
    std::string::size_type scheme_end = std::string::npos;
    if (source.rfind("http://", 0) == 0) {
        scheme_end = 7;
    } else if (source.rfind("https://", 0) == 0) {
        scheme_end = 8;
    } else {
        return false;
    }
    const auto host_end = source.find_first_of("/?#", scheme_end);
    const std::string host = source.substr(scheme_end, host_end - scheme_end);
    if (host.empty()) {
        return false;
    }
    for (char c : host) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

std::string percent_encode(const std::string& text) {
    std::string encoded;
    encoded.reserve(text.size() * 3);
    for (unsigned char c : text) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            encoded.push_back(static_cast<char>(c));
        } else {
            char escaped[4];
            std::snprintf(escaped, sizeof(escaped), "%%%02X", c);
            encoded += escaped;
        }
    }
    return encoded;
}

std::string transcode_request_url(const std::string& endpoint, const std::string& source) {
    const char separator = endpoint.find('?') == std::string::npos ? '?' : '&';
    return endpoint + separator + "url=" + percent_encode(source);
}

void FileFetcher::fetch(const std::string& source, FetchCallback done) {
    if (is_remote_url(source)) {
        done(fetch_failure(FetchError::InvalidUrl, "remote sources need the browser build: " + source));
        return;
    }

    std::string path = source;
    if (path.rfind("file://", 0) == 0) {
        path = path.substr(7);
    }
    if (path.empty()) {
        done(fetch_failure(FetchError::InvalidUrl, "empty path"));
        return;
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        done(fetch_failure(FetchError::Network, "cannot open " + path));
        return;
    }

    FetchResult result;
    result.bytes.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    if (file.bad()) {
        done(fetch_failure(FetchError::Network, "read error on " + path));
        return;
    }
    done(std::move(result));
}
