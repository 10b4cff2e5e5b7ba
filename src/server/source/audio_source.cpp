#include "audio_source.hpp"

#include "../log.hpp"
#include "../storage/temp_files.hpp"
#include "../util/base64.hpp"

#include <algorithm>
#include <cctype>
#include <curl/curl.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string_view>

namespace fs = std::filesystem;

namespace {

std::string too_large_message(uint64_t max_bytes) {
    return "File size exceeds maximum of " + std::to_string(max_bytes / (1024 * 1024)) + "MB";
}

std::expected<FetchedAudio, Error> open_checked(const std::string& path, std::string name,
                                                uint64_t max_bytes) {
    auto stream = std::make_unique<std::ifstream>(path, std::ios::binary);
    if (!stream->is_open()) {
        return std::unexpected(Error{ErrorKind::NotFound, "File not found: " + path});
    }
    if (auto size = check_size(*stream, max_bytes); !size) {
        return std::unexpected(size.error());
    }
    return FetchedAudio{.stream = std::move(stream), .name = std::move(name)};
}

struct DownloadState {
    std::ofstream* out;
    CURL* curl;
    uint64_t max_bytes;
    uint64_t written = 0;
    bool checked_length = false;
    bool too_large = false;
};

bool is_http_url(std::string_view url) {
    auto scheme_end = url.find("://");
    if (scheme_end == std::string_view::npos) return false;
    std::string scheme(url.substr(0, scheme_end));
    std::ranges::transform(scheme, scheme.begin(), [](unsigned char c) { return std::tolower(c); });
    return scheme == "http" || scheme == "https";
}

size_t download_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* st = static_cast<DownloadState*>(userdata);
    size_t len = size * nmemb;

    if (!st->checked_length) {
        st->checked_length = true;
        curl_off_t declared = -1;
        if (curl_easy_getinfo(st->curl, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &declared) == CURLE_OK &&
            declared > 0 && static_cast<uint64_t>(declared) > st->max_bytes) {
            st->too_large = true;
            return 0;
        }
    }

    if (st->written + len > st->max_bytes) {
        st->too_large = true;
        return 0;
    }

    st->out->write(ptr, static_cast<std::streamsize>(len));
    if (!*st->out) return 0;
    st->written += len;
    return len;
}

std::expected<FetchedAudio, Error> fetch_impl(UploadedSource& src) {
    if (!src.part) {
        return std::unexpected(Error{ErrorKind::MissingPart, "No file part in the request"});
    }
    if (src.part->filename.empty()) {
        return std::unexpected(Error{ErrorKind::EmptySelection, "No selected file"});
    }
    auto stream = std::make_unique<std::istringstream>(src.part->content);
    if (auto size = check_size(*stream, src.max_bytes); !size) {
        return std::unexpected(size.error());
    }
    return FetchedAudio{.stream = std::move(stream), .name = src.part->filename};
}

std::expected<FetchedAudio, Error> fetch_impl(RemoteSource& src) {
    if (src.url.empty()) {
        return std::unexpected(Error{ErrorKind::BadRequest, "No URL provided"});
    }
    if (!is_http_url(src.url)) {
        return std::unexpected(Error{ErrorKind::FetchError, "Error downloading file: only http and https URLs are supported"});
    }

    auto path = src.resources->create(".wav");
    if (!path) {
        return std::unexpected(Error{ErrorKind::FetchError, "Failed to create scratch file: " + path.error()});
    }
    src.downloaded = *path;

    std::ofstream out(src.downloaded, std::ios::binary);
    if (!out.is_open()) {
        return std::unexpected(Error{ErrorKind::FetchError, "Failed to open " + src.downloaded});
    }

    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected(Error{ErrorKind::FetchError, "curl_easy_init failed"});
    }

    DownloadState state{.out = &out, .curl = curl, .max_bytes = src.max_bytes};
    char errbuf[CURL_ERROR_SIZE] = {};

    curl_easy_setopt(curl, CURLOPT_URL, src.url.c_str());
    curl_easy_setopt(curl, CURLOPT_PROTOCOLS_STR, "http,https");
    curl_easy_setopt(curl, CURLOPT_REDIR_PROTOCOLS_STR, "http,https");
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, download_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &state);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 10L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, 300L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl);
    curl_easy_cleanup(curl);
    out.close();

    if (state.too_large) {
        return std::unexpected(Error{ErrorKind::TooLarge, too_large_message(src.max_bytes)});
    }
    if (res != CURLE_OK) {
        std::string detail = errbuf[0] ? errbuf : curl_easy_strerror(res);
        return std::unexpected(Error{ErrorKind::FetchError, "Error downloading file: " + detail});
    }

    logging::debug("source", "downloaded {} bytes from {}", state.written, src.url);
    return open_checked(src.downloaded, fs::path(src.downloaded).filename().string(), src.max_bytes);
}

std::expected<FetchedAudio, Error> fetch_impl(InlineSource& src) {
    if (src.payload.empty()) {
        return std::unexpected(Error{ErrorKind::BadRequest, "No base64 file provided"});
    }

    auto bytes = base64::decode(src.payload);
    if (!bytes) {
        return std::unexpected(Error{ErrorKind::DecodeError, "Invalid base64 data"});
    }
    if (bytes->size() > src.max_bytes) {
        return std::unexpected(Error{ErrorKind::TooLarge, too_large_message(src.max_bytes)});
    }

    auto path = src.resources->create(".wav");
    if (!path) {
        return std::unexpected(Error{ErrorKind::DecodeError, "Failed to create scratch file: " + path.error()});
    }
    src.decoded = *path;

    {
        std::ofstream out(src.decoded, std::ios::binary);
        out.write(reinterpret_cast<const char*>(bytes->data()),
                  static_cast<std::streamsize>(bytes->size()));
        if (!out) {
            return std::unexpected(Error{ErrorKind::DecodeError, "Failed to write " + src.decoded});
        }
    }

    return open_checked(src.decoded, fs::path(src.decoded).filename().string(), src.max_bytes);
}

std::expected<FetchedAudio, Error> fetch_impl(LocalPathSource& src) {
    std::error_code ec;
    if (!fs::is_regular_file(src.path, ec)) {
        return std::unexpected(Error{ErrorKind::NotFound, "File not found: " + src.path});
    }
    return open_checked(src.path, fs::path(src.path).filename().string(), src.max_bytes);
}

void cleanup_impl(UploadedSource&) {}
void cleanup_impl(LocalPathSource&) {}

void cleanup_impl(RemoteSource& src) {
    if (!src.downloaded.empty() && src.resources) {
        src.resources->release(src.downloaded);
        src.downloaded.clear();
    }
}

void cleanup_impl(InlineSource& src) {
    if (!src.decoded.empty() && src.resources) {
        src.resources->release(src.decoded);
        src.decoded.clear();
    }
}

} // namespace

std::expected<uint64_t, Error> check_size(std::istream& in, uint64_t max_bytes) {
    auto pos = in.tellg();
    in.seekg(0, std::ios::end);
    auto end = in.tellg();
    in.seekg(pos < 0 ? std::streampos(0) : pos);

    if (end < 0) {
        in.clear();
        return std::unexpected(Error{ErrorKind::BadRequest, "Could not determine file size"});
    }
    auto size = static_cast<uint64_t>(end);
    if (size > max_bytes) {
        return std::unexpected(Error{ErrorKind::TooLarge, too_large_message(max_bytes)});
    }
    return size;
}

std::expected<FetchedAudio, Error> fetch(AudioSource& source) {
    return std::visit([](auto& src) { return fetch_impl(src); }, source);
}

void cleanup(AudioSource& source) {
    std::visit([](auto& src) { cleanup_impl(src); }, source);
}
