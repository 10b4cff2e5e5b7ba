#include "file_validator.hpp"

#include "../log.hpp"
#include "../source/audio_source.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <filesystem>
#include <magic.h>
#include <memory>
#include <mutex>

namespace fs = std::filesystem;

namespace {

std::string to_lower(std::string s) {
    std::ranges::transform(s, s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

bool ends_with_ci(const std::string& name, const std::string& suffix) {
    if (suffix.size() > name.size()) return false;
    return to_lower(name.substr(name.size() - suffix.size())) == to_lower(suffix);
}

struct MagicCookie {
    magic_t cookie = nullptr;
    std::string error;
    std::mutex mutex; // magic_t is not thread safe

    MagicCookie() {
        cookie = magic_open(MAGIC_MIME_TYPE);
        if (!cookie) {
            error = "magic_open failed";
            return;
        }
        if (magic_load(cookie, nullptr) != 0) {
            error = std::string("magic_load failed: ") + magic_error(cookie);
            magic_close(cookie);
            cookie = nullptr;
        }
    }
    ~MagicCookie() {
        if (cookie) magic_close(cookie);
    }
    MagicCookie(const MagicCookie&) = delete;
    MagicCookie& operator=(const MagicCookie&) = delete;
};

bool is_inside(const fs::path& candidate, const fs::path& root) {
    auto c = candidate.begin();
    for (auto r = root.begin(); r != root.end(); ++r, ++c) {
        if (r->empty()) continue; // trailing separator
        if (c == candidate.end() || *c != *r) return false;
    }
    return true;
}

} // namespace

MimeSniffer libmagic_sniffer() {
    auto magic = std::make_shared<MagicCookie>();
    return [magic](std::string_view head) -> std::expected<std::string, std::string> {
        if (!magic->cookie) return std::unexpected(magic->error);
        std::lock_guard lock(magic->mutex);
        const char* type = magic_buffer(magic->cookie, head.data(), head.size());
        if (!type) return std::unexpected(std::string("magic_buffer failed: ") + magic_error(magic->cookie));
        return std::string(type);
    };
}

FileValidator::FileValidator(ValidationPolicy policy, MimeSniffer sniffer)
    : policy_(std::move(policy)), sniffer_(std::move(sniffer)) {}

std::expected<void, Error> FileValidator::validate(std::istream& in, const std::string& name) const {
    if (auto size = check_size(in, policy_.max_bytes()); !size) {
        logging::warn("validate", "{}: {}", name, size.error().message);
        return std::unexpected(size.error());
    }

    bool ext_ok = std::ranges::any_of(policy_.allowed_extensions,
                                      [&](const std::string& ext) { return ends_with_ci(name, ext); });
    if (!ext_ok) {
        std::string allowed;
        for (auto& ext : policy_.allowed_extensions) {
            if (!allowed.empty()) allowed += ", ";
            allowed += ext;
        }
        logging::warn("validate", "{}: extension not allowed", name);
        return std::unexpected(Error{ErrorKind::UnsupportedExtension,
                                     "Unsupported file extension. Allowed: " + allowed});
    }

    if (!sniffer_) return {};

    auto pos = in.tellg();
    std::array<char, 1024> head{};
    in.read(head.data(), head.size());
    auto got = in.gcount();
    in.clear();
    in.seekg(pos);

    auto mime = sniffer_(std::string_view(head.data(), static_cast<size_t>(got)));
    if (!mime) {
        logging::warn("validate", "{}: could not determine content type ({}), accepting", name, mime.error());
        return {};
    }
    if (!policy_.allowed_mime_types.contains(*mime)) {
        logging::warn("validate", "{}: content type {} not allowed", name, *mime);
        return std::unexpected(Error{ErrorKind::UnsupportedContentType,
                                     "Unsupported file type: " + *mime});
    }
    return {};
}

std::expected<std::string, Error>
validate_local_file_path(const std::string& path, const std::vector<std::string>& roots) {
    if (path.empty()) {
        return std::unexpected(Error{ErrorKind::BadRequest, "No file path provided"});
    }

    for (auto& root : roots) {
        std::error_code ec;
        auto root_abs = fs::weakly_canonical(fs::absolute(root, ec), ec);
        if (ec) continue;

        auto candidate = fs::weakly_canonical(root_abs / path, ec);
        if (ec) continue;

        if (is_inside(candidate, root_abs)) return candidate.string();
    }

    logging::warn("validate", "rejected local path {}", path);
    return std::unexpected(Error{ErrorKind::PathTraversal,
                                 "Access denied: path is outside the allowed directories"});
}
