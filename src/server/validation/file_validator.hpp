#pragma once

#include "../error.hpp"

#include <cstdint>
#include <expected>
#include <functional>
#include <istream>
#include <set>
#include <string>
#include <string_view>
#include <vector>

struct ValidationPolicy {
    uint32_t max_file_size_mb = 100;
    std::vector<std::string> allowed_extensions;
    std::set<std::string> allowed_mime_types;

    uint64_t max_bytes() const { return static_cast<uint64_t>(max_file_size_mb) * 1024 * 1024; }
};

// Returns the MIME type of a buffer, or a message when it cannot tell.
using MimeSniffer = std::function<std::expected<std::string, std::string>(std::string_view)>;

// libmagic with MAGIC_MIME_TYPE.
MimeSniffer libmagic_sniffer();

class FileValidator {
public:
    explicit FileValidator(ValidationPolicy policy, MimeSniffer sniffer = libmagic_sniffer());

    // Size, extension, sniffed content type, in that order; the first failure
    // wins. The stream's read position is left where it was.
    std::expected<void, Error> validate(std::istream& in, const std::string& name) const;

    const ValidationPolicy& policy() const { return policy_; }

private:
    ValidationPolicy policy_;
    MimeSniffer sniffer_;
};

// Resolves path against each allowed root and returns the first resolved
// absolute path that stays inside its root. Ancestry is checked on path
// components of the normalized paths. An empty roots list rejects everything.
std::expected<std::string, Error>
validate_local_file_path(const std::string& path, const std::vector<std::string>& roots);
