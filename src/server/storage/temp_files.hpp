#pragma once

#include <chrono>
#include <cstddef>
#include <expected>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

struct StagedFile {
    std::string path;
    std::string dir;
    std::chrono::system_clock::time_point created_at;
};

// Owns every scratch file and directory created while serving requests.
// Each file lives in its own mkdtemp() directory under the root. Removal
// failures are logged and never raised; a path that is already gone is fine.
class ResourceManager {
public:
    explicit ResourceManager(std::string root = {});
    ~ResourceManager();

    ResourceManager(const ResourceManager&) = delete;
    ResourceManager& operator=(const ResourceManager&) = delete;

    std::expected<std::string, std::string> create(const std::string& suffix);

    // Removes the given paths, or everything tracked when paths is nullopt.
    void release(const std::optional<std::vector<std::string>>& paths = std::nullopt);
    void release(const std::string& path) { release(std::vector<std::string>{path}); }

    // release() plus a sweep of every tracked directory left empty.
    void release_all();

    size_t tracked_files() const;
    size_t tracked_dirs() const;
    const std::string& root() const { return root_; }

private:
    std::expected<std::string, std::string> make_dir();

    std::string root_;
    mutable std::mutex mutex_;
    std::vector<StagedFile> files_;
    std::vector<std::string> dirs_;
};

// One temp path released on every exit path.
class ScopedTempFile {
public:
    ScopedTempFile(ResourceManager& rm, std::string path) : rm_(&rm), path_(std::move(path)) {}
    ~ScopedTempFile() { reset(); }

    ScopedTempFile(ScopedTempFile&& o) noexcept : rm_(o.rm_), path_(std::move(o.path_)) {
        o.path_.clear();
    }
    ScopedTempFile& operator=(ScopedTempFile&&) = delete;
    ScopedTempFile(const ScopedTempFile&) = delete;
    ScopedTempFile& operator=(const ScopedTempFile&) = delete;

    static std::expected<ScopedTempFile, std::string>
    create(ResourceManager& rm, const std::string& suffix) {
        auto p = rm.create(suffix);
        if (!p) return std::unexpected(p.error());
        return ScopedTempFile(rm, std::move(*p));
    }

    const std::string& path() const { return path_; }

    void reset() {
        if (!path_.empty()) {
            rm_->release(path_);
            path_.clear();
        }
    }

private:
    ResourceManager* rm_;
    std::string path_;
};
