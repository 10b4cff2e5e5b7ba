#include "temp_files.hpp"

#include "../log.hpp"
#include "../platform/platform_paths.hpp"
#include "../util/uuid.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>

namespace fs = std::filesystem;

ResourceManager::ResourceManager(std::string root)
    : root_(root.empty() ? platform::temp_dir() : std::move(root)) {}

ResourceManager::~ResourceManager() {
    release_all();
}

std::expected<std::string, std::string> ResourceManager::make_dir() {
    std::error_code ec;
    fs::create_directories(root_, ec);

    std::string tmpl = (fs::path(root_) / "transcribe_XXXXXX").string();
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');
    if (!::mkdtemp(buf.data())) {
        return std::unexpected(std::string("mkdtemp() failed: ") + std::strerror(errno));
    }
    return std::string(buf.data());
}

std::expected<std::string, std::string> ResourceManager::create(const std::string& suffix) {
    auto dir = make_dir();
    if (!dir) return dir;

    auto path = (fs::path(*dir) / (generate_uuid() + suffix)).string();
    {
        std::lock_guard lock(mutex_);
        dirs_.push_back(*dir);
        files_.push_back(StagedFile{
            .path = path,
            .dir = *dir,
            .created_at = std::chrono::system_clock::now(),
        });
    }
    logging::debug("tmp", "created {}", path);
    return path;
}

void ResourceManager::release(const std::optional<std::vector<std::string>>& paths) {
    std::vector<std::string> targets;
    {
        std::lock_guard lock(mutex_);
        if (paths) {
            targets = *paths;
        } else {
            for (auto& f : files_) targets.push_back(f.path);
        }
    }

    for (auto& path : targets) {
        std::error_code ec;
        if (fs::remove(path, ec)) {
            logging::debug("tmp", "removed {}", path);
        } else if (ec) {
            logging::warn("tmp", "failed to remove {}: {}", path, ec.message());
        }

        auto parent = fs::path(path).parent_path().string();
        bool parent_tracked = false;
        {
            std::lock_guard lock(mutex_);
            std::erase_if(files_, [&](const StagedFile& f) { return f.path == path; });
            parent_tracked = std::ranges::find(dirs_, parent) != dirs_.end();
        }

        if (!parent_tracked) continue;
        ec.clear();
        if (fs::exists(parent, ec) && fs::is_empty(parent, ec) && !ec) {
            fs::remove(parent, ec);
            if (ec) {
                logging::warn("tmp", "failed to remove directory {}: {}", parent, ec.message());
                continue;
            }
        } else if (fs::exists(parent, ec)) {
            continue;
        }
        std::lock_guard lock(mutex_);
        std::erase(dirs_, parent);
    }
}

void ResourceManager::release_all() {
    release();

    std::vector<std::string> dirs;
    {
        std::lock_guard lock(mutex_);
        dirs = dirs_;
    }

    for (auto& dir : dirs) {
        std::error_code ec;
        bool gone = !fs::exists(dir, ec);
        if (!gone && fs::is_empty(dir, ec) && !ec) {
            gone = fs::remove(dir, ec);
            if (ec) logging::warn("tmp", "failed to remove directory {}: {}", dir, ec.message());
        }
        if (gone) {
            std::lock_guard lock(mutex_);
            std::erase(dirs_, dir);
        }
    }
}

size_t ResourceManager::tracked_files() const {
    std::lock_guard lock(mutex_);
    return files_.size();
}

size_t ResourceManager::tracked_dirs() const {
    std::lock_guard lock(mutex_);
    return dirs_.size();
}
