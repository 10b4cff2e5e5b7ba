#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <optional>

// Key/value memo whose entries expire a fixed TTL after they were written.
// Expiry is checked on read; nothing runs in the background.
template <typename K, typename V>
class TtlCache {
public:
    using Clock = std::chrono::steady_clock;
    using Now = std::function<Clock::time_point()>;

    explicit TtlCache(std::chrono::seconds ttl, Now now = [] { return Clock::now(); })
        : ttl_(ttl), now_(std::move(now)) {}

    std::optional<V> get(const K& key) {
        std::lock_guard lock(mutex_);
        auto it = entries_.find(key);
        if (it == entries_.end()) return std::nullopt;
        if (now_() - it->second.written_at >= ttl_) {
            entries_.erase(it);
            return std::nullopt;
        }
        return it->second.value;
    }

    void set(const K& key, V value) {
        std::lock_guard lock(mutex_);
        entries_.insert_or_assign(key, Entry{std::move(value), now_()});
    }

    // Cached value, or the result of make() stored under key.
    template <typename F>
    V get_or_compute(const K& key, F&& make) {
        if (auto hit = get(key)) return *hit;
        V value = make();
        set(key, value);
        return value;
    }

    void clear() {
        std::lock_guard lock(mutex_);
        entries_.clear();
    }

    std::chrono::seconds ttl() const { return ttl_; }

private:
    struct Entry {
        V value;
        Clock::time_point written_at;
    };

    std::chrono::seconds ttl_;
    Now now_;
    std::mutex mutex_;
    std::map<K, Entry> entries_;
};
