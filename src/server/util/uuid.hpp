#pragma once

#include <cstdint>
#include <format>
#include <mutex>
#include <random>
#include <string>

// Random (version 4) UUID in the canonical 8-4-4-4-12 form.
inline std::string generate_uuid() {
    static std::mutex mtx;
    static std::mt19937_64 rng{std::random_device{}()};

    uint64_t hi, lo;
    {
        std::lock_guard lock(mtx);
        hi = rng();
        lo = rng();
    }
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    return std::format("{:08x}-{:04x}-{:04x}-{:04x}-{:012x}",
                       static_cast<uint32_t>(hi >> 32),
                       static_cast<uint16_t>(hi >> 16),
                       static_cast<uint16_t>(hi),
                       static_cast<uint16_t>(lo >> 48),
                       lo & 0xFFFFFFFFFFFFULL);
}
