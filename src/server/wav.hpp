#pragma once

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <expected>
#include <fstream>
#include <iterator>
#include <span>
#include <string>
#include <vector>

// Minimal RIFF/WAVE support: encodes mono PCM int16 in memory, decodes PCM
// (8/16/32-bit int, 32-bit float) files down to mono int16.
namespace wav {

struct Waveform {
    std::vector<int16_t> samples;
    uint32_t sample_rate = 0;

    double duration_s() const {
        return sample_rate ? static_cast<double>(samples.size()) / sample_rate : 0.0;
    }
};

inline std::vector<uint8_t> encode(std::span<const int16_t> samples, uint32_t sample_rate) {
    constexpr uint16_t channels = 1;
    constexpr uint16_t bits_per_sample = 16;
    uint32_t byte_rate = sample_rate * channels * bits_per_sample / 8;
    uint16_t block_align = channels * bits_per_sample / 8;
    uint32_t data_size = static_cast<uint32_t>(samples.size() * sizeof(int16_t));

    std::vector<uint8_t> out(44 + data_size);
    auto w = [&out, pos = size_t(0)](const void* data, size_t len) mutable {
        std::memcpy(out.data() + pos, data, len);
        pos += len;
    };
    auto w16 = [&w](uint16_t v) { w(&v, 2); };
    auto w32 = [&w](uint32_t v) { w(&v, 4); };

    w("RIFF", 4);
    w32(36 + data_size);
    w("WAVE", 4);
    w("fmt ", 4);
    w32(16);
    w16(1);                 // PCM
    w16(channels);
    w32(sample_rate);
    w32(byte_rate);
    w16(block_align);
    w16(bits_per_sample);
    w("data", 4);
    w32(data_size);
    if (data_size) std::memcpy(out.data() + 44, samples.data(), data_size);

    return out;
}

inline std::expected<Waveform, std::string> decode(std::span<const uint8_t> bytes) {
    auto r16 = [&bytes](size_t pos) -> uint16_t {
        uint16_t v;
        std::memcpy(&v, bytes.data() + pos, 2);
        return v;
    };
    auto r32 = [&bytes](size_t pos) -> uint32_t {
        uint32_t v;
        std::memcpy(&v, bytes.data() + pos, 4);
        return v;
    };

    if (bytes.size() < 12 || std::memcmp(bytes.data(), "RIFF", 4) != 0 ||
        std::memcmp(bytes.data() + 8, "WAVE", 4) != 0) {
        return std::unexpected("not a RIFF/WAVE file");
    }

    uint16_t format = 0, channels = 0, bits = 0;
    uint32_t rate = 0;
    bool have_fmt = false;
    std::span<const uint8_t> data;

    size_t pos = 12;
    while (pos + 8 <= bytes.size()) {
        uint32_t size = r32(pos + 4);
        size_t body = pos + 8;
        size_t avail = bytes.size() - body;
        if (std::memcmp(bytes.data() + pos, "fmt ", 4) == 0) {
            if (size < 16 || avail < 16) return std::unexpected("truncated fmt chunk");
            format = r16(body);
            channels = r16(body + 2);
            rate = r32(body + 4);
            bits = r16(body + 14);
            if (format == 0xFFFE && size >= 26 && avail >= 26) {
                format = r16(body + 24); // WAVE_FORMAT_EXTENSIBLE sub-format
            }
            have_fmt = true;
        } else if (std::memcmp(bytes.data() + pos, "data", 4) == 0) {
            data = bytes.subspan(body, std::min<size_t>(size, avail));
            break;
        }
        pos = body + size + (size & 1);
    }

    if (!have_fmt) return std::unexpected("missing fmt chunk");
    if (data.data() == nullptr) return std::unexpected("missing data chunk");
    if (channels == 0 || rate == 0) return std::unexpected("invalid channel count or rate");

    bool is_float = format == 3 && bits == 32;
    if (!is_float && (format != 1 || (bits != 8 && bits != 16 && bits != 32))) {
        return std::unexpected("unsupported sample format " + std::to_string(format) + "/" +
                               std::to_string(bits) + " bit");
    }

    size_t bytes_per_sample = bits / 8;
    size_t frame = bytes_per_sample * channels;
    size_t frames = data.size() / frame;

    auto sample_at = [&](size_t offset) -> double {
        const uint8_t* p = data.data() + offset;
        switch (bits) {
            case 8: return (static_cast<double>(*p) - 128.0) / 128.0;
            case 16: {
                int16_t v;
                std::memcpy(&v, p, 2);
                return v / 32768.0;
            }
            default:
                if (is_float) {
                    float f;
                    std::memcpy(&f, p, 4);
                    return f;
                } else {
                    int32_t v;
                    std::memcpy(&v, p, 4);
                    return v / 2147483648.0;
                }
        }
    };

    Waveform out;
    out.sample_rate = rate;
    out.samples.resize(frames);
    for (size_t i = 0; i < frames; i++) {
        double sum = 0.0;
        for (size_t c = 0; c < channels; c++) sum += sample_at(i * frame + c * bytes_per_sample);
        double v = std::clamp(sum / channels * 32768.0, -32768.0, 32767.0);
        out.samples[i] = static_cast<int16_t>(std::lround(v));
    }
    return out;
}

// Linear interpolation resampler.
inline std::vector<int16_t> resample(std::span<const int16_t> in, uint32_t from, uint32_t to) {
    if (from == to || in.empty() || from == 0 || to == 0) {
        return {in.begin(), in.end()};
    }
    size_t out_len = static_cast<size_t>(
        std::llround(static_cast<double>(in.size()) * to / from));
    std::vector<int16_t> out(out_len);
    double step = static_cast<double>(from) / to;
    for (size_t i = 0; i < out_len; i++) {
        double src = i * step;
        size_t i0 = static_cast<size_t>(src);
        if (i0 + 1 >= in.size()) {
            out[i] = in.back();
            continue;
        }
        double frac = src - static_cast<double>(i0);
        out[i] = static_cast<int16_t>(std::lround(in[i0] + (in[i0 + 1] - in[i0]) * frac));
    }
    return out;
}

// Reads a WAV file and converts it to target_rate (0 keeps the stored rate).
inline std::expected<Waveform, std::string> load(const std::string& path, uint32_t target_rate) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) return std::unexpected("could not open " + path);
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(f)),
                               std::istreambuf_iterator<char>());

    auto wave = decode(bytes);
    if (!wave) return std::unexpected(path + ": " + wave.error());

    if (target_rate && wave->sample_rate != target_rate) {
        wave->samples = resample(wave->samples, wave->sample_rate, target_rate);
        wave->sample_rate = target_rate;
    }
    return wave;
}

} // namespace wav
