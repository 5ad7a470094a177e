#pragma once

#include <cstdint>
#include <cstring>
#include <optional>
#include <span>
#include <vector>

// In-memory 16-bit PCM WAV encoding, plus the little header inspection the
// transcription side needs.
namespace wav {

constexpr size_t header_size = 44;

inline std::vector<uint8_t> encode(std::span<const int16_t> samples, uint32_t sample_rate,
                                   uint16_t channels = 1) {
    constexpr uint16_t bits_per_sample = 16;
    uint32_t byte_rate = sample_rate * channels * bits_per_sample / 8;
    uint16_t block_align = channels * bits_per_sample / 8;
    uint32_t data_size = static_cast<uint32_t>(samples.size() * sizeof(int16_t));

    std::vector<uint8_t> out(header_size + data_size);
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
    if (data_size > 0) {
        std::memcpy(out.data() + header_size, samples.data(), data_size);
    }

    return out;
}

inline int64_t duration_ms(size_t sample_count, uint32_t sample_rate, uint16_t channels = 1) {
    if (sample_rate == 0 || channels == 0) return 0;
    return static_cast<int64_t>(sample_count / channels) * 1000 / sample_rate;
}

// Duration of an encoded buffer, read back from its header. Empty when the
// buffer is not a canonical PCM WAV produced by encode().
inline std::optional<int64_t> duration_ms(std::span<const uint8_t> encoded) {
    if (encoded.size() < header_size) return std::nullopt;
    if (std::memcmp(encoded.data(), "RIFF", 4) != 0 ||
        std::memcmp(encoded.data() + 8, "WAVE", 4) != 0) {
        return std::nullopt;
    }

    uint16_t channels;
    uint32_t sample_rate;
    uint32_t data_size;
    std::memcpy(&channels, encoded.data() + 22, 2);
    std::memcpy(&sample_rate, encoded.data() + 24, 4);
    std::memcpy(&data_size, encoded.data() + 40, 4);

    return duration_ms(data_size / sizeof(int16_t), sample_rate, channels);
}

} // namespace wav
