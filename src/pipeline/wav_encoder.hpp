#pragma once

#include <array>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <span>
#include <string>
#include <vector>

// 16-bit mono PCM WAV, in memory (decoder uploads) or streamed to disk (recordings).
namespace wav {

inline constexpr size_t kHeaderSize = 44;

inline std::array<uint8_t, kHeaderSize> header(uint32_t data_size, uint32_t sample_rate) {
    constexpr uint16_t channels = 1;
    constexpr uint16_t bits_per_sample = 16;
    uint32_t byte_rate = sample_rate * channels * bits_per_sample / 8;
    uint16_t block_align = channels * bits_per_sample / 8;

    std::array<uint8_t, kHeaderSize> out{};
    size_t pos = 0;
    auto w = [&out, &pos](const void* data, size_t len) {
        std::memcpy(out.data() + pos, data, len);
        pos += len;
    };
    auto w16 = [&w](uint16_t v) { w(&v, 2); };
    auto w32 = [&w](uint32_t v) { w(&v, 4); };

    w("RIFF", 4);
    w32(36 + data_size);
    w("WAVE", 4);
    w("fmt ", 4);
    w32(16);                // fmt chunk size
    w16(1);                 // PCM
    w16(channels);
    w32(sample_rate);
    w32(byte_rate);
    w16(block_align);
    w16(bits_per_sample);
    w("data", 4);
    w32(data_size);
    return out;
}

inline std::vector<uint8_t> encode(std::span<const int16_t> samples, uint32_t sample_rate) {
    auto data_size = static_cast<uint32_t>(samples.size() * sizeof(int16_t));
    auto hdr = header(data_size, sample_rate);

    std::vector<uint8_t> out(kHeaderSize + data_size);
    std::memcpy(out.data(), hdr.data(), kHeaderSize);
    if (data_size > 0) {
        std::memcpy(out.data() + kHeaderSize, samples.data(), data_size);
    }
    return out;
}

// Appends samples to a file and patches the header sizes on close().
class FileWriter {
public:
    FileWriter() = default;
    ~FileWriter() { close(); }

    FileWriter(const FileWriter&) = delete;
    FileWriter& operator=(const FileWriter&) = delete;

    bool open(const std::string& path, uint32_t sample_rate) {
        close();
        file_ = std::fopen(path.c_str(), "wb");
        if (!file_) return false;
        sample_rate_ = sample_rate;
        data_size_ = 0;
        auto hdr = header(0, sample_rate_);
        return std::fwrite(hdr.data(), 1, hdr.size(), file_) == hdr.size();
    }

    bool write(std::span<const int16_t> samples) {
        if (!file_) return false;
        size_t n = std::fwrite(samples.data(), sizeof(int16_t), samples.size(), file_);
        data_size_ += static_cast<uint32_t>(n * sizeof(int16_t));
        return n == samples.size();
    }

    void close() {
        if (!file_) return;
        auto hdr = header(data_size_, sample_rate_);
        if (std::fseek(file_, 0, SEEK_SET) == 0) {
            std::fwrite(hdr.data(), 1, hdr.size(), file_);
        }
        std::fclose(file_);
        file_ = nullptr;
    }

    bool is_open() const { return file_ != nullptr; }
    uint32_t data_size() const { return data_size_; }

private:
    std::FILE* file_ = nullptr;
    uint32_t sample_rate_ = 16000;
    uint32_t data_size_ = 0;
};

} // namespace wav
