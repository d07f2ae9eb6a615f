#pragma once

#include "decoder.hpp"

#include <cstdint>
#include <expected>
#include <string>

// Decodes windows on a whisper server reachable over HTTP.
class LanDecoder : public Decoder {
public:
    // api_format: "whisper.cpp" or "openai". `model` is sent with OpenAI-style
    // requests; whisper.cpp serves whatever model it loaded.
    LanDecoder(std::string url, std::string api_format = "whisper.cpp",
               std::string language = "en", uint32_t timeout_s = 30,
               std::string model = {});
    ~LanDecoder() override;

    LanDecoder(const LanDecoder&) = delete;
    LanDecoder& operator=(const LanDecoder&) = delete;

    DecodeResult decode(std::span<const int16_t> window, uint32_t sample_rate) override;
    bool is_real() const override { return true; }
    std::string name() const override {
        return model_.empty() ? "lan:" + api_format_ : "lan:" + api_format_ + "/" + model_;
    }

    // Parses a verbose_json (or plain json) transcription response.
    static std::expected<DecodeResult, std::string> parse_response(const std::string& body);

private:
    std::expected<std::string, std::string> post(std::span<const int16_t> window, uint32_t sample_rate);

    std::string url_;
    std::string api_format_;
    std::string language_;
    uint32_t timeout_s_;
    std::string model_;
};
