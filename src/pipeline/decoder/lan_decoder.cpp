#include "lan_decoder.hpp"
#include "../wav_encoder.hpp"

#include <algorithm>
#include <cmath>
#include <curl/curl.h>
#include <format>
#include <nlohmann/json.hpp>
#include <print>

using json = nlohmann::json;

namespace {

// Used when the server reports no per-segment log probabilities.
constexpr float kDefaultConfidence = 0.9f;

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* resp = static_cast<std::string*>(userdata);
    resp->append(ptr, size * nmemb);
    return size * nmemb;
}

void add_part(curl_mime* mime, const char* name, const char* value) {
    curl_mimepart* part = curl_mime_addpart(mime);
    curl_mime_name(part, name);
    curl_mime_data(part, value, CURL_ZERO_TERMINATED);
}

std::string trim(std::string text) {
    auto start_pos = text.find_first_not_of(" \t\n\r");
    if (start_pos == std::string::npos) return {};
    auto end_pos = text.find_last_not_of(" \t\n\r");
    return text.substr(start_pos, end_pos - start_pos + 1);
}

} // namespace

LanDecoder::LanDecoder(std::string url, std::string api_format, std::string language,
                       uint32_t timeout_s, std::string model)
    : url_(std::move(url)), api_format_(std::move(api_format)),
      language_(std::move(language)), timeout_s_(timeout_s), model_(std::move(model)) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

LanDecoder::~LanDecoder() {
    curl_global_cleanup();
}

DecodeResult LanDecoder::decode(std::span<const int16_t> window, uint32_t sample_rate) {
    if (window.empty()) return {};

    try {
        auto body = post(window, sample_rate);
        if (!body) {
            std::println(stderr, "decoder: {}", body.error());
            return DecodeResult{.failed = true};
        }

        auto result = parse_response(*body);
        if (!result) {
            std::println(stderr, "decoder: {}", result.error());
            return DecodeResult{.failed = true};
        }
        return *result;
    } catch (const std::exception& e) {
        std::println(stderr, "decoder: {}", e.what());
        return DecodeResult{.failed = true};
    }
}

std::expected<std::string, std::string>
LanDecoder::post(std::span<const int16_t> window, uint32_t sample_rate) {
    auto wav_data = wav::encode(window, sample_rate);

    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected("curl_easy_init failed");
    }

    std::string endpoint;
    curl_mime* mime = curl_mime_init(curl);

    curl_mimepart* part = curl_mime_addpart(mime);
    curl_mime_name(part, "file");
    curl_mime_data(part, reinterpret_cast<const char*>(wav_data.data()), wav_data.size());
    curl_mime_filename(part, "window.wav");
    curl_mime_type(part, "audio/wav");

    if (api_format_ == "openai") {
        endpoint = url_ + "/v1/audio/transcriptions";
        add_part(mime, "model", model_.empty() ? "whisper-1" : model_.c_str());
    } else {
        // whisper.cpp server
        endpoint = url_ + "/inference";
        add_part(mime, "temperature", "0.0");
    }
    add_part(mime, "response_format", "verbose_json");
    if (!language_.empty()) {
        add_part(mime, "language", language_.c_str());
    }

    std::string response_body;

    curl_easy_setopt(curl, CURLOPT_URL, endpoint.c_str());
    curl_easy_setopt(curl, CURLOPT_MIMEPOST, mime);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(timeout_s_));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 5L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl);
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);

    curl_mime_free(mime);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        return std::unexpected(std::string("curl error: ") + curl_easy_strerror(res));
    }
    if (status < 200 || status >= 300) {
        return std::unexpected(std::format("HTTP {} from {}", status, endpoint));
    }
    return response_body;
}

std::expected<DecodeResult, std::string> LanDecoder::parse_response(const std::string& body) {
    json j = json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return std::unexpected("malformed response: " + body.substr(0, 200));
    }

    if (j.contains("error")) {
        auto& err = j["error"];
        std::string msg = err.is_string() ? err.get<std::string>() : err.dump();
        return std::unexpected("server error: " + msg);
    }
    if (!j.contains("text") || !j["text"].is_string()) {
        return std::unexpected("unexpected response: " + body.substr(0, 200));
    }

    DecodeResult result;
    result.text = trim(j["text"].get<std::string>());
    if (result.text.empty()) return result;

    // Confidence: mean of exp(avg_logprob) across segments.
    double sum = 0.0;
    size_t n = 0;
    if (j.contains("segments") && j["segments"].is_array()) {
        for (auto& seg : j["segments"]) {
            if (seg.contains("avg_logprob") && seg["avg_logprob"].is_number()) {
                sum += std::exp(seg["avg_logprob"].get<double>());
                ++n;
            }
        }
    }
    result.confidence = n > 0
        ? static_cast<float>(std::clamp(sum / static_cast<double>(n), 0.0, 1.0))
        : kDefaultConfidence;
    return result;
}
