#include "lan_model_resolver.hpp"

#include "lan_decoder.hpp"

#include <cstdint>
#include <curl/curl.h>
#include <format>
#include <nlohmann/json.hpp>
#include <vector>

using json = nlohmann::json;

namespace {

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* resp = static_cast<std::string*>(userdata);
    resp->append(ptr, size * nmemb);
    return size * nmemb;
}

} // namespace

LanModelResolver::LanModelResolver(Config::Decoder config)
    : config_(std::move(config)) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

LanModelResolver::~LanModelResolver() {
    curl_global_cleanup();
}

std::string LanModelResolver::probe_url() const {
    if (config_.api_format == "openai") return config_.url + "/v1/models";
    return config_.url + "/health";
}

std::expected<std::unique_ptr<Decoder>, std::string>
LanModelResolver::resolve(const std::string& model_name) {
    if (config_.type == "simulated") {
        return std::unexpected("decoder disabled by configuration");
    }
    if (config_.type != "lan") {
        return std::unexpected("unknown decoder type: " + config_.type);
    }

    auto body = probe();
    if (!body) {
        return std::unexpected(std::format("model {} unavailable: {}", model_name, body.error()));
    }
    if (config_.api_format == "openai" && !lists_model(*body, model_name)) {
        return std::unexpected(std::format("model {} not served by {}", model_name, config_.url));
    }

    auto decoder = std::make_unique<LanDecoder>(config_.url, config_.api_format, config_.language,
                                                config_.timeout_s, model_name);
    if (config_.warmup) {
        std::vector<int16_t> silence(16000, 0);
        if (decoder->decode(silence, 16000).failed) {
            return std::unexpected(std::format("model {} warmup failed", model_name));
        }
    }
    return decoder;
}

bool LanModelResolver::lists_model(const std::string& body, const std::string& model) {
    json j = json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object() || !j.contains("data") || !j["data"].is_array()) {
        return true;
    }
    for (auto& entry : j["data"]) {
        if (!entry.is_object() || !entry.contains("id") || !entry["id"].is_string()) continue;
        auto id = entry["id"].get<std::string>();
        if (id == model || id.ends_with("/" + model) || id.ends_with("-" + model)) return true;
    }
    return false;
}

std::expected<std::string, std::string> LanModelResolver::probe() {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected("curl_easy_init failed");
    }

    auto url = probe_url();
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    std::string body;
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(config_.probe_timeout_ms));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(config_.probe_timeout_ms));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl);
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        return std::unexpected(std::string(curl_easy_strerror(res)));
    }
    // whisper.cpp answers 503 while the model is still loading.
    if (status == 503) {
        return std::unexpected("model still loading");
    }
    if (status < 200 || status >= 300) {
        return std::unexpected(std::format("HTTP {} from {}", status, url));
    }
    return body;
}
