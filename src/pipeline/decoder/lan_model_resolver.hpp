#pragma once

#include "../config.hpp"
#include "model_resolver.hpp"

#include <expected>
#include <memory>
#include <string>

// Resolves to a LanDecoder when the configured whisper server answers its
// health endpoint (OpenAI-style servers must also list the model), then sends
// one silent warmup window. `decoder.type == "simulated"` disables resolution.
class LanModelResolver : public ModelResolver {
public:
    explicit LanModelResolver(Config::Decoder config);
    ~LanModelResolver() override;

    LanModelResolver(const LanModelResolver&) = delete;
    LanModelResolver& operator=(const LanModelResolver&) = delete;

    std::expected<std::unique_ptr<Decoder>, std::string>
        resolve(const std::string& model_name) override;

    std::string probe_url() const;

    // True when a /v1/models listing serves `model`, by id or as the suffix of
    // a namespaced id. A body without a `data` array lists nothing to check.
    static bool lists_model(const std::string& body, const std::string& model);

private:
    std::expected<std::string, std::string> probe();

    Config::Decoder config_;
};
