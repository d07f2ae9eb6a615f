#pragma once

#include "decoder.hpp"

#include <expected>
#include <memory>
#include <string>

// Supplies a loaded decoder for a model name, or the reason none is available.
class ModelResolver {
public:
    virtual ~ModelResolver() = default;
    virtual std::expected<std::unique_ptr<Decoder>, std::string>
        resolve(const std::string& model_name) = 0;
};
