#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "../interfaces/IValueCodec.hpp"

using json = nlohmann::json;

class JsonCodec : public IValueCodec<json> {
public:
    // Fails for values dump() rejects, such as strings with invalid UTF-8.
    std::optional<std::string> encode(const json& value) const override;
    std::optional<json> decode(const std::string& raw) const override;
};
