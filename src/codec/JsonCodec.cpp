#include "JsonCodec.hpp"

std::optional<std::string> JsonCodec::encode(const json& value) const {
    try {
        return value.dump();
    } catch (const json::type_error&) {
        return std::nullopt;
    }
}

std::optional<json> JsonCodec::decode(const std::string& raw) const {
    try {
        return json::parse(raw);
    } catch (const json::parse_error&) {
        return std::nullopt;
    }
}
