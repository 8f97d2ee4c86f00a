#include "JsonCodec.hpp"

#include <cmath>

#include "../cache/CacheErrors.hpp"

namespace {

// dump() writes NaN and Inf as null, which would not read back as written.
bool hasNonFinite(const json& value) {
    if (value.is_number_float()) {
        return !std::isfinite(value.get<double>());
    }
    if (value.is_structured()) {
        for (const auto& item : value) {
            if (hasNonFinite(item)) {
                return true;
            }
        }
    }
    return false;
}

}

std::string JsonCodec::encode(const json& value) {
    if (hasNonFinite(value)) {
        throw SerializationError("Cannot encode NaN or Inf as JSON");
    }
    try {
        return value.dump();
    } catch (const json::type_error& e) {
        // Invalid UTF-8 inside a string value
        throw SerializationError("Cannot encode value as JSON: " + std::string(e.what()));
    }
}

json JsonCodec::decode(const std::string& bytes) {
    try {
        return json::parse(bytes);
    } catch (const json::parse_error& e) {
        throw SerializationError("Cannot decode JSON value: " + std::string(e.what()));
    }
}
