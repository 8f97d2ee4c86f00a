#pragma once

#include <string>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Converts cached values to and from the bytes kept in the store.
// Implementations throw SerializationError on failure.
class ValueCodec {
public:
    virtual ~ValueCodec() = default;
    virtual std::string encode(const json& value) = 0;
    virtual json decode(const std::string& bytes) = 0;
    virtual std::string name() const = 0;
};
