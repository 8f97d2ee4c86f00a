#include "MsgPackCodec.hpp"

#include <cstdint>
#include <vector>

#include "../cache/CacheErrors.hpp"

std::string MsgPackCodec::encode(const json& value) {
    std::vector<std::uint8_t> packed;
    try {
        packed = json::to_msgpack(value);
    } catch (const json::exception& e) {
        throw SerializationError("Cannot encode value as MessagePack: " + std::string(e.what()));
    }
    return std::string(packed.begin(), packed.end());
}

json MsgPackCodec::decode(const std::string& bytes) {
    try {
        return json::from_msgpack(bytes);
    } catch (const json::exception& e) {
        throw SerializationError("Cannot decode MessagePack value: " + std::string(e.what()));
    }
}
