#pragma once

#include "../interfaces/ValueCodec.hpp"

// Binary MessagePack encoding; smaller than JSON text for numeric payloads.
class MsgPackCodec : public ValueCodec {
public:
    std::string encode(const json& value) override;
    json decode(const std::string& bytes) override;
    std::string name() const override { return "msgpack"; }
};
