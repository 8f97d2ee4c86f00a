#pragma once

#include "../interfaces/ValueCodec.hpp"

class JsonCodec : public ValueCodec {
public:
    std::string encode(const json& value) override;
    json decode(const std::string& bytes) override;
    std::string name() const override { return "json"; }
};
