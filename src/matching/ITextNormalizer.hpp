#pragma once

#include <string>

namespace matching
{

class ITextNormalizer
{
public:
    virtual ~ITextNormalizer() = default;

    // Canonical comparison form of a raw name. Must be idempotent.
    [[nodiscard]] virtual std::string normalize(const std::string& text) const = 0;
};

} // namespace matching
