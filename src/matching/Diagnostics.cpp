#include "Diagnostics.hpp"

#include <algorithm>

namespace matching
{

std::atomic<bool> Diagnostics::s_verbose{ false };
std::atomic<std::size_t> Diagnostics::s_max_preview{ kDefaultMaxPreview };

namespace
{

bool isContinuationByte(char ch)
{
    return (static_cast<unsigned char>(ch) & 0xC0) == 0x80;
}

} // namespace

void Diagnostics::SetVerbose(bool enabled) noexcept { s_verbose.store(enabled, std::memory_order_relaxed); }

bool Diagnostics::IsVerbose() noexcept { return s_verbose.load(std::memory_order_relaxed); }

void Diagnostics::SetMaxPreview(std::size_t bytes) noexcept
{
    s_max_preview.store(std::max<std::size_t>(bytes, 1), std::memory_order_relaxed);
}

std::size_t Diagnostics::MaxPreview() noexcept { return s_max_preview.load(std::memory_order_relaxed); }

std::string Diagnostics::Preview(std::string_view text)
{
    // Cut on a code point boundary so team names in any script stay valid UTF-8
    std::size_t cut = std::min(text.size(), MaxPreview());
    while (cut > 0 && cut < text.size() && isContinuationByte(text[cut]))
        --cut;

    std::string out = "'" + Escape(text.substr(0, cut)) + "'";
    if (cut < text.size())
        out += "... (" + std::to_string(text.size()) + " bytes)";
    return out;
}

std::string Diagnostics::Escape(std::string_view text)
{
    std::string escaped;
    escaped.reserve(text.size());
    for (char ch : text)
    {
        const auto byte = static_cast<unsigned char>(ch);
        if (ch == '\n')
            escaped += "\\n";
        else if (ch == '\r')
            escaped += "\\r";
        else if (ch == '\t')
            escaped += "\\t";
        else if (byte < 0x20 || byte == 0x7F)
            escaped.push_back('?');
        else
            escaped.push_back(ch);
    }
    return escaped;
}

} // namespace matching
