#include "TextUtils.hpp"
#include <utf8proc.h>

#include <cstdlib>

namespace matching
{

std::u32string utf8ToUtf32(const std::string& utf8_str)
{
    std::u32string result;
    if (utf8_str.empty())
        return result;

    const utf8proc_uint8_t* str = reinterpret_cast<const utf8proc_uint8_t*>(utf8_str.c_str());
    utf8proc_ssize_t len = static_cast<utf8proc_ssize_t>(utf8_str.size());

    utf8proc_ssize_t pos = 0;
    while (pos < len)
    {
        utf8proc_int32_t codepoint;
        utf8proc_ssize_t bytes = utf8proc_iterate(str + pos, len - pos, &codepoint);
        if (bytes <= 0)
        {
            // Substitute the offending byte and resync on the next one
            result.push_back(kReplacementChar);
            ++pos;
            continue;
        }
        result.push_back(static_cast<char32_t>(codepoint));
        pos += bytes;
    }
    return result;
}

std::string utf32ToUtf8(const std::u32string& utf32_str)
{
    std::string result;
    result.reserve(utf32_str.size());
    for (char32_t cp : utf32_str)
    {
        utf8proc_uint8_t buffer[4];
        utf8proc_ssize_t bytes = utf8proc_encode_char(static_cast<utf8proc_int32_t>(cp), buffer);
        if (bytes > 0)
        {
            result.append(reinterpret_cast<const char*>(buffer), static_cast<size_t>(bytes));
        }
    }
    return result;
}

std::string toValidUtf8(const std::string& utf8_str)
{
    if (utf8_str.empty())
        return utf8_str;
    return utf32ToUtf8(utf8ToUtf32(utf8_str));
}

namespace
{

utf8proc_ssize_t mapFolded(const std::string& utf8_str, utf8proc_uint8_t** output)
{
    auto options = static_cast<utf8proc_option_t>(UTF8PROC_STABLE | UTF8PROC_COMPOSE | UTF8PROC_COMPAT |
                                                   UTF8PROC_CASEFOLD);
    return utf8proc_map(reinterpret_cast<const utf8proc_uint8_t*>(utf8_str.data()),
                        static_cast<utf8proc_ssize_t>(utf8_str.size()), output, options);
}

} // namespace

std::string foldCase(const std::string& utf8_str)
{
    if (utf8_str.empty())
        return utf8_str;

    utf8proc_uint8_t* output = nullptr;
    utf8proc_ssize_t result = mapFolded(utf8_str, &output);
    if (result == UTF8PROC_ERROR_INVALIDUTF8)
    {
        result = mapFolded(toValidUtf8(utf8_str), &output);
    }
    if (result < 0 || output == nullptr)
    {
        return toValidUtf8(utf8_str);
    }

    std::string folded(reinterpret_cast<const char*>(output), static_cast<size_t>(result));
    std::free(output);
    return folded;
}

bool isWordChar(char32_t cp)
{
    if (cp < 0x80)
    {
        return (cp >= U'a' && cp <= U'z') || (cp >= U'A' && cp <= U'Z') || (cp >= U'0' && cp <= U'9');
    }

    switch (utf8proc_category(static_cast<utf8proc_int32_t>(cp)))
    {
    case UTF8PROC_CATEGORY_LU:
    case UTF8PROC_CATEGORY_LL:
    case UTF8PROC_CATEGORY_LT:
    case UTF8PROC_CATEGORY_LM:
    case UTF8PROC_CATEGORY_LO:
    case UTF8PROC_CATEGORY_ND:
    case UTF8PROC_CATEGORY_NL:
    case UTF8PROC_CATEGORY_NO:
        return true;
    default:
        return false;
    }
}

bool isSpaceChar(char32_t cp)
{
    if (cp == U' ' || cp == U'\t' || cp == U'\n' || cp == U'\r' || cp == U'\f' || cp == U'\v')
        return true;
    if (cp < 0x80)
        return false;

    switch (utf8proc_category(static_cast<utf8proc_int32_t>(cp)))
    {
    case UTF8PROC_CATEGORY_ZS:
    case UTF8PROC_CATEGORY_ZL:
    case UTF8PROC_CATEGORY_ZP:
        return true;
    default:
        return false;
    }
}

std::string trim(const std::string& text)
{
    const auto start = text.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string::npos)
        return {};
    const auto end = text.find_last_not_of(" \t\n\r\f\v");
    return text.substr(start, end - start + 1);
}

std::u32string trim(const std::u32string& text)
{
    size_t start = 0;
    while (start < text.size() && isSpaceChar(text[start]))
        ++start;
    size_t end = text.size();
    while (end > start && isSpaceChar(text[end - 1]))
        --end;
    return text.substr(start, end - start);
}

std::vector<std::u32string> splitTokens(const std::u32string& text)
{
    std::vector<std::u32string> tokens;
    std::u32string current;
    for (char32_t cp : text)
    {
        if (isSpaceChar(cp))
        {
            if (!current.empty())
            {
                tokens.push_back(std::move(current));
                current.clear();
            }
        }
        else
        {
            current.push_back(cp);
        }
    }
    if (!current.empty())
        tokens.push_back(std::move(current));
    return tokens;
}

std::u32string joinTokens(const std::vector<std::u32string>& tokens)
{
    std::u32string joined;
    for (size_t i = 0; i < tokens.size(); ++i)
    {
        if (i > 0)
            joined.push_back(U' ');
        joined.append(tokens[i]);
    }
    return joined;
}

bool equalsIgnoreCase(const std::string& a, const std::string& b)
{
    if (a == b)
        return true;
    return foldCase(a) == foldCase(b);
}

} // namespace matching
