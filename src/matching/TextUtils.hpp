#pragma once

#include <string>
#include <vector>

namespace matching
{

/// U+FFFD, substituted for each byte that does not start a valid UTF-8 sequence
constexpr char32_t kReplacementChar = 0xFFFD;

/// UTF-8 to UTF-32 conversion; invalid bytes become kReplacementChar and decoding continues
std::u32string utf8ToUtf32(const std::string& utf8_str);

/// UTF-32 to UTF-8 conversion
std::string utf32ToUtf8(const std::u32string& utf32_str);

/// Copy of @p utf8_str with every invalid byte replaced by U+FFFD
std::string toValidUtf8(const std::string& utf8_str);

/// NFKC normalization followed by Unicode case folding. Invalid bytes are replaced first.
std::string foldCase(const std::string& utf8_str);

/// Letters and numbers in any script
bool isWordChar(char32_t cp);

bool isSpaceChar(char32_t cp);

/// Strips leading and trailing ASCII whitespace
std::string trim(const std::string& text);

std::u32string trim(const std::u32string& text);

/// Splits on runs of whitespace, dropping empty tokens
std::vector<std::u32string> splitTokens(const std::u32string& text);

/// Joins tokens with a single space
std::u32string joinTokens(const std::vector<std::u32string>& tokens);

/// Case-insensitive equality under foldCase
bool equalsIgnoreCase(const std::string& a, const std::string& b);

} // namespace matching
