// File: TextUtils.hpp
// Description: Declares string helpers shared by the parsers: tokenizing,
//              trimming, UTF-8 aware lowercasing and UTF-16 decoding.

#pragma once

#include <string>
#include <vector>

namespace backend {

std::string trim(const std::string& input);

// Splits on runs of ASCII whitespace; never yields empty tokens.
std::vector<std::string> splitWhitespace(const std::string& input);

// Splits on every occurrence of the delimiter; keeps empty fields.
std::vector<std::string> split(const std::string& input, char delimiter);

std::string join(const std::vector<std::string>& parts, const std::string& separator);

// Lowercases ASCII and the Cyrillic block (U+0400..U+042F) of UTF-8 text.
std::string toLowerUtf8(const std::string& input);

std::string removeAll(std::string input, char target);

bool startsWithUtf8Bom(const std::string& bytes);

// Decodes UTF-16 bytes to UTF-8. A leading BOM selects the byte order and is
// dropped; without one the input is read as little-endian. Unpaired
// surrogates and a trailing odd byte decode to U+FFFD.
std::string decodeUtf16(const std::string& bytes);

}  // namespace backend
