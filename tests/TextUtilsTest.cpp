// File: TextUtilsTest.cpp
// Description: Tests tokenizing, lowercasing and UTF-16 decoding helpers.

#include "backend/TextUtils.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace std::string_literals;

namespace {

std::string utf16le(const std::u16string& text, bool withBom) {
    std::string bytes;
    if (withBom) {
        bytes += "\xFF\xFE";
    }
    for (const char16_t unit : text) {
        bytes.push_back(static_cast<char>(unit & 0xFF));
        bytes.push_back(static_cast<char>((unit >> 8) & 0xFF));
    }
    return bytes;
}

std::string utf16be(const std::u16string& text) {
    std::string bytes = "\xFE\xFF";
    for (const char16_t unit : text) {
        bytes.push_back(static_cast<char>((unit >> 8) & 0xFF));
        bytes.push_back(static_cast<char>(unit & 0xFF));
    }
    return bytes;
}

}  // namespace

TEST(TextUtils, splitWhitespaceSkipsRuns)
{
    const std::vector<std::string> expected{"a", "b", "c"};
    EXPECT_EQ(expected, backend::splitWhitespace("  a\tb \r\n c  "));
    EXPECT_TRUE(backend::splitWhitespace(" \t ").empty());
}

TEST(TextUtils, splitWhitespaceTreatsNoBreakSpaceAsSeparator)
{
    const std::vector<std::string> expected{"Иван", "Петров", "Сергеевич"};
    EXPECT_EQ(expected, backend::splitWhitespace("Иван\xC2\xA0Петров \xC2\xA0Сергеевич"));
    EXPECT_TRUE(backend::splitWhitespace("\xC2\xA0").empty());
}

TEST(TextUtils, splitKeepsEmptyFields)
{
    const std::vector<std::string> expected{"", "a", "", "b", ""};
    EXPECT_EQ(expected, backend::split(":a::b:", ':'));
    EXPECT_EQ(std::vector<std::string>{""}, backend::split("", ':'));
}

TEST(TextUtils, joinAndTrim)
{
    EXPECT_EQ("a b c", backend::join({"a", "b", "c"}, " "));
    EXPECT_EQ("", backend::join({}, " "));
    EXPECT_EQ("x y", backend::trim("  x y \n"));
}

TEST(TextUtils, lowercasesLatinAndCyrillic)
{
    EXPECT_EQ("(guest)", backend::toLowerUtf8("(Guest)"));
    EXPECT_EQ("мп-21", backend::toLowerUtf8("МП-21"));
    EXPECT_EQ("абвгдежзийклмнопрстуфхцчшщъыьэюя",
              backend::toLowerUtf8("АБВГДЕЖЗИЙКЛМНОПРСТУФХЦЧШЩЪЫЬЭЮЯ"));
    EXPECT_EQ("ёлка", backend::toLowerUtf8("Ёлка"));
}

TEST(TextUtils, decodesLittleEndianWithBom)
{
    EXPECT_EQ("Иван\tA", backend::decodeUtf16(utf16le(u"Иван\tA", true)));
}

TEST(TextUtils, decodesLittleEndianWithoutBom)
{
    EXPECT_EQ("Group", backend::decodeUtf16(utf16le(u"Group", false)));
}

TEST(TextUtils, decodesBigEndian)
{
    EXPECT_EQ("Пара", backend::decodeUtf16(utf16be(u"Пара")));
}

TEST(TextUtils, decodesSurrogatePairs)
{
    EXPECT_EQ("\xF0\x9F\x98\x80", backend::decodeUtf16(utf16le(u"\U0001F600", true)));
}

TEST(TextUtils, brokenInputDecodesToReplacement)
{
    const std::string replacement = "\xEF\xBF\xBD";
    std::string lone = utf16le(u"a", true);
    lone += "\x00\xD8"s;
    lone += utf16le(u"b", false);
    EXPECT_EQ("a" + replacement + "b", backend::decodeUtf16(lone));

    std::string odd = utf16le(u"a", true);
    odd.push_back('x');
    EXPECT_EQ("a" + replacement, backend::decodeUtf16(odd));
}

TEST(TextUtils, detectsUtf8Bom)
{
    EXPECT_TRUE(backend::startsWithUtf8Bom("\xEF\xBB\xBFtext"));
    EXPECT_FALSE(backend::startsWithUtf8Bom("text"));
    EXPECT_FALSE(backend::startsWithUtf8Bom("\xEF\xBB"));
}
