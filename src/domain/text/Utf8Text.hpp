/**
 * @file Utf8Text.hpp
 * @brief UTF-8 <-> code point helpers used by the pattern engines.
 *
 * Advertising copy arrives as UTF-8. All pattern work happens on std::wstring,
 * where one wchar_t holds one code point (UTF-32 on Linux), so that regex
 * quantifiers like .{0,20} count characters instead of bytes.
 */

#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace copycheck::domain::text {

/**
 * @struct DecodedText
 * @brief Code point view of a UTF-8 string that remembers where each code point started.
 */
struct DecodedText {
    std::wstring chars;                   ///< One element per code point (U+FFFD for malformed bytes).
    std::vector<std::size_t> byteOffsets; ///< Byte offset of each code point, plus one trailing entry for the total size.

    /** @brief Byte offset of code point @p index (index == chars.size() gives the byte length). */
    std::size_t ByteOffset(std::size_t index) const { return byteOffsets[index]; }
};

/**
 * @brief Decodes UTF-8 into code points. Never fails: each malformed byte becomes one U+FFFD.
 */
DecodedText Decode(const std::string& utf8);

/** @brief Shorthand for Decode(utf8).chars. */
std::wstring ToWide(const std::string& utf8);

/** @brief Encodes code points back into UTF-8. */
std::string ToUtf8(const std::wstring& wide);

/** @brief Encodes the half-open range [begin, end) of @p wide. */
std::string ToUtf8(const std::wstring& wide, std::size_t begin, std::size_t end);

/** @brief Number of code points in a UTF-8 string. */
std::size_t CodePointCount(const std::string& utf8);

/** @brief True for ASCII whitespace and the ideographic space U+3000. */
bool IsSpace(wchar_t c);

/** @brief True when every code point of [begin, end) is whitespace. */
bool IsBlank(const std::wstring& text, std::size_t begin, std::size_t end);

/** @brief Copy of @p text without leading and trailing whitespace (U+3000 included). */
std::wstring Trim(const std::wstring& text);

} // namespace copycheck::domain::text
