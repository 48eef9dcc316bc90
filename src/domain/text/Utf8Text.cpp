/**
 * @file Utf8Text.cpp
 * @brief Implementation of the UTF-8 helpers.
 */

#include "domain/text/Utf8Text.hpp"

namespace copycheck::domain::text {

namespace {

constexpr wchar_t kReplacementChar = 0xFFFD;

bool IsContinuation(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

// Returns the sequence length for a well-formed code point at data[pos], or 0.
std::size_t SequenceLength(const std::string& data, std::size_t pos, char32_t& codePoint) {
    const auto lead = static_cast<unsigned char>(data[pos]);
    const std::size_t remaining = data.size() - pos;

    if (lead < 0x80) {
        codePoint = lead;
        return 1;
    }

    std::size_t length = 0;
    char32_t value = 0;
    unsigned char minSecond = 0x80;
    unsigned char maxSecond = 0xBF;

    if (lead >= 0xC2 && lead <= 0xDF) {
        length = 2;
        value = lead & 0x1F;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        length = 3;
        value = lead & 0x0F;
        if (lead == 0xE0) minSecond = 0xA0; // overlong
        if (lead == 0xED) maxSecond = 0x9F; // surrogates
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        length = 4;
        value = lead & 0x07;
        if (lead == 0xF0) minSecond = 0x90;
        if (lead == 0xF4) maxSecond = 0x8F;
    } else {
        return 0;
    }

    if (remaining < length) return 0;

    const auto second = static_cast<unsigned char>(data[pos + 1]);
    if (second < minSecond || second > maxSecond) return 0;

    for (std::size_t i = 1; i < length; ++i) {
        const auto c = static_cast<unsigned char>(data[pos + i]);
        if (!IsContinuation(c)) return 0;
        value = (value << 6) | (c & 0x3F);
    }

    codePoint = value;
    return length;
}

void AppendUtf8(std::string& out, char32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp <= 0x10FFFF) {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        AppendUtf8(out, kReplacementChar);
    }
}

} // namespace

DecodedText Decode(const std::string& utf8) {
    DecodedText decoded;
    decoded.chars.reserve(utf8.size());
    decoded.byteOffsets.reserve(utf8.size() + 1);

    std::size_t pos = 0;
    while (pos < utf8.size()) {
        char32_t cp = 0;
        std::size_t length = SequenceLength(utf8, pos, cp);
        decoded.byteOffsets.push_back(pos);
        if (length == 0) {
            decoded.chars.push_back(kReplacementChar);
            pos += 1;
        } else {
            decoded.chars.push_back(static_cast<wchar_t>(cp));
            pos += length;
        }
    }
    decoded.byteOffsets.push_back(utf8.size());
    return decoded;
}

std::wstring ToWide(const std::string& utf8) {
    return Decode(utf8).chars;
}

std::string ToUtf8(const std::wstring& wide) {
    return ToUtf8(wide, 0, wide.size());
}

std::string ToUtf8(const std::wstring& wide, std::size_t begin, std::size_t end) {
    std::string out;
    if (end > wide.size()) end = wide.size();
    if (begin >= end) return out;
    out.reserve((end - begin) * 3);
    for (std::size_t i = begin; i < end; ++i) {
        AppendUtf8(out, static_cast<char32_t>(wide[i]));
    }
    return out;
}

std::size_t CodePointCount(const std::string& utf8) {
    std::size_t count = 0;
    std::size_t pos = 0;
    while (pos < utf8.size()) {
        char32_t cp = 0;
        std::size_t length = SequenceLength(utf8, pos, cp);
        pos += length == 0 ? 1 : length;
        ++count;
    }
    return count;
}

bool IsSpace(wchar_t c) {
    return c == L' ' || c == L'\t' || c == L'\n' || c == L'\r' || c == L'\f' || c == L'\v' ||
           c == 0x3000;
}

bool IsBlank(const std::wstring& text, std::size_t begin, std::size_t end) {
    for (std::size_t i = begin; i < end && i < text.size(); ++i) {
        if (!IsSpace(text[i])) return false;
    }
    return true;
}

std::wstring Trim(const std::wstring& text) {
    std::size_t begin = 0;
    std::size_t end = text.size();
    while (begin < end && IsSpace(text[begin])) ++begin;
    while (end > begin && IsSpace(text[end - 1])) --end;
    return text.substr(begin, end - begin);
}

} // namespace copycheck::domain::text
