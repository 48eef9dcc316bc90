/**
 * @file Segmenter.cpp
 * @brief Implementation of the rule-based segmenter.
 */

#include "domain/compliance/Segmenter.hpp"

#include <iomanip>
#include <iostream>
#include <regex>
#include <sstream>

#include "domain/compliance/ComplianceErrors.hpp"
#include "domain/text/Utf8Text.hpp"

namespace copycheck::domain::compliance {

namespace {

constexpr std::size_t kFragmentMergeLimit = 20;

struct CuePattern {
    SegmentType type;
    const char* name;
    std::wregex regex;
};

// Evaluated in order; the first hit decides the type. Every repetition is bounded
// so a long run of text never deepens the regex engine's recursion.
const std::vector<CuePattern>& Cues() {
    static const std::vector<CuePattern> cues = [] {
        const auto flags = std::regex_constants::ECMAScript | std::regex_constants::optimize;
        std::vector<CuePattern> list;
        list.push_back({SegmentType::Disclaimer, "footnote",
                        std::wregex(L"^([※＊*]|注[0-9])", flags)});
        list.push_back({SegmentType::Disclaimer, "caveat",
                        std::wregex(L"個人の感想|個人差があ|効果.{0,10}(保証|異な)|効能効果を示す|イメージです", flags)});
        list.push_back({SegmentType::Cta, "urgency-price",
                        std::wregex(L"(いまなら|今なら|今だけ)[^。\\n]{0,200}?([0-9]{1,12}[,，]?[0-9]{0,12}円|税込|OFF|割引|半額)",
                                    flags)});
        list.push_back({SegmentType::Cta, "limited",
                        std::wregex(L"期間限定|数量限定|(限定|先着)[^。\\n]{0,200}?([0-9]|期間|数量)", flags)});
        list.push_back({SegmentType::Cta, "free",
                        std::wregex(L"実質無料|実質0円|全額返金保証", flags)});
        list.push_back({SegmentType::Cta, "price",
                        std::wregex(L"[0-9]{1,12}[,，]?[0-9]{0,12}円", flags)});
        list.push_back({SegmentType::Cta, "purchase",
                        std::wregex(L"今すぐ|お申し?込み|ご購入|購入はこちら|詳しくはこちら|クリック|タップ", flags)});
        list.push_back({SegmentType::Evidence, "statistics",
                        std::wregex(L"[0-9]{1,12}(\\.[0-9]{1,12})?[ 　]{0,3}[%％]"
                                    L"|[0-9]{1,12}(\\.[0-9]{1,12})?[ 　]{0,3}(人|名|倍|万|件|個|本|時間|日間|週間|ヶ月|か月)"
                                    L"|調査|臨床|試験|実証|データ|満足度|ランキング|[Nn][Oo]\\.?[ 　]{0,3}1|第?[1一]位|モニター|自社調べ",
                                    flags)});
        list.push_back({SegmentType::Explanation, "connective",
                        std::wregex(L"ため|なので|だから|によって|により|ことで|なぜなら|というのも|つまり|そのため|実は|とは", flags)});
        list.push_back({SegmentType::Claim, "assertive",
                        std::wregex(L"ます|です|ません|ください|！|!|導|叶え|叶う|あなた|実現", flags)});
        return list;
    }();
    return cues;
}

bool CueMatches(const CuePattern& cue, const std::wstring& unit) {
    try {
        return std::regex_search(unit, cue.regex);
    } catch (const std::regex_error& e) {
        std::cerr << "[Segmenter] Cue '" << cue.name << "' failed: " << e.what() << std::endl;
        return false;
    }
}

bool IsLineBreak(wchar_t c) {
    return c == L'\n' || c == L'\r';
}

bool IsSentenceEnd(wchar_t c) {
    return c == L'。' || c == L'．' || c == L'！' || c == L'？' || c == L'!' || c == L'?';
}

bool IsOpeningBracket(wchar_t c) {
    return c == L'（' || c == L'(' || c == L'「' || c == L'『';
}

bool IsClosingBracket(wchar_t c) {
    return c == L'）' || c == L')' || c == L'」' || c == L'』';
}

bool IsTrailingCloser(wchar_t c) {
    return IsClosingBracket(c) || c == L'”' || c == L'’' || c == L'"' || c == L'\'';
}

bool IsMarkerSymbol(wchar_t c) {
    return c == L'※' || c == L'＊' || c == L'*';
}

bool IsDigit(wchar_t c) {
    return c >= L'0' && c <= L'9';
}

// "殺菌※2" or "殺菌※2 " (whitespace allowed after the number).
bool EndsWithMarker(const std::wstring& chars, std::size_t begin, std::size_t end) {
    std::size_t pos = end;
    while (pos > begin && text::IsSpace(chars[pos - 1])) --pos;
    std::size_t digitsEnd = pos;
    while (pos > begin && IsDigit(chars[pos - 1])) --pos;
    if (pos == digitsEnd) return false;
    return pos > begin && IsMarkerSymbol(chars[pos - 1]);
}

bool StartsWithFootnote(const std::wstring& chars, std::size_t begin, std::size_t end) {
    std::size_t pos = begin;
    while (pos < end && text::IsSpace(chars[pos])) ++pos;
    if (pos >= end) return false;
    if (IsMarkerSymbol(chars[pos])) return true;
    return chars[pos] == L'注' && pos + 1 < end && IsDigit(chars[pos + 1]);
}

struct Piece {
    std::size_t begin;
    std::size_t end;
};

std::vector<std::size_t> FindBoundaries(const std::wstring& chars) {
    const std::size_t n = chars.size();
    std::vector<bool> cut(n + 1, false);
    std::vector<bool> structural(n, false);

    // 1. 【…】 lead-ins stand alone.
    for (std::size_t i = 0; i < n; ++i) {
        if (chars[i] != L'【') continue;
        std::size_t j = i + 1;
        while (j < n && chars[j] != L'】' && chars[j] != L'【' && !IsLineBreak(chars[j])) ++j;
        if (j < n && chars[j] == L'】' && j > i + 1) {
            cut[i] = true;
            cut[j + 1] = true;
            for (std::size_t k = i; k <= j; ++k) structural[k] = true;
            i = j;
        }
    }

    // 2. Line breaks end a unit; the break stays with the preceding text.
    for (std::size_t i = 0; i < n; ++i) {
        if (!IsLineBreak(chars[i])) continue;
        std::size_t j = i;
        while (j < n && IsLineBreak(chars[j])) ++j;
        cut[j] = true;
        i = j - 1;
    }

    // 3. Sentence-final punctuation outside brackets.
    int depth = 0;
    for (std::size_t i = 0; i < n; ++i) {
        const wchar_t c = chars[i];
        if (IsLineBreak(c)) {
            depth = 0;
            continue;
        }
        if (structural[i]) continue;
        if (IsOpeningBracket(c)) {
            ++depth;
            continue;
        }
        if (IsClosingBracket(c)) {
            if (depth > 0) --depth;
            continue;
        }
        if (!IsSentenceEnd(c) || depth > 0) continue;
        std::size_t j = i + 1;
        while (j < n && IsSentenceEnd(chars[j])) ++j;
        while (j < n && IsTrailingCloser(chars[j])) ++j;
        cut[j] = true;
        i = j - 1;
    }

    std::vector<std::size_t> boundaries;
    for (std::size_t i = 1; i < n; ++i) {
        if (cut[i]) boundaries.push_back(i);
    }
    return boundaries;
}

std::vector<Piece> BuildPieces(const std::wstring& chars) {
    std::vector<Piece> raw;
    std::size_t start = 0;
    for (std::size_t boundary : FindBoundaries(chars)) {
        raw.push_back({start, boundary});
        start = boundary;
    }
    raw.push_back({start, chars.size()});

    // Blank pieces join their predecessor (or successor at the very start).
    std::vector<Piece> pieces;
    for (const auto& piece : raw) {
        if (text::IsBlank(chars, piece.begin, piece.end) && !pieces.empty()) {
            pieces.back().end = piece.end;
            continue;
        }
        if (!pieces.empty() && text::IsBlank(chars, pieces.back().begin, pieces.back().end)) {
            pieces.back().end = piece.end;
            continue;
        }
        pieces.push_back(piece);
    }

    // "殺菌※2" + "する薬用ジェル" -> "殺菌※2する薬用ジェル"
    std::vector<Piece> merged;
    for (std::size_t i = 0; i < pieces.size(); ++i) {
        Piece current = pieces[i];
        while (i + 1 < pieces.size() && EndsWithMarker(chars, current.begin, current.end)) {
            const Piece& next = pieces[i + 1];
            if (next.end - next.begin > kFragmentMergeLimit) break;
            if (StartsWithFootnote(chars, next.begin, next.end)) break;
            current.end = next.end;
            ++i;
        }
        merged.push_back(current);
    }
    return merged;
}

std::string MakeSegmentId(std::size_t index) {
    std::ostringstream id;
    id << "seg_" << std::setw(3) << std::setfill('0') << index;
    return id.str();
}

} // namespace

Segmenter::Segmenter(Options options) : m_options(std::move(options)) {
    for (const auto& keyword : m_options.claimKeywords) {
        if (!keyword.empty()) m_claimKeywords.push_back(text::ToWide(keyword));
    }
}

std::vector<Segment> Segmenter::SegmentText(const std::string& text) const {
    if (text.empty()) {
        throw InvalidInputError("Advertising text must not be empty.");
    }

    const text::DecodedText decoded = text::Decode(text);
    const std::wstring& chars = decoded.chars;
    if (chars.size() > m_options.maxInputLength) {
        throw InvalidInputError("Advertising text has " + std::to_string(chars.size()) +
                                " characters; the maximum is " + std::to_string(m_options.maxInputLength) + ".");
    }

    std::vector<Segment> segments;
    int line = 1;
    std::size_t lineCursor = 0;

    for (const auto& piece : BuildPieces(chars)) {
        for (; lineCursor < piece.begin; ++lineCursor) {
            const wchar_t c = chars[lineCursor];
            if (c == L'\n' || (c == L'\r' && (lineCursor + 1 >= chars.size() || chars[lineCursor + 1] != L'\n'))) {
                ++line;
            }
        }

        const std::size_t byteBegin = decoded.ByteOffset(piece.begin);
        const std::size_t byteEnd = decoded.ByteOffset(piece.end);

        Segment segment;
        segment.id = MakeSegmentId(segments.size() + 1);
        segment.text = text.substr(byteBegin, byteEnd - byteBegin);
        segment.type = Classify(chars.substr(piece.begin, piece.end - piece.begin));
        segment.position = {piece.begin, piece.end};
        segment.line = line;
        segments.push_back(std::move(segment));
    }

    return segments;
}

SegmentType Segmenter::Classify(const std::wstring& unit) const {
    const std::wstring trimmed = text::Trim(unit);
    if (trimmed.empty()) return SegmentType::Unknown;

    const auto& cues = Cues();
    std::size_t next = 0;
    for (; next < cues.size() && cues[next].type == SegmentType::Disclaimer; ++next) {
        if (CueMatches(cues[next], trimmed)) return SegmentType::Disclaimer;
    }

    if (trimmed.front() == L'【' && trimmed.back() == L'】') {
        return SegmentType::Claim;
    }

    for (; next < cues.size(); ++next) {
        if (CueMatches(cues[next], trimmed)) return cues[next].type;
    }

    for (const auto& keyword : m_claimKeywords) {
        if (trimmed.find(keyword) != std::wstring::npos) return SegmentType::Claim;
    }

    return SegmentType::Unknown;
}

} // namespace copycheck::domain::compliance
