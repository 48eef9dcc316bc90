/**
 * @file AnnotationAnalyzer.cpp
 * @brief Implementation of the annotation analyzer.
 */

#include "domain/compliance/AnnotationAnalyzer.hpp"

#include <algorithm>
#include <map>
#include <set>
#include <utility>

#include "domain/text/Utf8Text.hpp"

namespace copycheck::domain::compliance {

namespace {

enum class ScriptClass {
    None,
    Katakana,
    Kanji,
    Hiragana,
    Alphanumeric
};

ScriptClass ClassOf(wchar_t c) {
    if ((c >= 0x30A1 && c <= 0x30F6) || c == 0x30FC) return ScriptClass::Katakana; // ァ-ヶ, ー
    if ((c >= 0x4E00 && c <= 0x9FA0) || c == 0x3005) return ScriptClass::Kanji;    // 一-龠, 々
    if (c >= 0x3041 && c <= 0x3093) return ScriptClass::Hiragana;                   // ぁ-ん
    if ((c >= L'a' && c <= L'z') || (c >= L'A' && c <= L'Z') || (c >= L'0' && c <= L'9')) {
        return ScriptClass::Alphanumeric;
    }
    return ScriptClass::None;
}

bool IsDigit(wchar_t c) {
    return c >= L'0' && c <= L'9';
}

bool IsAsterisk(wchar_t c) {
    return c == L'*' || c == L'＊';
}

bool IsSeparator(wchar_t c) {
    return c == L' ' || c == L'\t' || c == L'　' || c == L':' || c == L'：';
}

// Canonical family symbol, or 0 when c does not start a marker.
wchar_t MarkerFamily(wchar_t c) {
    if (c == L'※') return L'※';
    if (IsAsterisk(c)) return L'*';
    if (c == L'注') return L'注';
    return 0;
}

bool IsFamilySymbol(wchar_t c, wchar_t family) {
    return family == L'*' ? IsAsterisk(c) : c == family;
}

std::size_t SkipDigits(const std::wstring& text, std::size_t pos) {
    while (pos < text.size() && IsDigit(text[pos])) ++pos;
    return pos;
}

enum class ShapeKind {
    Bracketed,  ///< open, symbol, number, text, close
    AfterSpace, ///< whitespace, ※, number, text up to the next whitespace
    LineStart   ///< symbol and number at the beginning of a line, text to the end of it
};

struct FootnoteShape {
    const char* name;
    wchar_t family;      ///< Reported marker family.
    ShapeKind kind;
    wchar_t open;        ///< Opening bracket, unused otherwise.
    wchar_t close;       ///< Closing bracket, unused otherwise.
    bool needsSeparator; ///< LineStart: a colon or space must follow the number.
};

// Ordered list; every shape is applied to the whole text and the results merged.
const FootnoteShape kShapes[] = {
    {"fullwidth-paren", L'※', ShapeKind::Bracketed, L'（', L'）', false},
    {"fullwidth-paren-asterisk", L'*', ShapeKind::Bracketed, L'（', L'）', false},
    {"paren", L'※', ShapeKind::Bracketed, L'(', L')', false},
    {"paren-asterisk", L'*', ShapeKind::Bracketed, L'(', L')', false},
    {"after-space", L'※', ShapeKind::AfterSpace, 0, 0, false},
    {"line-start", L'※', ShapeKind::LineStart, 0, 0, false},
    {"line-start-word", L'注', ShapeKind::LineStart, 0, 0, true},
};

struct FootnoteHit {
    std::size_t symbol; ///< Offset of the marker symbol.
    std::size_t numberEnd;
    std::size_t bodyEnd;
};

// "（※1乾燥による）": the body runs to the first closing bracket.
void ScanBracketed(const std::wstring& text, const FootnoteShape& shape, std::vector<FootnoteHit>& hits) {
    // First closing bracket at or after the last lookup; npos once none is left.
    std::size_t close = 0;
    bool closeKnown = false;

    std::size_t pos = 0;
    while (pos + 2 < text.size()) {
        if (text[pos] != shape.open || !IsFamilySymbol(text[pos + 1], shape.family)) {
            ++pos;
            continue;
        }
        const std::size_t numberEnd = SkipDigits(text, pos + 2);
        if (numberEnd == pos + 2) {
            ++pos;
            continue;
        }
        if (!closeKnown || (close != std::wstring::npos && close < numberEnd)) {
            close = text.find(shape.close, numberEnd);
            closeKnown = true;
        }
        if (close == std::wstring::npos) return;
        if (close == numberEnd) {
            ++pos;
            continue;
        }
        hits.push_back({pos + 1, numberEnd, close});
        pos = close + 1;
    }
}

// " ※1保湿成分": the body is the following run of non-blank characters.
void ScanAfterSpace(const std::wstring& text, std::vector<FootnoteHit>& hits) {
    std::size_t pos = 0;
    while (pos + 2 < text.size()) {
        if (!text::IsSpace(text[pos]) || text[pos + 1] != L'※') {
            ++pos;
            continue;
        }
        const std::size_t numberEnd = SkipDigits(text, pos + 2);
        if (numberEnd == pos + 2 || numberEnd >= text.size() || text[numberEnd] == L'※' ||
            text::IsSpace(text[numberEnd])) {
            ++pos;
            continue;
        }
        std::size_t bodyEnd = numberEnd;
        while (bodyEnd < text.size() && !text::IsSpace(text[bodyEnd])) ++bodyEnd;
        hits.push_back({pos + 1, numberEnd, bodyEnd});
        pos = bodyEnd;
    }
}

// "※1 保湿成分" or "注1：整肌成分" at the start of a line.
void ScanLineStart(const std::wstring& text, const FootnoteShape& shape, std::vector<FootnoteHit>& hits) {
    std::size_t lineStart = 0;
    while (lineStart < text.size()) {
        std::size_t lineEnd = text.find(L'\n', lineStart);
        if (lineEnd == std::wstring::npos) lineEnd = text.size();

        if (text[lineStart] == shape.family) {
            const std::size_t numberEnd = SkipDigits(text, lineStart + 1);
            const bool separated = numberEnd < lineEnd && IsSeparator(text[numberEnd]);
            if (numberEnd > lineStart + 1 && (separated || !shape.needsSeparator)) {
                // A ※ footnote stops at the next ※ on the same line.
                std::size_t bodyEnd = numberEnd;
                while (bodyEnd < lineEnd && (shape.needsSeparator || text[bodyEnd] != L'※')) ++bodyEnd;
                hits.push_back({lineStart, numberEnd, bodyEnd});
            }
        }
        lineStart = lineEnd + 1;
    }
}

std::wstring CleanFootnoteText(const std::wstring& raw) {
    std::wstring cleaned = text::Trim(raw);
    std::size_t pos = 0;
    while (pos < cleaned.size() && (cleaned[pos] == L':' || cleaned[pos] == L'：' || text::IsSpace(cleaned[pos]))) {
        ++pos;
    }
    return cleaned.substr(pos);
}

} // namespace

AnnotationAnalysis AnnotationAnalyzer::Analyze(const std::string& segmentText,
                                               const std::optional<std::string>& fullText) const {
    DocumentContext context;
    if (fullText && !fullText->empty()) {
        context.text = text::ToWide(*fullText);
        Prepare(context);
    }
    return AnalyzeDecoded(text::ToWide(segmentText), context);
}

AnnotationAnalysis AnnotationAnalyzer::Analyze(const std::string& segmentText, const DocumentContext& context) const {
    return AnalyzeDecoded(text::ToWide(segmentText), context);
}

void AnnotationAnalyzer::Prepare(DocumentContext& context) const {
    context.footnotes = ExtractFootnotes(context.text, AnnotationScope::FullText);
    context.firstFootnoteByMarker.clear();
    for (std::size_t i = 0; i < context.footnotes.size(); ++i) {
        context.firstFootnoteByMarker.emplace(context.footnotes[i].marker, i);
    }
}

AnnotationAnalysis AnnotationAnalyzer::AnalyzeDecoded(const std::wstring& segment,
                                                      const DocumentContext& context) const {
    AnnotationAnalysis analysis;
    analysis.markerOccurrences = ExtractMarkers(segment);
    analysis.footnotes = ExtractFootnotes(segment, AnnotationScope::Segment);

    std::set<std::string> resolved;
    for (const auto& footnote : analysis.footnotes) resolved.insert(footnote.marker);
    for (const auto& occurrence : analysis.markerOccurrences) {
        if (!resolved.insert(occurrence.marker).second) continue;
        const auto found = context.firstFootnoteByMarker.find(occurrence.marker);
        if (found != context.firstFootnoteByMarker.end()) {
            analysis.footnotes.push_back(context.footnotes[found->second]);
        }
    }

    analysis.bindings = Bind(analysis.markerOccurrences, analysis.footnotes);
    analysis.hasAnnotatedKeywords = !analysis.markerOccurrences.empty();
    return analysis;
}

std::vector<AnnotationMarkerOccurrence> AnnotationAnalyzer::ExtractMarkers(const std::wstring& text) const {
    std::vector<AnnotationMarkerOccurrence> occurrences;

    for (std::size_t i = 0; i < text.size(); ++i) {
        const wchar_t family = MarkerFamily(text[i]);
        if (family == 0) continue;

        const std::size_t digitsEnd = SkipDigits(text, i + 1);
        if (digitsEnd == i + 1) continue;

        // Keyword candidate: the maximal single-script run ending right before the marker.
        std::size_t keywordStart = i;
        if (i > 0) {
            const ScriptClass script = ClassOf(text[i - 1]);
            if (script != ScriptClass::None) {
                while (keywordStart > 0 && ClassOf(text[keywordStart - 1]) == script) --keywordStart;
            }
        }

        if (keywordStart < i) {
            AnnotationMarkerOccurrence occurrence;
            occurrence.keyword = text::ToUtf8(text, keywordStart, i);
            occurrence.marker = text::ToUtf8(std::wstring(1, family) + text.substr(i + 1, digitsEnd - i - 1));
            occurrence.position = keywordStart;
            occurrences.push_back(std::move(occurrence));
        }
        i = digitsEnd - 1;
    }

    return occurrences;
}

std::vector<AnnotationFootnote> AnnotationAnalyzer::ExtractFootnotes(const std::wstring& text,
                                                                     AnnotationScope scope) const {
    std::vector<AnnotationFootnote> footnotes;
    std::set<std::pair<std::string, std::size_t>> seen;

    for (const auto& shape : kShapes) {
        std::vector<FootnoteHit> hits;
        switch (shape.kind) {
            case ShapeKind::Bracketed: ScanBracketed(text, shape, hits); break;
            case ShapeKind::AfterSpace: ScanAfterSpace(text, hits); break;
            case ShapeKind::LineStart: ScanLineStart(text, shape, hits); break;
        }

        for (const auto& hit : hits) {
            const std::wstring body = CleanFootnoteText(text.substr(hit.numberEnd, hit.bodyEnd - hit.numberEnd));
            if (body.empty()) continue;

            const std::wstring number = text.substr(hit.symbol + 1, hit.numberEnd - hit.symbol - 1);
            AnnotationFootnote footnote;
            footnote.marker = text::ToUtf8(std::wstring(1, shape.family) + number);
            footnote.markerNumber = text::ToUtf8(number);
            footnote.footnoteText = text::ToUtf8(body);
            footnote.position = hit.symbol;
            footnote.scope = scope;

            // The same footnote can be seen by two shapes ("\n※1…" is after-space and line-start).
            if (!seen.emplace(footnote.marker, footnote.position).second) continue;
            footnotes.push_back(std::move(footnote));
        }
    }

    std::stable_sort(footnotes.begin(), footnotes.end(),
                     [](const AnnotationFootnote& a, const AnnotationFootnote& b) { return a.position < b.position; });
    return footnotes;
}

std::vector<AnnotationBinding> AnnotationAnalyzer::Bind(const std::vector<AnnotationMarkerOccurrence>& occurrences,
                                                        const std::vector<AnnotationFootnote>& footnotes) const {
    std::map<std::string, const AnnotationFootnote*> segmentScope;
    std::map<std::string, const AnnotationFootnote*> fullTextScope;
    for (const auto& footnote : footnotes) {
        auto& index = footnote.scope == AnnotationScope::Segment ? segmentScope : fullTextScope;
        index.emplace(footnote.marker, &footnote);
    }

    std::vector<AnnotationBinding> bindings;
    bindings.reserve(occurrences.size());

    for (const auto& occurrence : occurrences) {
        const AnnotationFootnote* found = nullptr;
        if (auto local = segmentScope.find(occurrence.marker); local != segmentScope.end()) {
            found = local->second;
        } else if (auto full = fullTextScope.find(occurrence.marker); full != fullTextScope.end()) {
            found = full->second;
        }

        AnnotationBinding binding;
        binding.keyword = occurrence.keyword;
        binding.marker = occurrence.marker;
        if (found) {
            binding.footnoteText = found->footnoteText;
            binding.scope = found->scope;
            binding.isValid = true;
        }
        bindings.push_back(std::move(binding));
    }

    return bindings;
}

} // namespace copycheck::domain::compliance
