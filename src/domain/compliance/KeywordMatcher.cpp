/**
 * @file KeywordMatcher.cpp
 * @brief Implementation of the three-tier keyword matcher.
 */

#include "domain/compliance/KeywordMatcher.hpp"

#include <algorithm>
#include <iostream>
#include <map>
#include <regex>

#include "domain/compliance/ComplianceErrors.hpp"
#include "domain/text/Utf8Text.hpp"

namespace copycheck::domain::compliance {

namespace {

constexpr std::size_t kMarkerWindow = 3;     ///< Code points after a keyword where its marker may start.
constexpr std::size_t kProximityWindow = 100; ///< Code points inspected after a bare ※.

bool IsDigit(wchar_t c) {
    return c >= L'0' && c <= L'9';
}

// Non-overlapping literal occurrences, left to right.
std::vector<std::size_t> FindOccurrences(const std::wstring& text, const std::wstring& keyword) {
    std::vector<std::size_t> positions;
    std::size_t pos = text.find(keyword);
    while (pos != std::wstring::npos) {
        positions.push_back(pos);
        pos = text.find(keyword, pos + keyword.size());
    }
    return positions;
}

bool SafeSearch(const std::wstring& text, const CompiledPattern& pattern, const std::string& ruleId) {
    try {
        return std::regex_search(text, pattern.regex);
    } catch (const std::regex_error& e) {
        PatternEvaluationWarning warning{ruleId, pattern.source, e.what()};
        std::cerr << "[KeywordMatcher] " << warning.Describe() << std::endl;
        return false;
    }
}

// Footnote lines themselves ("※1 保湿成分") are never re-checked by the conditional tiers.
bool IsFootnoteLine(const std::wstring& text) {
    const std::wstring trimmed = text::Trim(text);
    return trimmed.size() >= 2 && trimmed[0] == L'※' && IsDigit(trimmed[1]);
}

KeywordMatch MakeMatch(const CompiledRule& compiled, const std::wstring& keyword, std::size_t position) {
    const KeywordRule& rule = compiled.rule;
    KeywordMatch match;
    match.keyword = text::ToUtf8(keyword);
    match.ruleId = rule.id;
    match.tier = rule.tier;
    match.category = rule.category;
    match.severity = rule.severity;
    match.regulatoryClass = rule.regulatoryClass;
    match.rationale = rule.rationale;
    match.referenceHint = rule.referenceHint;
    match.acceptableRewrite = rule.acceptableRewrite;
    match.position = {position, position + keyword.size()};
    return match;
}

struct MarkerRef {
    std::size_t position;
    std::wstring number; ///< Empty for a bare ※.
};

// Marker that starts within kMarkerWindow code points after a keyword, whitespace allowed before it.
std::optional<MarkerRef> FindImmediateMarker(const std::wstring& text, std::size_t keywordEnd) {
    std::size_t pos = keywordEnd;
    const std::size_t limit = std::min(text.size(), keywordEnd + kMarkerWindow);
    while (pos < limit && text::IsSpace(text[pos])) ++pos;
    if (pos >= limit) return std::nullopt;

    const wchar_t symbol = text[pos];
    const bool asterisk = symbol == L'*' || symbol == L'＊' || symbol == L'注';
    if (symbol != L'※' && !asterisk) return std::nullopt;

    std::size_t digitsEnd = pos + 1;
    while (digitsEnd < text.size() && IsDigit(text[digitsEnd])) ++digitsEnd;
    if (asterisk && digitsEnd == pos + 1) return std::nullopt;

    return MarkerRef{pos, text.substr(pos + 1, digitsEnd - pos - 1)};
}

struct Occurrence {
    const CompiledRule* rule;
    std::wstring keyword;
    std::size_t start;
    std::size_t end;
    std::size_t order;
    bool shadowed = false;
};

// A keyword inside a longer hit ("注入" in "直注入") or a repeat of an identical span is dropped.
void ShadowContainedOccurrences(std::vector<Occurrence>& occurrences) {
    std::vector<std::size_t> byLength(occurrences.size());
    for (std::size_t i = 0; i < byLength.size(); ++i) byLength[i] = i;
    std::stable_sort(byLength.begin(), byLength.end(), [&](std::size_t a, std::size_t b) {
        return occurrences[a].end - occurrences[a].start > occurrences[b].end - occurrences[b].start;
    });

    std::vector<const Occurrence*> claimed;
    for (std::size_t index : byLength) {
        Occurrence& occurrence = occurrences[index];
        const bool covered = std::any_of(claimed.begin(), claimed.end(), [&](const Occurrence* other) {
            return other->start <= occurrence.start && occurrence.end <= other->end;
        });
        if (covered) {
            occurrence.shadowed = true;
        } else {
            claimed.push_back(&occurrence);
        }
    }
}

bool AnyException(const CompiledRule& compiled, const std::wstring& context) {
    return std::any_of(compiled.exceptions.begin(), compiled.exceptions.end(), [&](const CompiledPattern& exception) {
        return SafeSearch(context, exception, compiled.rule.id);
    });
}

bool ContainsKeyword(const CompiledRule& compiled, const std::wstring& text) {
    return std::any_of(compiled.keywords.begin(), compiled.keywords.end(), [&](const std::wstring& keyword) {
        return !keyword.empty() && text.find(keyword) != std::wstring::npos;
    });
}

// Exception and footnote lookups of one rule against the whole text.
void ResolveRule(const CompiledRule& compiled, DocumentContext& context) {
    const std::string& id = compiled.rule.id;
    if (!context.preparedRuleIds.insert(id).second) return;

    if (AnyException(compiled, context.text)) context.excusedRuleIds.insert(id);
    if (!compiled.requiredAnnotation) return;
    for (const auto& [number, joined] : context.footnotesByNumber) {
        if (SafeSearch(joined, *compiled.requiredAnnotation, id)) context.annotatedRules.emplace(id, number);
    }
}

bool SatisfiedByDocumentFootnotes(const CompiledRule& compiled, const std::wstring& number,
                                  const DocumentContext& context) {
    const std::string& id = compiled.rule.id;
    if (context.preparedRuleIds.count(id)) return context.annotatedRules.count({id, number}) > 0;
    const auto joined = context.footnotesByNumber.find(number);
    return joined != context.footnotesByNumber.end() && compiled.requiredAnnotation &&
           SafeSearch(joined->second, *compiled.requiredAnnotation, id);
}

} // namespace

KeywordMatcher::KeywordMatcher(std::shared_ptr<const RuleTables> rules) : m_rules(std::move(rules)) {
    if (!m_rules) {
        throw std::invalid_argument("KeywordMatcher requires rule tables");
    }
}

std::vector<KeywordMatch> KeywordMatcher::Match(const std::string& text,
                                                const std::optional<std::string>& fullContext,
                                                const std::string& productId) const {
    DocumentContext context;
    context.text = text::ToWide(fullContext ? *fullContext : text);
    m_analyzer.Prepare(context);
    Prepare(context, productId);
    return Match(text, context, productId);
}

std::vector<KeywordMatch> KeywordMatcher::Match(const std::string& text, const DocumentContext& context,
                                                const std::string& productId) const {
    const std::wstring wide = text::ToWide(text);

    std::vector<KeywordMatch> matches = MatchAbsolute(wide);
    auto conditional = MatchConditional(wide, context, productId);
    auto contextual = MatchContextDependent(wide);
    matches.insert(matches.end(), std::make_move_iterator(conditional.begin()),
                   std::make_move_iterator(conditional.end()));
    matches.insert(matches.end(), std::make_move_iterator(contextual.begin()),
                   std::make_move_iterator(contextual.end()));
    return matches;
}

void KeywordMatcher::Prepare(DocumentContext& context, const std::string& productId) const {
    context.footnotesByNumber.clear();
    for (const auto& footnote : context.footnotes) {
        const std::wstring number = text::ToWide(footnote.markerNumber);
        std::wstring& joined = context.footnotesByNumber[number];
        if (!joined.empty()) joined += L' ';
        joined += L"※" + number + text::ToWide(footnote.footnoteText);
    }

    for (const CompiledRule* compiled : m_rules->Conditional(productId)) {
        if (ContainsKeyword(*compiled, context.text)) ResolveRule(*compiled, context);
    }
}

std::vector<KeywordMatch> KeywordMatcher::MatchAbsolute(const std::wstring& text) const {
    std::vector<KeywordMatch> matches;
    for (const auto& compiled : m_rules->Absolute()) {
        for (const auto& keyword : compiled.keywords) {
            if (keyword.empty()) {
                std::cerr << "[KeywordMatcher] Skipping empty keyword in rule " << compiled.rule.id << std::endl;
                continue;
            }
            for (std::size_t position : FindOccurrences(text, keyword)) {
                KeywordMatch match = MakeMatch(compiled, keyword, position);
                match.reason = "完全NGキーワード「" + match.keyword + "」を検出";
                matches.push_back(std::move(match));
            }
        }
    }
    return matches;
}

std::vector<KeywordMatch> KeywordMatcher::MatchConditional(const std::wstring& text, const DocumentContext& context,
                                                           const std::string& productId) const {
    std::vector<KeywordMatch> matches;
    if (IsFootnoteLine(text)) return matches;

    std::vector<Occurrence> occurrences;
    for (const CompiledRule* compiled : m_rules->Conditional(productId)) {
        for (const auto& keyword : compiled->keywords) {
            if (keyword.empty()) {
                std::cerr << "[KeywordMatcher] Skipping empty keyword in rule " << compiled->rule.id << std::endl;
                continue;
            }
            for (std::size_t position : FindOccurrences(text, keyword)) {
                occurrences.push_back({compiled, keyword, position, position + keyword.size(), occurrences.size()});
            }
        }
    }
    if (occurrences.empty()) return matches;
    ShadowContainedOccurrences(occurrences);

    // The segment's own footnotes are only extracted once a numbered marker needs them.
    std::optional<std::vector<AnnotationFootnote>> footnotes;
    auto segmentFootnotesFor = [&](const std::wstring& number) {
        if (!footnotes) footnotes = m_analyzer.ExtractFootnotes(text, AnnotationScope::Segment);
        const std::string wanted = text::ToUtf8(number);
        std::wstring joined;
        for (const auto& footnote : *footnotes) {
            if (footnote.markerNumber != wanted) continue;
            if (!joined.empty()) joined += L' ';
            joined += L"※" + number + text::ToWide(footnote.footnoteText);
        }
        return joined;
    };

    // Rules the document was not prepared for are looked up once per call.
    std::map<const CompiledRule*, bool> excused;
    auto isExcused = [&](const CompiledRule& compiled) {
        if (context.preparedRuleIds.count(compiled.rule.id)) return context.excusedRuleIds.count(compiled.rule.id) > 0;
        auto cached = excused.find(&compiled);
        if (cached == excused.end()) cached = excused.emplace(&compiled, AnyException(compiled, context.text)).first;
        return cached->second;
    };

    for (const auto& occurrence : occurrences) {
        if (occurrence.shadowed) continue;
        const CompiledRule& compiled = *occurrence.rule;

        bool satisfied = false;
        if (compiled.requiredAnnotation) {
            if (auto marker = FindImmediateMarker(text, occurrence.end)) {
                if (marker->number.empty()) {
                    satisfied = SafeSearch(text.substr(marker->position, kProximityWindow),
                                           *compiled.requiredAnnotation, compiled.rule.id);
                } else {
                    const std::wstring local = segmentFootnotesFor(marker->number);
                    satisfied = (!local.empty() && SafeSearch(local, *compiled.requiredAnnotation, compiled.rule.id)) ||
                                SatisfiedByDocumentFootnotes(compiled, marker->number, context);
                }
            }
        }

        if (!satisfied) satisfied = isExcused(compiled);
        if (satisfied) continue;

        KeywordMatch match = MakeMatch(compiled, occurrence.keyword, occurrence.start);
        match.reason = "条件付きNGキーワード「" + match.keyword + "」を検出（必須注釈なし）";
        matches.push_back(std::move(match));
    }

    return matches;
}

std::vector<KeywordMatch> KeywordMatcher::MatchContextDependent(const std::wstring& text) const {
    std::vector<KeywordMatch> matches;
    if (IsFootnoteLine(text)) return matches;

    for (const auto& compiled : m_rules->ContextDependent()) {
        if (compiled.ngPatterns.empty()) {
            std::cerr << "[KeywordMatcher] Context rule " << compiled.rule.id << " has no NG patterns; skipped"
                      << std::endl;
            continue;
        }

        std::vector<std::pair<std::wstring, std::size_t>> hits;
        for (const auto& keyword : compiled.keywords) {
            if (keyword.empty()) {
                std::cerr << "[KeywordMatcher] Skipping empty keyword in rule " << compiled.rule.id << std::endl;
                continue;
            }
            for (std::size_t position : FindOccurrences(text, keyword)) hits.emplace_back(keyword, position);
        }
        if (hits.empty()) continue;

        const CompiledContextPattern* violated = nullptr;
        for (const auto& ng : compiled.ngPatterns) {
            if (SafeSearch(text, ng.pattern, compiled.rule.id)) {
                violated = &ng;
                break;
            }
        }
        if (!violated) continue;

        const bool allowed = std::any_of(compiled.okPatterns.begin(), compiled.okPatterns.end(),
                                         [&](const CompiledPattern& ok) {
                                             return SafeSearch(text, ok, compiled.rule.id);
                                         });
        if (allowed) continue;

        for (const auto& [keyword, position] : hits) {
            KeywordMatch match = MakeMatch(compiled, keyword, position);
            match.severity = violated->severity;
            match.reason = "文脈依存NGキーワード「" + match.keyword + "」を検出（" + violated->reason + "）";
            matches.push_back(std::move(match));
        }
    }

    return matches;
}

} // namespace copycheck::domain::compliance
