/**
 * @file AnnotationAnalyzer.hpp
 * @brief Finds footnote markers, footnote texts and binds them together.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "domain/compliance/Annotation.hpp"
#include "domain/compliance/DocumentContext.hpp"

namespace copycheck::domain::compliance {

/**
 * @class AnnotationAnalyzer
 * @brief Stateless analysis of "keyword※1 … ※1 explanation" structures.
 *
 * Recognised marker families are ※N, *N (full-width ＊N is reported as *N) and 注N.
 * Footnote shapes are scanned in a single pass each, so any text up to the input
 * limit is analysed in linear time.
 */
class AnnotationAnalyzer {
public:
    /**
     * @brief Analyzes one segment.
     * @param segmentText Text whose marker occurrences are bound.
     * @param fullText Whole advertisement, searched for footnotes the segment does not carry.
     */
    AnnotationAnalysis Analyze(const std::string& segmentText,
                               const std::optional<std::string>& fullText = std::nullopt) const;

    /**
     * @brief Analyzes one segment of a document prepared with Prepare().
     *
     * The analysis lists the segment's own footnotes plus, for every marker the
     * segment cannot resolve itself, the first full text footnote with that marker.
     */
    AnnotationAnalysis Analyze(const std::string& segmentText, const DocumentContext& context) const;

    /** @brief Extracts the full text footnotes of @p context once per document. */
    void Prepare(DocumentContext& context) const;

    /** @brief Marker occurrences with the same-script keyword run right before each marker. */
    std::vector<AnnotationMarkerOccurrence> ExtractMarkers(const std::wstring& text) const;

    /**
     * @brief Footnote texts found by every known footnote shape.
     * @param text Text to scan.
     * @param scope Scope recorded on each footnote.
     */
    std::vector<AnnotationFootnote> ExtractFootnotes(const std::wstring& text, AnnotationScope scope) const;

    /** @brief Binds each occurrence to a footnote with the same marker, segment scope first. */
    std::vector<AnnotationBinding> Bind(const std::vector<AnnotationMarkerOccurrence>& occurrences,
                                        const std::vector<AnnotationFootnote>& footnotes) const;

private:
    AnnotationAnalysis AnalyzeDecoded(const std::wstring& segment, const DocumentContext& context) const;
};

} // namespace copycheck::domain::compliance
