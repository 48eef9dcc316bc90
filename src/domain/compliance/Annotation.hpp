/**
 * @file Annotation.hpp
 * @brief Footnote markers, footnote texts and the bindings between them.
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace copycheck::domain::compliance {

enum class AnnotationScope {
    Segment,
    FullText
};

inline std::string AnnotationScopeToString(AnnotationScope scope) {
    return scope == AnnotationScope::Segment ? "segment" : "fullText";
}

/**
 * @struct AnnotationMarkerOccurrence
 * @brief A keyword immediately followed by a footnote marker, e.g. "クマ※1".
 */
struct AnnotationMarkerOccurrence {
    std::string keyword;    ///< Same-script run before the marker.
    std::string marker;     ///< "※1", "*2", "注3".
    std::size_t position = 0; ///< Code point offset of the keyword.

    bool operator==(const AnnotationMarkerOccurrence& other) const {
        return keyword == other.keyword && marker == other.marker && position == other.position;
    }
};

/**
 * @struct AnnotationFootnote
 * @brief Explanation text attached to a marker, e.g. "（※1乾燥による…）".
 */
struct AnnotationFootnote {
    std::string marker;       ///< "※1", "*1", "注1".
    std::string markerNumber; ///< "1".
    std::string footnoteText; ///< Explanation without the marker.
    std::size_t position = 0; ///< Code point offset of the marker symbol.
    AnnotationScope scope = AnnotationScope::Segment;

    bool operator==(const AnnotationFootnote& other) const {
        return marker == other.marker && markerNumber == other.markerNumber &&
               footnoteText == other.footnoteText && position == other.position && scope == other.scope;
    }
};

/**
 * @struct AnnotationBinding
 * @brief Resolved association between a marker occurrence and its footnote.
 */
struct AnnotationBinding {
    std::string keyword;
    std::string marker;
    std::optional<std::string> footnoteText;
    std::optional<AnnotationScope> scope;
    bool isValid = false; ///< True iff a footnote with the same marker was found.

    bool operator==(const AnnotationBinding& other) const {
        return keyword == other.keyword && marker == other.marker && footnoteText == other.footnoteText &&
               scope == other.scope && isValid == other.isValid;
    }
};

/**
 * @struct AnnotationAnalysis
 * @brief Everything the analyzer found for one segment.
 */
struct AnnotationAnalysis {
    std::vector<AnnotationMarkerOccurrence> markerOccurrences;
    std::vector<AnnotationFootnote> footnotes;
    std::vector<AnnotationBinding> bindings;
    bool hasAnnotatedKeywords = false;

    bool operator==(const AnnotationAnalysis& other) const {
        return markerOccurrences == other.markerOccurrences && footnotes == other.footnotes &&
               bindings == other.bindings && hasAnnotatedKeywords == other.hasAnnotatedKeywords;
    }
};

} // namespace copycheck::domain::compliance
