/**
 * @file Segment.hpp
 * @brief A contiguous, type-classified unit of the original advertising text.
 */

#pragma once

#include <cstddef>
#include <string>

namespace copycheck::domain::compliance {

enum class SegmentType {
    Claim,
    Explanation,
    Evidence,
    Cta,
    Disclaimer,
    Unknown
};

inline std::string SegmentTypeToString(SegmentType type) {
    switch (type) {
        case SegmentType::Claim: return "claim";
        case SegmentType::Explanation: return "explanation";
        case SegmentType::Evidence: return "evidence";
        case SegmentType::Cta: return "cta";
        case SegmentType::Disclaimer: return "disclaimer";
        default: return "unknown";
    }
}

inline SegmentType SegmentTypeFromString(const std::string& type) {
    if (type == "claim") return SegmentType::Claim;
    if (type == "explanation") return SegmentType::Explanation;
    if (type == "evidence") return SegmentType::Evidence;
    if (type == "cta") return SegmentType::Cta;
    if (type == "disclaimer") return SegmentType::Disclaimer;
    return SegmentType::Unknown;
}

/**
 * @struct TextSpan
 * @brief Half-open range of code point offsets.
 */
struct TextSpan {
    std::size_t start = 0; ///< First code point.
    std::size_t end = 0;   ///< One past the last code point.

    std::size_t Length() const { return end - start; }

    bool operator==(const TextSpan& other) const { return start == other.start && end == other.end; }
    bool operator!=(const TextSpan& other) const { return !(*this == other); }
};

/**
 * @struct Segment
 * @brief Verbatim slice of the input with its inferred role.
 */
struct Segment {
    std::string id;                          ///< "seg_001", "seg_002", ...
    std::string text;                        ///< Exact bytes of the input covered by position.
    SegmentType type = SegmentType::Unknown; ///< Inferred role of the unit.
    TextSpan position;                       ///< Code point range in the input.
    int line = 1;                            ///< 1-based line on which the segment starts.

    bool operator==(const Segment& other) const {
        return id == other.id && text == other.text && type == other.type &&
               position == other.position && line == other.line;
    }
};

} // namespace copycheck::domain::compliance
