/**
 * @file Segmenter.hpp
 * @brief Rule-based splitter that turns advertising copy into ordered, typed segments.
 */

#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "domain/compliance/Segment.hpp"

namespace copycheck::domain::compliance {

/**
 * @class Segmenter
 * @brief Splits text at structural, line and sentence boundaries, then classifies each unit.
 *
 * Pure and synchronous. Segment texts are verbatim slices of the input: concatenating
 * them in order gives back the input byte for byte.
 */
class Segmenter {
public:
    static constexpr std::size_t DefaultMaxInputLength = 50000;

    struct Options {
        std::size_t maxInputLength = DefaultMaxInputLength; ///< In code points.
        std::vector<std::string> claimKeywords;             ///< Product keywords that mark a unit as a claim.
    };

    Segmenter() = default;
    explicit Segmenter(Options options);

    /**
     * @brief Splits @p text into segments.
     * @throws InvalidInputError when the text is empty or longer than maxInputLength.
     */
    std::vector<Segment> SegmentText(const std::string& text) const;

    /** @brief Classifies one unit of text. Never throws; falls back to Unknown. */
    SegmentType Classify(const std::wstring& unit) const;

private:
    Options m_options;
    std::vector<std::wstring> m_claimKeywords;
};

} // namespace copycheck::domain::compliance
