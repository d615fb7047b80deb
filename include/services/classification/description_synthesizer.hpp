// BSD 3-Clause License
//
// Copyright (c) 2021-2025, 🍀☀🌕🌥 🌊
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are met:
//
// 1. Redistributions of source code must retain the above copyright notice, this
//    list of conditions and the following disclaimer.
//
// 2. Redistributions in binary form must reproduce the above copyright notice,
//    this list of conditions and the following disclaimer in the documentation
//    and/or other materials provided with the distribution.
//
// 3. Neither the name of the copyright holder nor the names of its
//    contributors may be used to endorse or promote products derived from
//    this software without specific prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
// AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
// IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
// DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE
// FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL
// DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR
// SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER
// CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY,
// OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
// OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.

/**
 * @file description_synthesizer.hpp
 * @brief Natural language description and keyword generation for analyzed images
 * @details Turns an ImageAnalysis into a searchable description and a ranked
 *          keyword set. The language register follows the clinical
 *          significance of the pathology analysis: routine wording when no
 *          findings were detected, follow-up or review wording otherwise.
 *          Pathology phrases are only emitted when findings exist.
 *
 * @author kcenon
 * @since 1.0.0
 */
#pragma once

#include "core/medical_image_types.hpp"
#include "services/classification/keyword_prioritizer.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace med_classifier::services {

/**
 * @brief Description and keyword synthesizer
 *
 * @example
 * @code
 * DescriptionSynthesizer synthesizer;
 * auto analysis = classifier.analyzeMedicalImage(bytes, "scan.png");
 * std::string text = synthesizer.describe(analysis);
 * auto keywords = synthesizer.keywords(analysis);
 * @endcode
 */
class DescriptionSynthesizer {
public:
    static constexpr int kDefaultHighResolutionDimension = 1024;

    explicit DescriptionSynthesizer(
        std::size_t maxKeywords = KeywordPrioritizer::kDefaultMaxKeywords,
        int highResolutionDimension = kDefaultHighResolutionDimension);

    /**
     * @brief Build the full description
     *
     * Clauses are joined by ". " and the text ends with ".". The last clause
     * lists the prioritized keywords when there are any.
     */
    [[nodiscard]] std::string describe(const core::ImageAnalysis& analysis) const;

    /// Deduplicated, prioritized keywords
    [[nodiscard]] std::vector<std::string> keywords(const core::ImageAnalysis& analysis) const;

    /// Keywords in generation order, before deduplication and ranking
    [[nodiscard]] std::vector<std::string> rawKeywords(const core::ImageAnalysis& analysis) const;

    /// Patient-friendly name, e.g. "CT scan"
    [[nodiscard]] static std::string friendlyName(core::MedicalImageType type);

    /// Purpose clause in the register selected by the clinical significance
    [[nodiscard]] static std::string clinicalContext(const core::ImageAnalysis& analysis);

    /// Filename indicators followed by content indicators, unique, in order
    [[nodiscard]] static std::vector<std::string>
    featureIndicators(const core::ImageAnalysis& analysis);

    [[nodiscard]] static std::optional<std::string>
    confidenceDescription(const core::ImageAnalysis& analysis);

    /// Every fixed keyword literal the synthesizer can emit
    [[nodiscard]] static std::vector<std::string_view> vocabulary();

    [[nodiscard]] const KeywordPrioritizer& prioritizer() const noexcept { return prioritizer_; }

private:
    [[nodiscard]] bool isHighResolution(const core::ImageAnalysis& analysis) const;

    KeywordPrioritizer prioritizer_;
    int highResolutionDimension_;
};

}  // namespace med_classifier::services
