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
 * @file pathology_analyzer.hpp
 * @brief Type-specific estimation of pathological signal strength
 * @details Dermatological images get a weighted multi-signal score (color
 *          variation, redness, pigmentation, borders, texture, lesions and
 *          tone variation). Radiological, clinical photo and histology images
 *          get conservative fixed rules. The result only selects the
 *          register of the generated text; it is never a diagnosis.
 *
 * @author kcenon
 * @since 1.0.0
 */
#pragma once

#include "core/classifier_config.hpp"
#include "core/image_decoder.hpp"
#include "core/medical_image_types.hpp"
#include "services/classification/feature_extractor.hpp"

#include <vector>

namespace med_classifier::services {

/**
 * @brief Pathology indicator analyzer
 *
 * @example
 * @code
 * PathologyAnalyzer analyzer(config.dermatology, config.review);
 * auto findings = analyzer.analyze(MedicalImageType::DermatologicalImage, planes, features);
 * if (findings.hasPathologicalFindings) {
 *     // follow-up register
 * }
 * @endcode
 */
class PathologyAnalyzer {
public:
    /// @throws std::invalid_argument when either parameter set fails validation
    PathologyAnalyzer(core::DermatologyParameters dermatology = {},
                      core::ReviewParameters review = {});

    /**
     * @brief Dispatch on the image category
     *
     * Types without a dedicated analysis get a limited result with routine
     * documentation significance.
     */
    [[nodiscard]] core::PathologyFindings analyze(core::MedicalImageType type,
                                                  const core::ChannelPlanes& planes,
                                                  const ImageFeatures& features) const;

    [[nodiscard]] core::PathologyFindings
    analyzeDermatological(const core::ChannelPlanes& planes,
                          const ImageFeatures& features) const;

    [[nodiscard]] core::PathologyFindings
    analyzeRadiological(const core::TextureMetrics& texture) const;

    [[nodiscard]] core::PathologyFindings
    analyzeClinicalPhotograph(const ImageFeatures& features) const;

    [[nodiscard]] core::PathologyFindings analyzeHistological() const;

    /// No findings, `analysis_limited`, confidence 0
    [[nodiscard]] static core::PathologyFindings
    limitedAnalysis(core::ClinicalSignificance significance);

    /// Significance tier of a dermatology score
    [[nodiscard]] core::ClinicalSignificance dermatologySignificance(double confidence) const;

    /// 0.7 * mean(R / (G + B + 1)) + 0.3 * share above mean + std, capped at 1
    [[nodiscard]] static double rednessScore(const core::ChannelPlanes& planes);

    /// Twice the mean absolute luminance gradient over 255, capped at 1
    [[nodiscard]] static double skinToneVariation(const core::ChannelPlanes& planes);

    /**
     * @brief Count 4-connected dark regions whose area ratio lies within
     *        the configured lesion bounds
     */
    [[nodiscard]] int countPotentialLesions(const std::vector<float>& gray,
                                            int width, int height) const;

private:
    core::DermatologyParameters dermatology_;
    core::ReviewParameters review_;
};

}  // namespace med_classifier::services
