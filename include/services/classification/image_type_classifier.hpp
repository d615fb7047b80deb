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
 * @file image_type_classifier.hpp
 * @brief Rule-based image category inference from file name and pixel features
 * @details A file name naming a modality wins outright. Otherwise grayscale
 *          images go through radiology-oriented size, contrast and histogram
 *          rules, and color images through a fixed cascade of dermatology,
 *          ophthalmology, histology, endoscopy, resolution and document
 *          checks. The result is total and deterministic.
 *
 * @author kcenon
 * @since 1.0.0
 */
#pragma once

#include "core/classifier_config.hpp"
#include "core/image_decoder.hpp"
#include "core/medical_image_types.hpp"
#include "services/classification/feature_extractor.hpp"

#include <string_view>

namespace med_classifier::services {

/**
 * @brief Heuristic image category classifier
 *
 * @example
 * @code
 * ImageTypeClassifier classifier(config.typeClassifier);
 * auto type = classifier.classify("IMG_0042.png", planes, features);
 * @endcode
 */
class ImageTypeClassifier {
public:
    /// @throws std::invalid_argument when the parameters fail validation
    explicit ImageTypeClassifier(core::TypeClassifierParameters parameters = {});

    /**
     * @brief Classify one decoded image
     * @param fileName Upload name; checked first for modality terms
     * @param planes Decoded pixel planes
     * @param features Features computed from the same planes
     */
    [[nodiscard]] core::MedicalImageType classify(std::string_view fileName,
                                                  const core::ChannelPlanes& planes,
                                                  const ImageFeatures& features) const;

    [[nodiscard]] core::MedicalImageType
    classifyGrayscale(int width, int height,
                      const core::IntensityStatistics& intensity,
                      const core::TextureMetrics& texture) const;

    [[nodiscard]] core::MedicalImageType
    classifyColor(const core::ChannelPlanes& planes,
                  const core::ColorStatistics& color,
                  const core::TextureMetrics& texture) const;

    [[nodiscard]] bool hasDermatologicalSignal(const core::ChannelPlanes& planes,
                                               const core::ColorStatistics& color,
                                               const core::TextureMetrics& texture) const;

    /// Dark circular border or strong red dominance
    [[nodiscard]] bool hasOphthalmologicalSignal(const core::ChannelPlanes& planes,
                                                 const core::ColorStatistics& color) const;

    /// Complex stained texture or H&E pink/purple means
    [[nodiscard]] bool hasPathologicalSignal(const core::ColorStatistics& color,
                                             const core::TextureMetrics& texture) const;

    /// Dark vignette corners or reddish internal tissue
    [[nodiscard]] bool hasEndoscopicSignal(const core::ChannelPlanes& planes,
                                           const core::ColorStatistics& color) const;

    /// Text lines, row banding or dark text on a bright page
    [[nodiscard]] bool hasDocumentSignal(const core::ChannelPlanes& planes,
                                         const core::TextureMetrics& texture) const;

private:
    core::TypeClassifierParameters parameters_;
};

}  // namespace med_classifier::services
