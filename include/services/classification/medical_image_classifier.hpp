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
 * @file medical_image_classifier.hpp
 * @brief Entry point of the medical image classification pipeline
 * @details Routes raw image bytes through the DICOM reader or through the
 *          pixel pipeline (decode, feature extraction, type classification,
 *          pathology analysis) and exposes description and keyword synthesis
 *          for the resulting analysis.
 *
 * ## Pipeline
 * @code
 * bytes + file name
 *   ├─ DICOM marker or extension ──► DicomMetadataReader ──► ImageAnalysis (dicom)
 *   └─ otherwise ──► ImageDecoder ──► FeatureExtractor ──► ImageTypeClassifier
 *                                         └──► PathologyAnalyzer ──► ImageAnalysis (medicalContext)
 * @endcode
 *
 * The classifier only holds immutable configuration. One instance can be
 * shared by any number of threads.
 *
 * @author kcenon
 * @since 1.0.0
 */
#pragma once

#include "core/classifier_config.hpp"
#include "core/medical_image_types.hpp"

#include <cstdint>
#include <expected>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace med_classifier::services {

/**
 * @brief Heuristic medical image classifier
 *
 * @example
 * @code
 * auto classifier = MedicalImageClassifier::create(config);
 * if (!classifier) {
 *     return;
 * }
 * auto analysis = classifier->analyzeMedicalImage(bytes, "upload_0042.png");
 * auto text = classifier->createMedicalDescription("upload_0042.png", analysis);
 * @endcode
 */
class MedicalImageClassifier {
public:
    /// Classifier with the default configuration
    MedicalImageClassifier();
    ~MedicalImageClassifier();

    // Non-copyable, movable
    MedicalImageClassifier(const MedicalImageClassifier&) = delete;
    MedicalImageClassifier& operator=(const MedicalImageClassifier&) = delete;
    MedicalImageClassifier(MedicalImageClassifier&&) noexcept;
    MedicalImageClassifier& operator=(MedicalImageClassifier&&) noexcept;

    /**
     * @brief Build a classifier from a configuration
     * @return ConfigError::InvalidValue when the configuration fails validation
     */
    [[nodiscard]] static std::expected<MedicalImageClassifier, core::ConfigError>
    create(const core::ClassifierConfig& config);

    /**
     * @brief Analyze one image
     *
     * Never throws. Undecodable input yields a fallback analysis with
     * `analysisError` set and `fallbackAnalysis` true.
     *
     * @param bytes Raw file content
     * @param fileName Name used for format hints and filename indicators
     */
    [[nodiscard]] core::ImageAnalysis
    analyzeMedicalImage(std::span<const std::uint8_t> bytes, std::string_view fileName) const;

    /// Searchable natural language description of an analysis
    [[nodiscard]] std::string createMedicalDescription(std::string_view fileName,
                                                       const core::ImageAnalysis& analysis) const;

    /// Deduplicated, prioritized keywords of an analysis
    [[nodiscard]] std::vector<std::string>
    generateMedicalKeywords(const core::ImageAnalysis& analysis) const;

    /**
     * @brief Medical relevance score, clamped to [0, 1]
     * @param indicatorCount Number of filename indicators
     * @param nativeGrayscale Source stored a single channel
     */
    [[nodiscard]] double medicalRelevanceScore(std::size_t indicatorCount,
                                               bool nativeGrayscale,
                                               int width, int height,
                                               core::MedicalImageType type) const;

    [[nodiscard]] const core::ClassifierConfig& config() const;

private:
    explicit MedicalImageClassifier(const core::ClassifierConfig& config);

    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace med_classifier::services
