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
 * @file classifier_config.hpp
 * @brief Tunable thresholds for feature extraction, classification and pathology analysis
 * @details All numeric cut-offs used by the pipeline are gathered here with
 *          their calibrated defaults. Configurations can be loaded from and
 *          saved to JSON; keys missing from a file keep their defaults.
 *
 * @author kcenon
 * @since 1.0.0
 */
#pragma once

#include <expected>
#include <filesystem>
#include <string>

#include <nlohmann/json_fwd.hpp>

namespace med_classifier::core {

/**
 * @brief Error information for configuration operations
 */
struct ConfigError {
    enum class Code {
        Success,
        FileNotFound,
        ParseFailed,
        InvalidValue,
        WriteFailed
    };

    Code code = Code::Success;
    std::string message;

    [[nodiscard]] bool isSuccess() const noexcept {
        return code == Code::Success;
    }

    [[nodiscard]] std::string toString() const {
        switch (code) {
            case Code::Success: return "Success";
            case Code::FileNotFound: return "File not found: " + message;
            case Code::ParseFailed: return "Parse failed: " + message;
            case Code::InvalidValue: return "Invalid value: " + message;
            case Code::WriteFailed: return "Write failed: " + message;
        }
        return "Unknown error";
    }
};

/**
 * @brief Inclusive RGB box on a 0-255 scale
 */
struct ColorBand {
    double redMin = 0.0;
    double redMax = 255.0;
    double greenMin = 0.0;
    double greenMax = 255.0;
    double blueMin = 0.0;
    double blueMax = 255.0;

    [[nodiscard]] bool contains(float r, float g, float b) const noexcept {
        return r >= redMin && r <= redMax
            && g >= greenMin && g <= greenMax
            && b >= blueMin && b <= blueMax;
    }

    [[nodiscard]] bool isValid() const noexcept {
        return redMin <= redMax && greenMin <= greenMax && blueMin <= blueMax;
    }
};

/**
 * @brief Feature extraction tunables
 */
struct FeatureParameters {
    double highContrastRatio = 0.5;
    double darkBackgroundMean = 100.0;
    double brightRegionMax = 200.0;
    int histogramBins = 50;
    double histogramPeakMinimum = 0.02;
    /// Mean absolute channel difference below which an RGB image counts as gray
    double grayscaleChannelTolerance = 2.0;
    int regularPatternCropSize = 256;
    double regularPatternMaxVariation = 0.1;
    /// Longest side of the copy used for local-variance texture analysis
    int maxTextureDimension = 512;
    int textureWindowSize = 5;
    /// Skin-tone bands; a pixel inside any of them counts as skin
    ColorBand lightSkinBand{180.0, 255.0, 120.0, 220.0, 100.0, 200.0};
    ColorBand mediumSkinBand{120.0, 200.0, 80.0, 160.0, 60.0, 140.0};
    ColorBand darkSkinBand{60.0, 140.0, 40.0, 100.0, 30.0, 80.0};
    /// In-band pixel fraction is scaled by this before clamping to 1
    double skinLikelihoodScale = 2.0;

    [[nodiscard]] bool isValid() const noexcept {
        return highContrastRatio >= 0.0 && histogramBins >= 3
            && histogramPeakMinimum >= 0.0 && histogramPeakMinimum <= 1.0
            && grayscaleChannelTolerance >= 0.0 && regularPatternCropSize > 0
            && regularPatternMaxVariation >= 0.0 && maxTextureDimension >= 16
            && textureWindowSize >= 3 && textureWindowSize % 2 == 1
            && lightSkinBand.isValid() && mediumSkinBand.isValid()
            && darkSkinBand.isValid() && skinLikelihoodScale > 0.0;
    }
};

/**
 * @brief Content-based type classification tunables
 */
struct TypeClassifierParameters {
    int largeRadiographDimension = 1000;
    double chestAspectRatio = 1.1;
    double squareAspectMin = 0.8;
    double squareAspectMax = 1.2;
    int crossSectionalDimension = 512;
    double ctEdgeDensity = 0.1;
    double ultrasoundTexture = 1.0;
    int smallImageDimension = 512;
    double skinDetectionLikelihood = 0.3;
    int highResolutionDimension = 1500;
    double retinalDarkSampleRatio = 0.6;
    double retinalDarkIntensity = 50.0;
    int endoscopyDarkSamples = 4;
    double endoscopyDarkIntensity = 30.0;

    // Fundus ring sampling
    int retinalSampleCount = 16;
    double retinalSampleRadius = 0.4;
    double retinalRedDominance = 1.2;

    // Dermatology cascade on skin-toned images
    double dermatologyStrongSkin = 0.5;
    double dermatologyTexturedSkin = 0.2;
    double dermatologyTextureMin = 0.5;
    double dermatologyLesionSkin = 0.1;
    double dermatologyDarkFactor = 0.7;
    double dermatologyDarkAreaMin = 0.05;

    // Histology texture and stain hue
    double histologyTexture = 2.0;
    double histologyColorVariance = 1000.0;
    double histologyCellularEdge = 0.15;
    double histologyCellularTexture = 1.5;
    double eosinRedMin = 150.0;
    double eosinGreenOverRedMax = 0.8;
    double hematoxylinBlueMin = 120.0;
    double hematoxylinRedOverBlueMax = 0.9;

    double endoscopyRedMin = 100.0;
    double endoscopyRedOverGreen = 1.1;

    // Scanned documents
    double documentEdgeMin = 0.05;
    double documentRowVariance = 100.0;
    double documentBrightMean = 200.0;
    double documentTextIntensity = 100.0;
    double documentTextMin = 0.05;
    double documentTextMax = 0.3;

    [[nodiscard]] bool isValid() const noexcept {
        return largeRadiographDimension > 0 && crossSectionalDimension > 0
            && smallImageDimension > 0 && highResolutionDimension > 0
            && squareAspectMin > 0.0 && squareAspectMin <= squareAspectMax
            && skinDetectionLikelihood >= 0.0 && skinDetectionLikelihood <= 1.0
            && retinalDarkSampleRatio >= 0.0 && retinalDarkSampleRatio <= 1.0
            && endoscopyDarkSamples >= 0 && endoscopyDarkSamples <= 8
            && retinalSampleCount >= 2 && retinalSampleRadius >= 0.0 && retinalSampleRadius <= 0.5
            && dermatologyDarkFactor > 0.0
            && documentTextMin >= 0.0 && documentTextMin < documentTextMax && documentTextMax <= 1.0;
    }
};

/**
 * @brief Dermatology signal weights and tier boundaries
 */
struct DermatologyParameters {
    double colorVariationHigh = 1500.0;
    double colorVariationLow = 800.0;
    double rednessHigh = 0.3;
    double rednessLow = 0.1;
    double pigmentAreaHigh = 0.05;
    double pigmentAreaLow = 0.01;
    double borderEdgeHigh = 0.12;
    double borderEdgeLow = 0.08;
    double textureHigh = 1.2;
    double textureLow = 0.8;
    double lesionMinAreaRatio = 0.001;
    double lesionMaxAreaRatio = 0.2;
    double toneVariationHigh = 0.4;
    double conditionMonitoringConfidence = 0.4;
    double followUpConfidence = 0.25;
    /// Pigment outliers lie beyond this many standard deviations from the mean
    double pigmentSigma = 1.5;

    // Score contribution of each signal
    double colorVariationWeight = 0.25;
    double rednessWeight = 0.3;
    double hyperpigmentationWeight = 0.25;
    double hypopigmentationWeight = 0.25;
    double definedBordersWeight = 0.2;
    double textureIrregularityWeight = 0.2;
    double potentialLesionsWeight = 0.25;
    double toneVariationWeight = 0.2;

    [[nodiscard]] bool isValid() const noexcept {
        return colorVariationLow <= colorVariationHigh && rednessLow <= rednessHigh
            && pigmentAreaLow <= pigmentAreaHigh && borderEdgeLow <= borderEdgeHigh
            && textureLow <= textureHigh
            && lesionMinAreaRatio >= 0.0 && lesionMinAreaRatio < lesionMaxAreaRatio
            && followUpConfidence <= conditionMonitoringConfidence
            && pigmentSigma >= 0.0
            && colorVariationWeight >= 0.0 && rednessWeight >= 0.0
            && hyperpigmentationWeight >= 0.0 && hypopigmentationWeight >= 0.0
            && definedBordersWeight >= 0.0 && textureIrregularityWeight >= 0.0
            && potentialLesionsWeight >= 0.0 && toneVariationWeight >= 0.0;
    }
};

/**
 * @brief Radiological and clinical photo review triggers
 */
struct ReviewParameters {
    double radiologyEdgeDensity = 0.2;
    double radiologyTexture = 2.0;
    double radiologyConfidence = 0.3;
    double clinicalColorVariance = 3000.0;
    double clinicalEdgeDensity = 0.15;
    double clinicalConfidence = 0.2;
    double histologyConfidence = 0.8;

    [[nodiscard]] bool isValid() const noexcept {
        return radiologyConfidence >= 0.0 && radiologyConfidence <= 1.0
            && clinicalConfidence >= 0.0 && clinicalConfidence <= 1.0
            && histologyConfidence >= 0.0 && histologyConfidence <= 1.0;
    }
};

/**
 * @brief Medical relevance score contributions
 */
struct RelevanceParameters {
    double base = 0.5;
    double perFilenameIndicator = 0.1;
    double grayscaleBonus = 0.2;
    double largeImageBonus = 0.1;
    int largeImageDimension = 512;
    double specificTypeBonus = 0.2;
    double fallbackScore = 0.3;

    [[nodiscard]] bool isValid() const noexcept {
        return base >= 0.0 && base <= 1.0 && fallbackScore >= 0.0 && fallbackScore <= 1.0
            && perFilenameIndicator >= 0.0 && grayscaleBonus >= 0.0
            && largeImageBonus >= 0.0 && specificTypeBonus >= 0.0;
    }
};

/**
 * @brief Complete classifier configuration
 *
 * @example
 * @code
 * auto config = ClassifierConfig::loadFromFile("classifier.json");
 * if (!config) {
 *     std::cerr << config.error().toString() << std::endl;
 * }
 * @endcode
 */
struct ClassifierConfig {
    FeatureParameters features;
    TypeClassifierParameters typeClassifier;
    DermatologyParameters dermatology;
    ReviewParameters review;
    RelevanceParameters relevance;
    int maxKeywords = 15;
    int highResolutionDescriptionDimension = 1024;

    [[nodiscard]] bool isValid() const noexcept {
        return features.isValid() && typeClassifier.isValid()
            && dermatology.isValid() && review.isValid() && relevance.isValid()
            && maxKeywords > 0 && highResolutionDescriptionDimension > 0;
    }

    [[nodiscard]] static std::expected<ClassifierConfig, ConfigError>
    fromJson(const nlohmann::json& json);

    [[nodiscard]] static std::expected<ClassifierConfig, ConfigError>
    loadFromFile(const std::filesystem::path& path);

    [[nodiscard]] nlohmann::json toJson() const;

    [[nodiscard]] std::expected<void, ConfigError>
    saveToFile(const std::filesystem::path& path) const;
};

}  // namespace med_classifier::core
