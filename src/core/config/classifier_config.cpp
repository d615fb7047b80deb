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

#include "core/classifier_config.hpp"

#include "core/logging.hpp"

#include <array>
#include <fstream>

#include <nlohmann/json.hpp>

namespace med_classifier::core {

using json = nlohmann::json;

namespace {

auto& getLogger() {
    static auto logger = logging::LoggerFactory::create("ClassifierConfig");
    return logger;
}

/// Overwrite target only when the key is present
template <typename T>
void readValue(const json& section, const char* key, T& target) {
    if (section.is_object() && section.contains(key)) {
        target = section.at(key).get<T>();
    }
}

const json& sectionOf(const json& root, const char* name) {
    static const json empty = json::object();
    if (root.contains(name) && root.at(name).is_object()) {
        return root.at(name);
    }
    return empty;
}

/// {"red": [min, max], "green": [min, max], "blue": [min, max]}
void readBand(const json& section, const char* key, ColorBand& band) {
    if (!section.is_object() || !section.contains(key)) {
        return;
    }
    // Throws type_error when the band is not an object
    const auto ranges = section.at(key).get<json::object_t>();
    auto readRange = [&ranges](const char* channel, double& lo, double& hi) {
        auto it = ranges.find(channel);
        if (it != ranges.end()) {
            const auto range = it->second.get<std::array<double, 2>>();
            lo = range[0];
            hi = range[1];
        }
    };
    readRange("red", band.redMin, band.redMax);
    readRange("green", band.greenMin, band.greenMax);
    readRange("blue", band.blueMin, band.blueMax);
}

json writeBand(const ColorBand& band) {
    return {
        {"red", {band.redMin, band.redMax}},
        {"green", {band.greenMin, band.greenMax}},
        {"blue", {band.blueMin, band.blueMax}}
    };
}

void readFeatures(const json& j, FeatureParameters& p) {
    readValue(j, "high_contrast_ratio", p.highContrastRatio);
    readValue(j, "dark_background_mean", p.darkBackgroundMean);
    readValue(j, "bright_region_max", p.brightRegionMax);
    readValue(j, "histogram_bins", p.histogramBins);
    readValue(j, "histogram_peak_minimum", p.histogramPeakMinimum);
    readValue(j, "grayscale_channel_tolerance", p.grayscaleChannelTolerance);
    readValue(j, "regular_pattern_crop_size", p.regularPatternCropSize);
    readValue(j, "regular_pattern_max_variation", p.regularPatternMaxVariation);
    readValue(j, "max_texture_dimension", p.maxTextureDimension);
    readValue(j, "texture_window_size", p.textureWindowSize);
    readBand(j, "light_skin_band", p.lightSkinBand);
    readBand(j, "medium_skin_band", p.mediumSkinBand);
    readBand(j, "dark_skin_band", p.darkSkinBand);
    readValue(j, "skin_likelihood_scale", p.skinLikelihoodScale);
}

json writeFeatures(const FeatureParameters& p) {
    return {
        {"high_contrast_ratio", p.highContrastRatio},
        {"dark_background_mean", p.darkBackgroundMean},
        {"bright_region_max", p.brightRegionMax},
        {"histogram_bins", p.histogramBins},
        {"histogram_peak_minimum", p.histogramPeakMinimum},
        {"grayscale_channel_tolerance", p.grayscaleChannelTolerance},
        {"regular_pattern_crop_size", p.regularPatternCropSize},
        {"regular_pattern_max_variation", p.regularPatternMaxVariation},
        {"max_texture_dimension", p.maxTextureDimension},
        {"texture_window_size", p.textureWindowSize},
        {"light_skin_band", writeBand(p.lightSkinBand)},
        {"medium_skin_band", writeBand(p.mediumSkinBand)},
        {"dark_skin_band", writeBand(p.darkSkinBand)},
        {"skin_likelihood_scale", p.skinLikelihoodScale}
    };
}

void readTypeClassifier(const json& j, TypeClassifierParameters& p) {
    readValue(j, "large_radiograph_dimension", p.largeRadiographDimension);
    readValue(j, "chest_aspect_ratio", p.chestAspectRatio);
    readValue(j, "square_aspect_min", p.squareAspectMin);
    readValue(j, "square_aspect_max", p.squareAspectMax);
    readValue(j, "cross_sectional_dimension", p.crossSectionalDimension);
    readValue(j, "ct_edge_density", p.ctEdgeDensity);
    readValue(j, "ultrasound_texture", p.ultrasoundTexture);
    readValue(j, "small_image_dimension", p.smallImageDimension);
    readValue(j, "skin_detection_likelihood", p.skinDetectionLikelihood);
    readValue(j, "high_resolution_dimension", p.highResolutionDimension);
    readValue(j, "retinal_dark_sample_ratio", p.retinalDarkSampleRatio);
    readValue(j, "retinal_dark_intensity", p.retinalDarkIntensity);
    readValue(j, "endoscopy_dark_samples", p.endoscopyDarkSamples);
    readValue(j, "endoscopy_dark_intensity", p.endoscopyDarkIntensity);
    readValue(j, "retinal_sample_count", p.retinalSampleCount);
    readValue(j, "retinal_sample_radius", p.retinalSampleRadius);
    readValue(j, "retinal_red_dominance", p.retinalRedDominance);
    readValue(j, "dermatology_strong_skin", p.dermatologyStrongSkin);
    readValue(j, "dermatology_textured_skin", p.dermatologyTexturedSkin);
    readValue(j, "dermatology_texture_min", p.dermatologyTextureMin);
    readValue(j, "dermatology_lesion_skin", p.dermatologyLesionSkin);
    readValue(j, "dermatology_dark_factor", p.dermatologyDarkFactor);
    readValue(j, "dermatology_dark_area_min", p.dermatologyDarkAreaMin);
    readValue(j, "histology_texture", p.histologyTexture);
    readValue(j, "histology_color_variance", p.histologyColorVariance);
    readValue(j, "histology_cellular_edge", p.histologyCellularEdge);
    readValue(j, "histology_cellular_texture", p.histologyCellularTexture);
    readValue(j, "eosin_red_min", p.eosinRedMin);
    readValue(j, "eosin_green_over_red_max", p.eosinGreenOverRedMax);
    readValue(j, "hematoxylin_blue_min", p.hematoxylinBlueMin);
    readValue(j, "hematoxylin_red_over_blue_max", p.hematoxylinRedOverBlueMax);
    readValue(j, "endoscopy_red_min", p.endoscopyRedMin);
    readValue(j, "endoscopy_red_over_green", p.endoscopyRedOverGreen);
    readValue(j, "document_edge_min", p.documentEdgeMin);
    readValue(j, "document_row_variance", p.documentRowVariance);
    readValue(j, "document_bright_mean", p.documentBrightMean);
    readValue(j, "document_text_intensity", p.documentTextIntensity);
    readValue(j, "document_text_min", p.documentTextMin);
    readValue(j, "document_text_max", p.documentTextMax);
}

json writeTypeClassifier(const TypeClassifierParameters& p) {
    return {
        {"large_radiograph_dimension", p.largeRadiographDimension},
        {"chest_aspect_ratio", p.chestAspectRatio},
        {"square_aspect_min", p.squareAspectMin},
        {"square_aspect_max", p.squareAspectMax},
        {"cross_sectional_dimension", p.crossSectionalDimension},
        {"ct_edge_density", p.ctEdgeDensity},
        {"ultrasound_texture", p.ultrasoundTexture},
        {"small_image_dimension", p.smallImageDimension},
        {"skin_detection_likelihood", p.skinDetectionLikelihood},
        {"high_resolution_dimension", p.highResolutionDimension},
        {"retinal_dark_sample_ratio", p.retinalDarkSampleRatio},
        {"retinal_dark_intensity", p.retinalDarkIntensity},
        {"endoscopy_dark_samples", p.endoscopyDarkSamples},
        {"endoscopy_dark_intensity", p.endoscopyDarkIntensity},
        {"retinal_sample_count", p.retinalSampleCount},
        {"retinal_sample_radius", p.retinalSampleRadius},
        {"retinal_red_dominance", p.retinalRedDominance},
        {"dermatology_strong_skin", p.dermatologyStrongSkin},
        {"dermatology_textured_skin", p.dermatologyTexturedSkin},
        {"dermatology_texture_min", p.dermatologyTextureMin},
        {"dermatology_lesion_skin", p.dermatologyLesionSkin},
        {"dermatology_dark_factor", p.dermatologyDarkFactor},
        {"dermatology_dark_area_min", p.dermatologyDarkAreaMin},
        {"histology_texture", p.histologyTexture},
        {"histology_color_variance", p.histologyColorVariance},
        {"histology_cellular_edge", p.histologyCellularEdge},
        {"histology_cellular_texture", p.histologyCellularTexture},
        {"eosin_red_min", p.eosinRedMin},
        {"eosin_green_over_red_max", p.eosinGreenOverRedMax},
        {"hematoxylin_blue_min", p.hematoxylinBlueMin},
        {"hematoxylin_red_over_blue_max", p.hematoxylinRedOverBlueMax},
        {"endoscopy_red_min", p.endoscopyRedMin},
        {"endoscopy_red_over_green", p.endoscopyRedOverGreen},
        {"document_edge_min", p.documentEdgeMin},
        {"document_row_variance", p.documentRowVariance},
        {"document_bright_mean", p.documentBrightMean},
        {"document_text_intensity", p.documentTextIntensity},
        {"document_text_min", p.documentTextMin},
        {"document_text_max", p.documentTextMax}
    };
}

void readDermatology(const json& j, DermatologyParameters& p) {
    readValue(j, "color_variation_high", p.colorVariationHigh);
    readValue(j, "color_variation_low", p.colorVariationLow);
    readValue(j, "redness_high", p.rednessHigh);
    readValue(j, "redness_low", p.rednessLow);
    readValue(j, "pigment_area_high", p.pigmentAreaHigh);
    readValue(j, "pigment_area_low", p.pigmentAreaLow);
    readValue(j, "border_edge_high", p.borderEdgeHigh);
    readValue(j, "border_edge_low", p.borderEdgeLow);
    readValue(j, "texture_high", p.textureHigh);
    readValue(j, "texture_low", p.textureLow);
    readValue(j, "lesion_min_area_ratio", p.lesionMinAreaRatio);
    readValue(j, "lesion_max_area_ratio", p.lesionMaxAreaRatio);
    readValue(j, "tone_variation_high", p.toneVariationHigh);
    readValue(j, "condition_monitoring_confidence", p.conditionMonitoringConfidence);
    readValue(j, "follow_up_confidence", p.followUpConfidence);
    readValue(j, "pigment_sigma", p.pigmentSigma);
    readValue(j, "color_variation_weight", p.colorVariationWeight);
    readValue(j, "redness_weight", p.rednessWeight);
    readValue(j, "hyperpigmentation_weight", p.hyperpigmentationWeight);
    readValue(j, "hypopigmentation_weight", p.hypopigmentationWeight);
    readValue(j, "defined_borders_weight", p.definedBordersWeight);
    readValue(j, "texture_irregularity_weight", p.textureIrregularityWeight);
    readValue(j, "potential_lesions_weight", p.potentialLesionsWeight);
    readValue(j, "tone_variation_weight", p.toneVariationWeight);
}

json writeDermatology(const DermatologyParameters& p) {
    return {
        {"color_variation_high", p.colorVariationHigh},
        {"color_variation_low", p.colorVariationLow},
        {"redness_high", p.rednessHigh},
        {"redness_low", p.rednessLow},
        {"pigment_area_high", p.pigmentAreaHigh},
        {"pigment_area_low", p.pigmentAreaLow},
        {"border_edge_high", p.borderEdgeHigh},
        {"border_edge_low", p.borderEdgeLow},
        {"texture_high", p.textureHigh},
        {"texture_low", p.textureLow},
        {"lesion_min_area_ratio", p.lesionMinAreaRatio},
        {"lesion_max_area_ratio", p.lesionMaxAreaRatio},
        {"tone_variation_high", p.toneVariationHigh},
        {"condition_monitoring_confidence", p.conditionMonitoringConfidence},
        {"follow_up_confidence", p.followUpConfidence},
        {"pigment_sigma", p.pigmentSigma},
        {"color_variation_weight", p.colorVariationWeight},
        {"redness_weight", p.rednessWeight},
        {"hyperpigmentation_weight", p.hyperpigmentationWeight},
        {"hypopigmentation_weight", p.hypopigmentationWeight},
        {"defined_borders_weight", p.definedBordersWeight},
        {"texture_irregularity_weight", p.textureIrregularityWeight},
        {"potential_lesions_weight", p.potentialLesionsWeight},
        {"tone_variation_weight", p.toneVariationWeight}
    };
}

void readReview(const json& j, ReviewParameters& p) {
    readValue(j, "radiology_edge_density", p.radiologyEdgeDensity);
    readValue(j, "radiology_texture", p.radiologyTexture);
    readValue(j, "radiology_confidence", p.radiologyConfidence);
    readValue(j, "clinical_color_variance", p.clinicalColorVariance);
    readValue(j, "clinical_edge_density", p.clinicalEdgeDensity);
    readValue(j, "clinical_confidence", p.clinicalConfidence);
    readValue(j, "histology_confidence", p.histologyConfidence);
}

json writeReview(const ReviewParameters& p) {
    return {
        {"radiology_edge_density", p.radiologyEdgeDensity},
        {"radiology_texture", p.radiologyTexture},
        {"radiology_confidence", p.radiologyConfidence},
        {"clinical_color_variance", p.clinicalColorVariance},
        {"clinical_edge_density", p.clinicalEdgeDensity},
        {"clinical_confidence", p.clinicalConfidence},
        {"histology_confidence", p.histologyConfidence}
    };
}

void readRelevance(const json& j, RelevanceParameters& p) {
    readValue(j, "base", p.base);
    readValue(j, "per_filename_indicator", p.perFilenameIndicator);
    readValue(j, "grayscale_bonus", p.grayscaleBonus);
    readValue(j, "large_image_bonus", p.largeImageBonus);
    readValue(j, "large_image_dimension", p.largeImageDimension);
    readValue(j, "specific_type_bonus", p.specificTypeBonus);
    readValue(j, "fallback_score", p.fallbackScore);
}

json writeRelevance(const RelevanceParameters& p) {
    return {
        {"base", p.base},
        {"per_filename_indicator", p.perFilenameIndicator},
        {"grayscale_bonus", p.grayscaleBonus},
        {"large_image_bonus", p.largeImageBonus},
        {"large_image_dimension", p.largeImageDimension},
        {"specific_type_bonus", p.specificTypeBonus},
        {"fallback_score", p.fallbackScore}
    };
}

}  // anonymous namespace

std::expected<ClassifierConfig, ConfigError>
ClassifierConfig::fromJson(const json& root) {
    if (!root.is_object()) {
        return std::unexpected(ConfigError{
            ConfigError::Code::ParseFailed,
            "Configuration root must be a JSON object"
        });
    }

    ClassifierConfig config;
    try {
        readFeatures(sectionOf(root, "features"), config.features);
        readTypeClassifier(sectionOf(root, "type_classifier"), config.typeClassifier);
        readDermatology(sectionOf(root, "dermatology"), config.dermatology);
        readReview(sectionOf(root, "review"), config.review);
        readRelevance(sectionOf(root, "relevance"), config.relevance);
        readValue(root, "max_keywords", config.maxKeywords);
        readValue(root, "high_resolution_description_dimension",
                  config.highResolutionDescriptionDimension);
    } catch (const json::exception& e) {
        return std::unexpected(ConfigError{
            ConfigError::Code::ParseFailed,
            std::string("Unexpected value type: ") + e.what()
        });
    }

    if (!config.isValid()) {
        return std::unexpected(ConfigError{
            ConfigError::Code::InvalidValue,
            "Configuration thresholds are out of range"
        });
    }
    return config;
}

std::expected<ClassifierConfig, ConfigError>
ClassifierConfig::loadFromFile(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return std::unexpected(ConfigError{
            ConfigError::Code::FileNotFound,
            path.string()
        });
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return std::unexpected(ConfigError{
            ConfigError::Code::FileNotFound,
            "Failed to open " + path.string()
        });
    }

    json root;
    try {
        file >> root;
    } catch (const json::parse_error& e) {
        getLogger()->error("Failed to parse {}: {}", path.string(), e.what());
        return std::unexpected(ConfigError{
            ConfigError::Code::ParseFailed,
            path.string() + ": " + e.what()
        });
    }

    auto config = fromJson(root);
    if (config) {
        getLogger()->info("Loaded classifier configuration from {}", path.string());
    }
    return config;
}

json ClassifierConfig::toJson() const {
    return {
        {"features", writeFeatures(features)},
        {"type_classifier", writeTypeClassifier(typeClassifier)},
        {"dermatology", writeDermatology(dermatology)},
        {"review", writeReview(review)},
        {"relevance", writeRelevance(relevance)},
        {"max_keywords", maxKeywords},
        {"high_resolution_description_dimension", highResolutionDescriptionDimension}
    };
}

std::expected<void, ConfigError>
ClassifierConfig::saveToFile(const std::filesystem::path& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        return std::unexpected(ConfigError{
            ConfigError::Code::WriteFailed,
            "Failed to open " + path.string() + " for writing"
        });
    }

    file << toJson().dump(2);
    if (!file.good()) {
        return std::unexpected(ConfigError{
            ConfigError::Code::WriteFailed,
            "Failed to write " + path.string()
        });
    }
    return {};
}

}  // namespace med_classifier::core
