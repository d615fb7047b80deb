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

#include "services/classification/medical_image_classifier.hpp"

#include "core/dicom_metadata_reader.hpp"
#include "core/image_decoder.hpp"
#include "core/logging.hpp"
#include "services/classification/description_synthesizer.hpp"
#include "services/classification/feature_extractor.hpp"
#include "services/classification/filename_terms.hpp"
#include "services/classification/image_type_classifier.hpp"
#include "services/classification/pathology_analyzer.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <optional>
#include <utility>

namespace med_classifier::services {

using core::ImageAnalysis;
using core::MedicalImageType;

namespace {

auto& getLogger() {
    static auto logger = logging::LoggerFactory::create("MedicalImageClassifier");
    return logger;
}

double roundedAspectRatio(int width, int height) {
    if (height <= 0) {
        return 0.0;
    }
    return std::round(static_cast<double>(width) / height * 100.0) / 100.0;
}

bool isMonochrome(const std::string& photometric) {
    return photometric.empty() || photometric.starts_with("MONOCHROME");
}

}  // anonymous namespace

// =============================================================================
// MedicalImageClassifier::Impl
// =============================================================================

class MedicalImageClassifier::Impl {
public:
    explicit Impl(const core::ClassifierConfig& cfg)
        : config(cfg)
        , extractor(cfg.features)
        , typeClassifier(cfg.typeClassifier)
        , pathologyAnalyzer(cfg.dermatology, cfg.review)
        , synthesizer(static_cast<std::size_t>(cfg.maxKeywords),
                      cfg.highResolutionDescriptionDimension) {}

    core::ClassifierConfig config;
    FeatureExtractor extractor;
    ImageTypeClassifier typeClassifier;
    PathologyAnalyzer pathologyAnalyzer;
    DescriptionSynthesizer synthesizer;

    std::optional<ImageAnalysis> analyzeDicom(std::span<const std::uint8_t> bytes,
                                              std::string_view fileName) const {
        auto info = core::DicomMetadataReader::read(bytes);
        if (!info) {
            getLogger()->debug("{} is not usable as DICOM ({}), using pixel analysis",
                               fileName, info.error().toString());
            return std::nullopt;
        }

        ImageAnalysis analysis;
        analysis.isDicom = true;
        analysis.medicalType = core::DicomMetadataReader::classifyModality(info->modality);
        analysis.width = info->columns;
        analysis.height = info->rows;
        analysis.isGrayscale = isMonochrome(info->photometricInterpretation);
        analysis.aspectRatio = roundedAspectRatio(info->columns, info->rows);
        analysis.colorMode = "DICOM";
        analysis.format = "DICOM";
        analysis.fileSizeBytes = bytes.size();
        analysis.dicom = std::move(*info);

        getLogger()->info("Analyzed DICOM image {}: modality {}, type {}",
                          fileName, analysis.dicom->modality,
                          core::toTag(analysis.medicalType));
        return analysis;
    }

    ImageAnalysis analyzePixels(std::span<const std::uint8_t> bytes,
                                std::string_view fileName) const {
        auto decoded = core::ImageDecoder::decode(bytes, fileName);
        if (!decoded) {
            getLogger()->error("Failed to decode {}: {}", fileName, decoded.error().toString());
            return fallback(bytes, fileName, decoded.error().toString());
        }

        auto planes = core::ChannelPlanes::fromImage(*decoded->image);
        auto features = extractor.extract(planes, decoded->isNativeGrayscale());
        auto type = typeClassifier.classify(fileName, planes, features);

        core::ImageCharacteristics context;
        context.intensity = features.intensity;
        context.color = features.color;
        context.texture = features.texture;
        context.filenameIndicators = findFilenameIndicators(fileName);
        context.medicalRelevanceScore = relevanceScore(
            context.filenameIndicators.size(), decoded->isNativeGrayscale(),
            decoded->width, decoded->height, type);
        context.pathologicalAnalysis = pathologyAnalyzer.analyze(type, planes, features);

        ImageAnalysis analysis;
        analysis.isDicom = false;
        analysis.medicalType = type;
        analysis.width = decoded->width;
        analysis.height = decoded->height;
        analysis.isGrayscale = features.isGrayscale;
        analysis.aspectRatio = roundedAspectRatio(decoded->width, decoded->height);
        analysis.colorMode = decoded->colorMode;
        analysis.format = decoded->format;
        analysis.fileSizeBytes = bytes.size();
        analysis.medicalContext = std::move(context);

        getLogger()->info("Analyzed image {}: type {}, {}x{}, significance {}",
                          fileName, core::toTag(type), analysis.width, analysis.height,
                          core::toTag(analysis.medicalContext->pathologicalAnalysis
                                          ->clinicalSignificance));
        return analysis;
    }

    ImageAnalysis fallback(std::span<const std::uint8_t> bytes,
                           std::string_view fileName,
                           std::string error) const {
        core::ImageCharacteristics context;
        context.filenameIndicators = findFilenameIndicators(fileName);
        context.medicalRelevanceScore = config.relevance.fallbackScore;

        ImageAnalysis analysis;
        analysis.medicalType = MedicalImageType::MedicalImage;
        analysis.fileSizeBytes = bytes.size();
        analysis.analysisError = std::move(error);
        analysis.fallbackAnalysis = true;
        analysis.medicalContext = std::move(context);
        return analysis;
    }

    double relevanceScore(std::size_t indicatorCount, bool nativeGrayscale,
                          int width, int height, MedicalImageType type) const {
        const auto& p = config.relevance;
        double score = p.base + p.perFilenameIndicator * static_cast<double>(indicatorCount);
        if (nativeGrayscale) {
            score += p.grayscaleBonus;
        }
        if (width >= p.largeImageDimension && height >= p.largeImageDimension) {
            score += p.largeImageBonus;
        }
        if (type != MedicalImageType::MedicalImage) {
            score += p.specificTypeBonus;
        }
        return std::clamp(score, 0.0, 1.0);
    }
};

// =============================================================================
// Lifecycle
// =============================================================================

MedicalImageClassifier::MedicalImageClassifier()
    : impl_(std::make_unique<Impl>(core::ClassifierConfig{})) {}

MedicalImageClassifier::MedicalImageClassifier(const core::ClassifierConfig& config)
    : impl_(std::make_unique<Impl>(config)) {}

MedicalImageClassifier::~MedicalImageClassifier() = default;

MedicalImageClassifier::MedicalImageClassifier(MedicalImageClassifier&&) noexcept = default;
MedicalImageClassifier&
MedicalImageClassifier::operator=(MedicalImageClassifier&&) noexcept = default;

std::expected<MedicalImageClassifier, core::ConfigError>
MedicalImageClassifier::create(const core::ClassifierConfig& config) {
    if (!config.isValid()) {
        return std::unexpected(core::ConfigError{
            core::ConfigError::Code::InvalidValue,
            "classifier configuration failed validation"});
    }
    return MedicalImageClassifier(config);
}

// =============================================================================
// Analysis
// =============================================================================

ImageAnalysis MedicalImageClassifier::analyzeMedicalImage(std::span<const std::uint8_t> bytes,
                                                          std::string_view fileName) const {
    try {
        if (core::DicomMetadataReader::mightBeDicom(bytes, fileName)) {
            if (auto dicom = impl_->analyzeDicom(bytes, fileName)) {
                return std::move(*dicom);
            }
        }
        return impl_->analyzePixels(bytes, fileName);
    } catch (const std::exception& e) {
        getLogger()->error("Error analyzing medical image {}: {}", fileName, e.what());
        return impl_->fallback(bytes, fileName, e.what());
    }
}

std::string MedicalImageClassifier::createMedicalDescription(
    std::string_view fileName, const ImageAnalysis& analysis) const
{
    getLogger()->debug("Describing {} as {}", fileName, core::toTag(analysis.medicalType));
    return impl_->synthesizer.describe(analysis);
}

std::vector<std::string>
MedicalImageClassifier::generateMedicalKeywords(const ImageAnalysis& analysis) const {
    return impl_->synthesizer.keywords(analysis);
}

double MedicalImageClassifier::medicalRelevanceScore(std::size_t indicatorCount,
                                                     bool nativeGrayscale,
                                                     int width, int height,
                                                     MedicalImageType type) const {
    return impl_->relevanceScore(indicatorCount, nativeGrayscale, width, height, type);
}

const core::ClassifierConfig& MedicalImageClassifier::config() const {
    return impl_->config;
}

}  // namespace med_classifier::services
