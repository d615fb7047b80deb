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

#include "services/classification/image_type_classifier.hpp"

#include "core/logging.hpp"
#include "services/classification/filename_terms.hpp"

#include <array>
#include <cmath>
#include <numbers>
#include <stdexcept>
#include <utility>

namespace med_classifier::services {

using core::MedicalImageType;

namespace {

auto& getLogger() {
    static auto logger = logging::LoggerFactory::create("ImageTypeClassifier");
    return logger;
}

double aspectRatioOf(int width, int height) {
    return height > 0 ? static_cast<double>(width) / height : 0.0;
}

}  // anonymous namespace

ImageTypeClassifier::ImageTypeClassifier(core::TypeClassifierParameters parameters)
    : parameters_(parameters) {
    if (!parameters_.isValid()) {
        throw std::invalid_argument("ImageTypeClassifier: type parameters out of range");
    }
}

MedicalImageType ImageTypeClassifier::classify(std::string_view fileName,
                                               const core::ChannelPlanes& planes,
                                               const ImageFeatures& features) const {
    if (auto named = filenameTypeOverride(fileName)) {
        getLogger()->debug("File name {} selects {}", fileName, core::toTag(*named));
        return *named;
    }

    MedicalImageType type = MedicalImageType::ClinicalPhotograph;
    if (features.isGrayscale && features.intensity) {
        type = classifyGrayscale(planes.width, planes.height, *features.intensity,
                                 features.texture);
    } else if (features.color) {
        type = classifyColor(planes, *features.color, features.texture);
    }

    getLogger()->debug("Content rules classified {} as {}", fileName, core::toTag(type));
    return type;
}

MedicalImageType ImageTypeClassifier::classifyGrayscale(
    int width, int height,
    const core::IntensityStatistics& intensity,
    const core::TextureMetrics& texture) const
{
    const auto& p = parameters_;
    const double aspect = aspectRatioOf(width, height);
    const bool squareish = aspect >= p.squareAspectMin && aspect <= p.squareAspectMax;

    if ((width >= p.largeRadiographDimension || height >= p.largeRadiographDimension)
        && intensity.hasHighContrast && intensity.hasDarkBackground) {
        if (aspect > p.chestAspectRatio) {
            return MedicalImageType::ChestXray;
        }
        if (squareish) {
            return MedicalImageType::RadiologicalScan;
        }
        return MedicalImageType::MedicalRadiograph;
    }

    if (width >= p.crossSectionalDimension && height >= p.crossSectionalDimension
        && intensity.isBimodal) {
        if (squareish) {
            return texture.edgeDensity > p.ctEdgeDensity
                ? MedicalImageType::ComputedTomography
                : MedicalImageType::MagneticResonance;
        }
        return MedicalImageType::RadiologicalScan;
    }

    if (texture.textureComplexity > p.ultrasoundTexture && !intensity.hasHighContrast) {
        return MedicalImageType::Ultrasound;
    }

    if (width < p.smallImageDimension || height < p.smallImageDimension) {
        return intensity.hasHighContrast ? MedicalImageType::MedicalRadiograph
                                         : MedicalImageType::ClinicalPhotograph;
    }

    return MedicalImageType::MedicalRadiograph;
}

MedicalImageType ImageTypeClassifier::classifyColor(
    const core::ChannelPlanes& planes,
    const core::ColorStatistics& color,
    const core::TextureMetrics& texture) const
{
    if (color.skinToneLikelihood > parameters_.skinDetectionLikelihood) {
        return hasDermatologicalSignal(planes, color, texture)
            ? MedicalImageType::DermatologicalImage
            : MedicalImageType::ClinicalPhotograph;
    }
    if (hasOphthalmologicalSignal(planes, color)) {
        return MedicalImageType::RetinalImage;
    }
    if (hasPathologicalSignal(color, texture)) {
        return MedicalImageType::PathologicalImage;
    }
    if (hasEndoscopicSignal(planes, color)) {
        return MedicalImageType::Endoscopy;
    }
    if (planes.width > parameters_.highResolutionDimension
        || planes.height > parameters_.highResolutionDimension) {
        return MedicalImageType::HighResolutionClinicalImage;
    }
    if (hasDocumentSignal(planes, texture)) {
        return MedicalImageType::MedicalDocument;
    }
    return MedicalImageType::ClinicalPhotograph;
}

bool ImageTypeClassifier::hasDermatologicalSignal(const core::ChannelPlanes& planes,
                                                  const core::ColorStatistics& color,
                                                  const core::TextureMetrics& texture) const {
    const auto& p = parameters_;
    const double skin = color.skinToneLikelihood;

    if (skin > p.dermatologyStrongSkin) {
        return true;
    }
    if (skin > p.dermatologyTexturedSkin && texture.textureComplexity > p.dermatologyTextureMin) {
        return true;
    }
    if (skin > p.dermatologyLesionSkin && planes.pixelCount() > 0) {
        // Darker regions on a skin background
        auto gray = planes.gray();
        const double threshold = computeMeanStd(gray).mean * p.dermatologyDarkFactor;
        std::size_t dark = 0;
        for (float v : gray) {
            if (v < threshold) {
                ++dark;
            }
        }
        return static_cast<double>(dark) / static_cast<double>(gray.size())
            > p.dermatologyDarkAreaMin;
    }
    return false;
}

bool ImageTypeClassifier::hasOphthalmologicalSignal(const core::ChannelPlanes& planes,
                                                    const core::ColorStatistics& color) const {
    const auto& p = parameters_;
    const int width = planes.width;
    const int height = planes.height;
    const int centerX = width / 2;
    const int centerY = height / 2;

    int darkSamples = 0;
    int samples = 0;
    for (int i = 0; i < p.retinalSampleCount; ++i) {
        // Endpoint-inclusive sweep over [0, 2pi]
        const double angle = 2.0 * std::numbers::pi * i / (p.retinalSampleCount - 1);
        const int x = static_cast<int>(centerX + p.retinalSampleRadius * width * std::cos(angle));
        const int y = static_cast<int>(centerY + p.retinalSampleRadius * height * std::sin(angle));
        if (x < 0 || x >= width || y < 0 || y >= height) {
            continue;
        }
        if (planes.meanAt(x, y) < p.retinalDarkIntensity) {
            ++darkSamples;
        }
        ++samples;
    }
    if (samples > 0
        && static_cast<double>(darkSamples) / samples > p.retinalDarkSampleRatio) {
        return true;
    }

    const auto& rgb = color.meanRgb;
    return rgb[0] > rgb[1] * p.retinalRedDominance && rgb[0] > rgb[2] * p.retinalRedDominance;
}

bool ImageTypeClassifier::hasPathologicalSignal(const core::ColorStatistics& color,
                                                const core::TextureMetrics& texture) const {
    const auto& p = parameters_;
    if (texture.textureComplexity > p.histologyTexture
        && color.colorVariance > p.histologyColorVariance) {
        return true;
    }
    if (texture.edgeDensity > p.histologyCellularEdge
        && texture.textureComplexity > p.histologyCellularTexture) {
        return true;
    }

    // Eosin pink or hematoxylin purple
    const auto& rgb = color.meanRgb;
    const bool pink = rgb[0] > p.eosinRedMin && rgb[1] < rgb[0] * p.eosinGreenOverRedMax;
    const bool purple = rgb[2] > p.hematoxylinBlueMin && rgb[0] < rgb[2] * p.hematoxylinRedOverBlueMax;
    return pink || purple;
}

bool ImageTypeClassifier::hasEndoscopicSignal(const core::ChannelPlanes& planes,
                                              const core::ColorStatistics& color) const {
    const auto& p = parameters_;
    const int w = planes.width;
    const int h = planes.height;

    if (w > 0 && h > 0) {
        const std::array<std::pair<int, int>, 8> points = {{
            {0, 0}, {w - 1, 0}, {0, h - 1}, {w - 1, h - 1},
            {w / 4, h / 4}, {3 * w / 4, h / 4}, {w / 4, 3 * h / 4}, {3 * w / 4, 3 * h / 4}
        }};
        int dark = 0;
        for (const auto& [x, y] : points) {
            if (planes.meanAt(x, y) < p.endoscopyDarkIntensity) {
                ++dark;
            }
        }
        if (dark >= p.endoscopyDarkSamples) {
            return true;
        }
    }

    const auto& rgb = color.meanRgb;
    return rgb[0] > p.endoscopyRedMin && rgb[0] > rgb[1] * p.endoscopyRedOverGreen;
}

bool ImageTypeClassifier::hasDocumentSignal(const core::ChannelPlanes& planes,
                                            const core::TextureMetrics& texture) const {
    const auto& p = parameters_;
    if (texture.hasRegularPatterns && texture.edgeDensity > p.documentEdgeMin) {
        return true;
    }
    if (planes.pixelCount() == 0) {
        return false;
    }

    auto gray = planes.gray();

    std::vector<float> rowMeans(static_cast<std::size_t>(planes.height), 0.0f);
    for (int y = 0; y < planes.height; ++y) {
        double sum = 0.0;
        for (int x = 0; x < planes.width; ++x) {
            sum += gray[planes.index(x, y)];
        }
        rowMeans[static_cast<std::size_t>(y)] = static_cast<float>(sum / planes.width);
    }
    const double rowStd = computeMeanStd(rowMeans).stdDev;
    if (rowStd * rowStd > p.documentRowVariance) {
        return true;
    }

    if (computeMeanStd(gray).mean > p.documentBrightMean) {
        std::size_t text = 0;
        for (float v : gray) {
            if (v < p.documentTextIntensity) {
                ++text;
            }
        }
        const double ratio = static_cast<double>(text) / static_cast<double>(gray.size());
        return ratio > p.documentTextMin && ratio < p.documentTextMax;
    }
    return false;
}

}  // namespace med_classifier::services
