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

#include "services/classification/pathology_analyzer.hpp"

#include "core/logging.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

#include <itkBinaryThresholdImageFilter.h>
#include <itkConnectedComponentImageFilter.h>
#include <itkLabelStatisticsImageFilter.h>

namespace med_classifier::services {

using core::ClinicalSignificance;
using core::MedicalImageType;
using core::NormalIndicator;
using core::PathologyFinding;

namespace {

auto& getLogger() {
    static auto logger = logging::LoggerFactory::create("PathologyAnalyzer");
    return logger;
}

using GrayImageType = itk::Image<float, 2>;
using MaskImageType = itk::Image<unsigned char, 2>;
using LabelImageType = itk::Image<unsigned int, 2>;

double fractionBelow(const std::vector<float>& values, double threshold) {
    if (values.empty()) {
        return 0.0;
    }
    auto count = std::count_if(values.begin(), values.end(),
                               [threshold](float v) { return v < threshold; });
    return static_cast<double>(count) / static_cast<double>(values.size());
}

double fractionAbove(const std::vector<float>& values, double threshold) {
    if (values.empty()) {
        return 0.0;
    }
    auto count = std::count_if(values.begin(), values.end(),
                               [threshold](float v) { return v > threshold; });
    return static_cast<double>(count) / static_cast<double>(values.size());
}

}  // anonymous namespace

PathologyAnalyzer::PathologyAnalyzer(core::DermatologyParameters dermatology,
                                     core::ReviewParameters review)
    : dermatology_(dermatology)
    , review_(review) {
    if (!dermatology_.isValid() || !review_.isValid()) {
        throw std::invalid_argument("PathologyAnalyzer: dermatology or review parameters out of range");
    }
}

core::PathologyFindings PathologyAnalyzer::analyze(MedicalImageType type,
                                                   const core::ChannelPlanes& planes,
                                                   const ImageFeatures& features) const {
    if (type == MedicalImageType::DermatologicalImage) {
        return analyzeDermatological(planes, features);
    }
    if (core::isRadiologicalType(type)) {
        return analyzeRadiological(features.texture);
    }
    if (type == MedicalImageType::ClinicalPhotograph) {
        return analyzeClinicalPhotograph(features);
    }
    if (type == MedicalImageType::PathologicalImage) {
        return analyzeHistological();
    }
    return limitedAnalysis(ClinicalSignificance::RoutineDocumentation);
}

core::PathologyFindings
PathologyAnalyzer::analyzeDermatological(const core::ChannelPlanes& planes,
                                         const ImageFeatures& features) const {
    const auto& p = dermatology_;

    if (features.isGrayscale || !features.color || planes.pixelCount() == 0) {
        getLogger()->debug("Dermatology analysis needs color data; returning limited result");
        return limitedAnalysis(ClinicalSignificance::RoutineSkinDocumentation);
    }

    core::PathologyFindings findings;
    double score = 0.0;

    // 1. Color uniformity
    const double colorVariance = features.color->colorVariance;
    if (colorVariance > p.colorVariationHigh) {
        score += p.colorVariationWeight;
        findings.specificFindings.push_back(PathologyFinding::ColorVariation);
    } else if (colorVariance < p.colorVariationLow) {
        findings.normalIndicators.push_back(NormalIndicator::UniformColoration);
    }

    // 2. Redness
    const double redness = rednessScore(planes);
    if (redness > p.rednessHigh) {
        score += p.rednessWeight;
        findings.specificFindings.push_back(PathologyFinding::RednessPattern);
    } else if (redness < p.rednessLow) {
        findings.normalIndicators.push_back(NormalIndicator::NormalColoration);
    }

    // 3. Pigmentation outliers
    auto gray = planes.gray();
    const auto grayStats = computeMeanStd(gray);
    const double darkThreshold = grayStats.mean - p.pigmentSigma * grayStats.stdDev;
    const double brightThreshold = grayStats.mean + p.pigmentSigma * grayStats.stdDev;
    const double darkRatio = fractionBelow(gray, darkThreshold);
    const double brightRatio = fractionAbove(gray, brightThreshold);

    if (darkRatio > p.pigmentAreaHigh) {
        score += p.hyperpigmentationWeight;
        findings.specificFindings.push_back(PathologyFinding::HyperpigmentationAreas);
    } else if (darkRatio < p.pigmentAreaLow) {
        findings.normalIndicators.push_back(NormalIndicator::ConsistentPigmentation);
    }
    if (brightRatio > p.pigmentAreaHigh) {
        score += p.hypopigmentationWeight;
        findings.specificFindings.push_back(PathologyFinding::HypopigmentationAreas);
    }

    // 4. Border definition
    const double edgeDensity = features.texture.edgeDensity;
    if (edgeDensity > p.borderEdgeHigh) {
        score += p.definedBordersWeight;
        findings.specificFindings.push_back(PathologyFinding::DefinedBorders);
    } else if (edgeDensity < p.borderEdgeLow) {
        findings.normalIndicators.push_back(NormalIndicator::SmoothTexture);
    }

    // 5. Texture
    const double texture = features.texture.textureComplexity;
    if (texture > p.textureHigh) {
        score += p.textureIrregularityWeight;
        findings.specificFindings.push_back(PathologyFinding::TextureIrregularity);
    } else if (texture < p.textureLow) {
        findings.normalIndicators.push_back(NormalIndicator::NormalTexture);
    }

    // 6. Lesion-like dark regions
    if (countPotentialLesions(gray, planes.width, planes.height) > 0) {
        score += p.potentialLesionsWeight;
        findings.specificFindings.push_back(PathologyFinding::PotentialLesions);
    } else {
        findings.normalIndicators.push_back(NormalIndicator::NoObviousLesions);
    }

    // 7. Skin tone variation
    if (skinToneVariation(planes) > p.toneVariationHigh) {
        score += p.toneVariationWeight;
        findings.specificFindings.push_back(PathologyFinding::SkinToneVariation);
    }

    findings.pathologicalConfidence = std::clamp(score, 0.0, 1.0);
    findings.clinicalSignificance = dermatologySignificance(score);
    findings.hasPathologicalFindings =
        findings.clinicalSignificance != ClinicalSignificance::RoutineSkinDocumentation;

    getLogger()->debug("Dermatology score {:.2f} with {} findings -> {}",
                       score, findings.specificFindings.size(),
                       core::toTag(findings.clinicalSignificance));
    return findings;
}

core::PathologyFindings
PathologyAnalyzer::analyzeRadiological(const core::TextureMetrics& texture) const {
    core::PathologyFindings findings;
    findings.normalIndicators.push_back(NormalIndicator::RoutineImaging);
    findings.clinicalSignificance = ClinicalSignificance::ScreeningExamination;

    // Only very busy images are flagged, and never as findings
    if (texture.edgeDensity > review_.radiologyEdgeDensity
        && texture.textureComplexity > review_.radiologyTexture) {
        findings.pathologicalConfidence = review_.radiologyConfidence;
        findings.specificFindings.push_back(PathologyFinding::ImageComplexity);
        findings.clinicalSignificance = ClinicalSignificance::ProfessionalReviewRecommended;
    }
    return findings;
}

core::PathologyFindings
PathologyAnalyzer::analyzeClinicalPhotograph(const ImageFeatures& features) const {
    core::PathologyFindings findings;
    findings.normalIndicators.push_back(NormalIndicator::ClinicalDocumentation);
    findings.clinicalSignificance = ClinicalSignificance::RoutineDocumentation;

    const double colorVariance = features.color ? features.color->colorVariance : 0.0;
    if (colorVariance > review_.clinicalColorVariance
        && features.texture.edgeDensity > review_.clinicalEdgeDensity) {
        findings.pathologicalConfidence = review_.clinicalConfidence;
        findings.specificFindings.push_back(PathologyFinding::VisualVariation);
        findings.clinicalSignificance = ClinicalSignificance::ProfessionalReviewRecommended;
    }
    return findings;
}

core::PathologyFindings PathologyAnalyzer::analyzeHistological() const {
    core::PathologyFindings findings;
    findings.hasPathologicalFindings = true;
    findings.pathologicalConfidence = review_.histologyConfidence;
    findings.specificFindings.push_back(PathologyFinding::HistologicalAnalysis);
    findings.clinicalSignificance = ClinicalSignificance::PathologicalExamination;
    return findings;
}

core::PathologyFindings
PathologyAnalyzer::limitedAnalysis(ClinicalSignificance significance) {
    core::PathologyFindings findings;
    findings.normalIndicators.push_back(NormalIndicator::AnalysisLimited);
    findings.clinicalSignificance = significance;
    return findings;
}

ClinicalSignificance PathologyAnalyzer::dermatologySignificance(double confidence) const {
    if (confidence > dermatology_.conditionMonitoringConfidence) {
        return ClinicalSignificance::ConditionMonitoring;
    }
    if (confidence > dermatology_.followUpConfidence) {
        return ClinicalSignificance::FollowUpRecommended;
    }
    return ClinicalSignificance::RoutineSkinDocumentation;
}

double PathologyAnalyzer::rednessScore(const core::ChannelPlanes& planes) {
    const auto count = planes.pixelCount();
    if (count == 0) {
        return 0.0;
    }

    std::vector<float> ratios(count);
    for (std::size_t i = 0; i < count; ++i) {
        ratios[i] = planes.red[i] / (planes.green[i] + planes.blue[i] + 1.0f);
    }

    const auto stats = computeMeanStd(ratios);
    const double highArea = fractionAbove(ratios, stats.mean + stats.stdDev);
    return std::min(1.0, stats.mean * 0.7 + highArea * 0.3);
}

double PathologyAnalyzer::skinToneVariation(const core::ChannelPlanes& planes) {
    const int width = planes.width;
    const int height = planes.height;
    if (planes.pixelCount() == 0) {
        return 0.0;
    }

    auto luminance = planes.luminance();

    double gradX = 0.0;
    if (width > 1) {
        for (int y = 0; y < height; ++y) {
            for (int x = 0; x + 1 < width; ++x) {
                gradX += std::abs(luminance[planes.index(x + 1, y)] - luminance[planes.index(x, y)]);
            }
        }
        gradX /= static_cast<double>(height) * (width - 1);
    }

    double gradY = 0.0;
    if (height > 1) {
        for (int y = 0; y + 1 < height; ++y) {
            for (int x = 0; x < width; ++x) {
                gradY += std::abs(luminance[planes.index(x, y + 1)] - luminance[planes.index(x, y)]);
            }
        }
        gradY /= static_cast<double>(height - 1) * width;
    }

    return std::min(1.0, (gradX + gradY) / 255.0 * 2.0);
}

int PathologyAnalyzer::countPotentialLesions(const std::vector<float>& gray,
                                             int width, int height) const {
    if (width <= 0 || height <= 0 || gray.empty()
        || gray.size() != static_cast<std::size_t>(width) * static_cast<std::size_t>(height)) {
        return 0;
    }

    const auto stats = computeMeanStd(gray);
    const double darkLimit = stats.mean - dermatology_.pigmentSigma * stats.stdDev;

    // BinaryThreshold bounds are inclusive; the largest float below the limit
    // keeps the comparison strict
    auto upper = static_cast<float>(darkLimit);
    if (static_cast<double>(upper) >= darkLimit) {
        upper = std::nextafter(upper, -std::numeric_limits<float>::infinity());
    }
    if (upper < std::numeric_limits<float>::lowest()) {
        return 0;
    }

    auto image = GrayImageType::New();
    GrayImageType::RegionType region;
    region.SetSize(0, static_cast<itk::SizeValueType>(width));
    region.SetSize(1, static_cast<itk::SizeValueType>(height));
    image->SetRegions(region);
    image->Allocate();
    std::copy(gray.begin(), gray.end(), image->GetBufferPointer());

    try {
        // Step 1: dark mask
        using ThresholdFilter = itk::BinaryThresholdImageFilter<GrayImageType, MaskImageType>;
        auto threshold = ThresholdFilter::New();
        threshold->SetInput(image);
        threshold->SetLowerThreshold(std::numeric_limits<float>::lowest());
        threshold->SetUpperThreshold(upper);
        threshold->SetInsideValue(1);
        threshold->SetOutsideValue(0);

        // Step 2: 4-connected components
        using ConnectedFilter = itk::ConnectedComponentImageFilter<MaskImageType, LabelImageType>;
        auto connected = ConnectedFilter::New();
        connected->SetInput(threshold->GetOutput());
        connected->SetFullyConnected(false);
        connected->Update();

        const auto components = connected->GetObjectCount();
        if (components == 0) {
            return 0;
        }

        // Step 3: per-label pixel counts
        using StatsFilter = itk::LabelStatisticsImageFilter<GrayImageType, LabelImageType>;
        auto labelStats = StatsFilter::New();
        labelStats->SetInput(image);
        labelStats->SetLabelInput(connected->GetOutput());
        labelStats->Update();

        const double total = static_cast<double>(gray.size());
        int lesions = 0;
        for (LabelImageType::PixelType label = 1; label <= components; ++label) {
            if (!labelStats->HasLabel(label)) continue;
            const double ratio = static_cast<double>(labelStats->GetCount(label)) / total;
            if (ratio > dermatology_.lesionMinAreaRatio && ratio < dermatology_.lesionMaxAreaRatio) {
                ++lesions;
            }
        }

        getLogger()->debug("{} dark components, {} within lesion bounds", components, lesions);
        return lesions;
    } catch (const itk::ExceptionObject& e) {
        getLogger()->warn("Lesion labeling failed: {}", e.GetDescription());
        return 0;
    }
}

}  // namespace med_classifier::services
