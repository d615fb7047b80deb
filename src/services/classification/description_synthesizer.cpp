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

#include "services/classification/description_synthesizer.hpp"

#include <algorithm>
#include <cctype>
#include <format>

namespace med_classifier::services {

using core::ClinicalSignificance;
using core::MedicalImageType;
using core::NormalIndicator;
using core::PathologyFinding;

namespace {

using KeywordList = std::vector<std::string_view>;

const KeywordList& baseTypeKeywords(MedicalImageType type) {
    static const KeywordList chest = {"radiology", "pulmonary imaging", "cardiac imaging",
                                      "thoracic imaging", "respiratory system"};
    static const KeywordList ct = {"radiology", "cross-sectional imaging", "diagnostic imaging",
                                   "CT imaging"};
    static const KeywordList mr = {"radiology", "soft tissue imaging", "MRI imaging",
                                   "diagnostic imaging"};
    static const KeywordList ultrasound = {"sonography", "real-time imaging",
                                           "diagnostic ultrasound", "medical imaging"};
    static const KeywordList mammography = {"breast imaging", "women's health",
                                            "preventive screening"};
    static const KeywordList dermatology = {"dermatology", "skin imaging", "skin documentation"};
    static const KeywordList retinal = {"ophthalmology", "eye examination", "retinal imaging",
                                        "vision assessment"};
    static const KeywordList pathology = {"pathology", "histology", "tissue analysis",
                                          "microscopy"};
    static const KeywordList endoscopy = {"gastroenterology", "internal examination",
                                          "endoscopic imaging"};
    static const KeywordList photograph = {"clinical documentation", "medical photography"};
    static const KeywordList document = {"clinical documentation", "medical record",
                                         "patient information"};
    static const KeywordList lab = {"laboratory", "diagnostic testing", "clinical chemistry"};
    static const KeywordList fallback = {"medical imaging", "clinical documentation"};

    switch (type) {
        case MedicalImageType::ChestXray: return chest;
        case MedicalImageType::ComputedTomography: return ct;
        case MedicalImageType::MagneticResonance: return mr;
        case MedicalImageType::Ultrasound: return ultrasound;
        case MedicalImageType::Mammography: return mammography;
        case MedicalImageType::DermatologicalImage: return dermatology;
        case MedicalImageType::RetinalImage: return retinal;
        case MedicalImageType::PathologicalImage: return pathology;
        case MedicalImageType::Endoscopy: return endoscopy;
        case MedicalImageType::ClinicalPhotograph: return photograph;
        case MedicalImageType::MedicalDocument: return document;
        case MedicalImageType::LabResultDocument: return lab;
        default: return fallback;
    }
}

KeywordList findingKeywords(PathologyFinding finding) {
    switch (finding) {
        case PathologyFinding::ColorVariation:
            return {"pigmentation changes", "color irregularity"};
        case PathologyFinding::RednessPattern:
            return {"redness", "skin irritation"};
        case PathologyFinding::HyperpigmentationAreas:
            return {"hyperpigmentation", "dark spots"};
        case PathologyFinding::HypopigmentationAreas:
            return {"hypopigmentation", "light spots"};
        case PathologyFinding::DefinedBorders:
            return {"lesion borders", "skin lesion"};
        case PathologyFinding::TextureIrregularity:
            return {"skin texture changes", "surface irregularity"};
        case PathologyFinding::PotentialLesions:
            return {"skin lesion", "dermatological finding"};
        case PathologyFinding::SkinToneVariation:
            return {"skin tone changes"};
        case PathologyFinding::ImageComplexity:
            return {"complex imaging", "detailed examination"};
        case PathologyFinding::VisualVariation:
            return {"clinical variation", "visual changes"};
        case PathologyFinding::HistologicalAnalysis:
            return {};
    }
    return {};
}

/// Finding phrases that belong to one image category
struct FindingCategory {
    std::vector<PathologyFinding> findings;
    KeywordList summary;
};

const FindingCategory& dermatologyFindings() {
    static const FindingCategory category = {
        {PathologyFinding::ColorVariation, PathologyFinding::RednessPattern,
         PathologyFinding::HyperpigmentationAreas, PathologyFinding::HypopigmentationAreas,
         PathologyFinding::DefinedBorders, PathologyFinding::TextureIrregularity,
         PathologyFinding::PotentialLesions, PathologyFinding::SkinToneVariation},
        {"dermatological condition", "skin condition monitoring"}};
    return category;
}

const FindingCategory& radiologyFindings() {
    static const FindingCategory category = {
        {PathologyFinding::ImageComplexity},
        {"diagnostic imaging", "radiological assessment"}};
    return category;
}

const FindingCategory& clinicalPhotoFindings() {
    static const FindingCategory category = {
        {PathologyFinding::VisualVariation},
        {"clinical assessment", "medical observation"}};
    return category;
}

const FindingCategory* findingCategoryFor(MedicalImageType type) {
    if (type == MedicalImageType::DermatologicalImage) {
        return &dermatologyFindings();
    }
    if (core::isRadiologicalType(type)) {
        return &radiologyFindings();
    }
    if (type == MedicalImageType::ClinicalPhotograph) {
        return &clinicalPhotoFindings();
    }
    return nullptr;
}

KeywordList routineKeywords(MedicalImageType type) {
    if (type == MedicalImageType::DermatologicalImage) {
        return {"baseline skin documentation", "natural skin appearance", "skin documentation"};
    }
    if (core::isRadiologicalType(type)) {
        return {"routine imaging", "screening examination", "preventive care"};
    }
    if (type == MedicalImageType::ClinicalPhotograph) {
        return {"routine documentation", "clinical photography", "medical record"};
    }
    return {};
}

KeywordList significanceKeywords(ClinicalSignificance significance) {
    switch (significance) {
        case ClinicalSignificance::RoutineDocumentation:
            return {"routine care", "documentation"};
        case ClinicalSignificance::RoutineSkinDocumentation:
            return {"skin health", "routine dermatology"};
        case ClinicalSignificance::ScreeningExamination:
            return {"preventive care", "health screening"};
        case ClinicalSignificance::ConditionMonitoring:
            return {"medical monitoring", "follow-up care"};
        case ClinicalSignificance::FollowUpRecommended:
            return {"clinical follow-up", "medical review"};
        case ClinicalSignificance::ProfessionalReviewRecommended:
            return {"professional assessment", "clinical evaluation"};
        case ClinicalSignificance::PathologicalExamination:
            return {"diagnostic analysis", "pathological assessment"};
    }
    return {};
}

KeywordList normalIndicatorKeywords(NormalIndicator indicator) {
    switch (indicator) {
        case NormalIndicator::UniformColoration:
            return {"normal pigmentation", "natural skin appearance"};
        case NormalIndicator::NormalColoration:
            return {"normal pigmentation"};
        case NormalIndicator::ConsistentPigmentation:
            return {"baseline skin documentation", "consistent skin appearance"};
        case NormalIndicator::SmoothTexture:
            return {"normal skin texture", "natural skin surface"};
        case NormalIndicator::NormalTexture:
            return {"normal skin texture"};
        case NormalIndicator::NoObviousLesions:
            return {"clear skin appearance", "no visible abnormalities"};
        case NormalIndicator::RoutineImaging:
            return {"standard imaging", "routine examination"};
        case NormalIndicator::ClinicalDocumentation:
            return {"medical documentation"};
        case NormalIndicator::AnalysisLimited:
            return {};
    }
    return {};
}

const KeywordList& dicomKeywords() {
    static const KeywordList keywords = {"DICOM", "medical imaging standard", "digital imaging"};
    return keywords;
}

constexpr std::string_view kHighResolutionKeyword = "high resolution";
constexpr std::string_view kGrayscaleKeyword = "grayscale imaging";
constexpr std::string_view kColorKeyword = "color imaging";

std::string_view baseClinicalContext(MedicalImageType type) {
    switch (type) {
        case MedicalImageType::ChestXray: return "for pulmonary and cardiac imaging";
        case MedicalImageType::ComputedTomography: return "for detailed cross-sectional imaging";
        case MedicalImageType::MagneticResonance: return "for soft tissue and organ imaging";
        case MedicalImageType::Ultrasound: return "for real-time imaging assessment";
        case MedicalImageType::Mammography: return "for breast health screening";
        case MedicalImageType::DermatologicalImage: return "for skin documentation";
        case MedicalImageType::RetinalImage: return "for eye health examination";
        case MedicalImageType::PathologicalImage: return "for histological analysis";
        case MedicalImageType::Endoscopy: return "for internal examination";
        case MedicalImageType::ClinicalPhotograph: return "for clinical documentation";
        case MedicalImageType::MedicalDocument: return "containing clinical information";
        case MedicalImageType::LabResultDocument: return "containing laboratory test results";
        default: return "for medical documentation";
    }
}

std::string toLower(std::string_view text) {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered;
}

std::string joined(const std::vector<std::string>& parts, std::string_view separator) {
    std::string result;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            result += separator;
        }
        result += parts[i];
    }
    return result;
}

const core::PathologyFindings* pathologyOf(const core::ImageAnalysis& analysis) {
    if (analysis.medicalContext && analysis.medicalContext->pathologicalAnalysis) {
        return &*analysis.medicalContext->pathologicalAnalysis;
    }
    return nullptr;
}

void append(std::vector<std::string>& out, const KeywordList& keywords) {
    for (auto keyword : keywords) {
        out.emplace_back(keyword);
    }
}

void appendUnique(std::vector<std::string_view>& out, const KeywordList& keywords) {
    for (auto keyword : keywords) {
        if (std::find(out.begin(), out.end(), keyword) == out.end()) {
            out.push_back(keyword);
        }
    }
}

}  // anonymous namespace

DescriptionSynthesizer::DescriptionSynthesizer(std::size_t maxKeywords,
                                               int highResolutionDimension)
    : prioritizer_(maxKeywords)
    , highResolutionDimension_(highResolutionDimension) {}

std::string DescriptionSynthesizer::describe(const core::ImageAnalysis& analysis) const {
    std::vector<std::string> parts;

    const auto type = analysis.medicalType;
    const std::string friendly = friendlyName(type);
    parts.push_back(std::format("Medical image: {}", friendly));

    std::string friendlyTag = toLower(friendly);
    std::replace(friendlyTag.begin(), friendlyTag.end(), ' ', '_');
    if (friendlyTag != core::toTag(type)) {
        parts.push_back(std::format("Classification: {}", core::toSpacedTag(type)));
    }

    if (analysis.isDicom && analysis.dicom) {
        const auto& dicom = *analysis.dicom;
        parts.push_back(std::format("DICOM modality: {}",
                                    dicom.modality.empty() ? "Unknown" : dicom.modality));
        if (!dicom.bodyPartExamined.empty() && dicom.bodyPartExamined != "Unknown") {
            parts.push_back(std::format("Anatomical region: {}", dicom.bodyPartExamined));
        }
        if (!dicom.studyDescription.empty()) {
            parts.push_back(std::format("Clinical study: {}", dicom.studyDescription));
        }
        if (!dicom.seriesDescription.empty()) {
            parts.push_back(std::format("Image series: {}", dicom.seriesDescription));
        }
    }

    parts.push_back(clinicalContext(analysis));

    // Fallback analyses and DICOM headers without Rows/Columns carry no size
    if (!analysis.fallbackAnalysis && analysis.width > 0 && analysis.height > 0) {
        parts.push_back(std::format("Resolution: {}x{}", analysis.width, analysis.height));
    }
    if (isHighResolution(analysis)) {
        parts.emplace_back("High resolution imaging");
    }

    parts.emplace_back(analysis.isGrayscale ? "Grayscale medical imaging"
                                            : "Color clinical imaging");

    if (auto indicators = featureIndicators(analysis); !indicators.empty()) {
        parts.push_back(std::format("Medical features: {}", joined(indicators, ", ")));
    }

    if (auto confidence = confidenceDescription(analysis)) {
        parts.push_back(*confidence);
    }

    if (auto ranked = keywords(analysis); !ranked.empty()) {
        parts.push_back(std::format("Medical keywords: {}", joined(ranked, ", ")));
    }

    return joined(parts, ". ") + ".";
}

std::vector<std::string>
DescriptionSynthesizer::keywords(const core::ImageAnalysis& analysis) const {
    return prioritizer_.prioritize(rawKeywords(analysis));
}

std::vector<std::string>
DescriptionSynthesizer::rawKeywords(const core::ImageAnalysis& analysis) const {
    std::vector<std::string> raw;
    const auto type = analysis.medicalType;
    const auto* pathology = pathologyOf(analysis);

    append(raw, baseTypeKeywords(type));

    if (pathology && pathology->hasPathologicalFindings) {
        if (const auto* category = findingCategoryFor(type)) {
            std::vector<std::string> phrases;
            for (auto finding : pathology->specificFindings) {
                const bool inCategory = std::find(category->findings.begin(),
                                                  category->findings.end(), finding)
                    != category->findings.end();
                if (inCategory) {
                    append(phrases, findingKeywords(finding));
                }
            }
            if (!phrases.empty()) {
                raw.insert(raw.end(), phrases.begin(), phrases.end());
                append(raw, category->summary);
            }
        }
    } else {
        append(raw, routineKeywords(type));
    }

    const auto significance = pathology ? pathology->clinicalSignificance
                                        : ClinicalSignificance::RoutineDocumentation;
    append(raw, significanceKeywords(significance));

    if (pathology) {
        for (auto indicator : pathology->normalIndicators) {
            append(raw, normalIndicatorKeywords(indicator));
        }
    }

    if (analysis.isDicom) {
        append(raw, dicomKeywords());
        if (analysis.dicom && !analysis.dicom->modality.empty()) {
            raw.push_back(std::format("{} imaging", analysis.dicom->modality));
        }
    }

    if (isHighResolution(analysis)) {
        raw.emplace_back(kHighResolutionKeyword);
    }
    raw.emplace_back(analysis.isGrayscale ? kGrayscaleKeyword : kColorKeyword);

    return raw;
}

std::string DescriptionSynthesizer::friendlyName(MedicalImageType type) {
    switch (type) {
        case MedicalImageType::ChestXray: return "Chest X-ray";
        case MedicalImageType::ComputedTomography: return "CT scan";
        case MedicalImageType::MagneticResonance: return "MRI scan";
        case MedicalImageType::Ultrasound: return "Ultrasound image";
        case MedicalImageType::Mammography: return "Mammogram";
        case MedicalImageType::DermatologicalImage: return "Skin condition photo";
        case MedicalImageType::RetinalImage: return "Eye examination photo";
        case MedicalImageType::PathologicalImage: return "Tissue sample image";
        case MedicalImageType::Endoscopy: return "Internal examination image";
        case MedicalImageType::ClinicalPhotograph: return "Clinical photo";
        case MedicalImageType::MedicalRadiograph: return "Medical X-ray";
        case MedicalImageType::RadiologicalScan: return "Medical scan";
        case MedicalImageType::HighResolutionClinicalImage: return "High-quality clinical photo";
        case MedicalImageType::MedicalDocument: return "Medical report or lab result";
        case MedicalImageType::LabResultDocument: return "Laboratory test result";
        case MedicalImageType::MedicalImage: return "Medical Image";
    }
    return "Medical Image";
}

std::string DescriptionSynthesizer::clinicalContext(const core::ImageAnalysis& analysis) {
    const auto type = analysis.medicalType;
    const auto* pathology = pathologyOf(analysis);
    const auto significance = pathology ? pathology->clinicalSignificance
                                        : ClinicalSignificance::RoutineDocumentation;
    const std::string base(baseClinicalContext(type));
    const bool dermatology = type == MedicalImageType::DermatologicalImage;

    std::string context;
    switch (significance) {
        case ClinicalSignificance::RoutineDocumentation:
        case ClinicalSignificance::RoutineSkinDocumentation:
            if (dermatology) {
                context = "for routine skin health documentation";
            } else if (type == MedicalImageType::ChestXray
                       || type == MedicalImageType::ComputedTomography
                       || type == MedicalImageType::MagneticResonance) {
                context = "for routine health screening";
            } else {
                context = base;
            }
            break;
        case ClinicalSignificance::ScreeningExamination:
            context = base + " and health screening";
            break;
        case ClinicalSignificance::ConditionMonitoring:
            context = dermatology ? "for skin condition monitoring and care"
                                  : base + " and condition monitoring";
            break;
        case ClinicalSignificance::FollowUpRecommended:
            context = base + " with follow-up recommended";
            break;
        case ClinicalSignificance::ProfessionalReviewRecommended:
            context = base + " for professional assessment";
            break;
        case ClinicalSignificance::PathologicalExamination:
            context = base + " and diagnostic analysis";
            break;
    }

    if (analysis.isDicom && analysis.dicom) {
        const auto& bodyPart = analysis.dicom->bodyPartExamined;
        if (!bodyPart.empty() && bodyPart != "Unknown") {
            context += " of " + toLower(bodyPart);
        }
    }
    return context;
}

std::vector<std::string>
DescriptionSynthesizer::featureIndicators(const core::ImageAnalysis& analysis) {
    std::vector<std::string> indicators;
    if (!analysis.medicalContext) {
        return indicators;
    }
    const auto& context = *analysis.medicalContext;

    auto add = [&indicators](std::string_view indicator) {
        if (std::find(indicators.begin(), indicators.end(), indicator) == indicators.end()) {
            indicators.emplace_back(indicator);
        }
    };

    for (const auto& indicator : context.filenameIndicators) {
        add(indicator);
    }
    if (context.intensity) {
        if (context.intensity->hasHighContrast) {
            add("high contrast imaging");
        }
        if (context.intensity->hasDarkBackground) {
            add("radiological imaging");
        }
    }
    if (analysis.medicalType == MedicalImageType::DermatologicalImage && context.color
        && context.color->skinToneLikelihood > 0.5) {
        add("skin tissue visible");
    }
    if (analysis.medicalType == MedicalImageType::PathologicalImage && context.texture
        && context.texture->textureComplexity > 1.5) {
        add("microscopic detail");
    }
    return indicators;
}

std::optional<std::string>
DescriptionSynthesizer::confidenceDescription(const core::ImageAnalysis& analysis) {
    const double relevance = analysis.medicalContext
        ? analysis.medicalContext->medicalRelevanceScore : 0.0;

    if (relevance > 0.8) {
        return "High confidence medical classification";
    }
    if (relevance > 0.6) {
        return "Good confidence medical classification";
    }
    if (relevance > 0.4) {
        return "Moderate confidence medical classification";
    }
    if (analysis.isDicom) {
        return "DICOM medical imaging standard";
    }
    return std::nullopt;
}

std::vector<std::string_view> DescriptionSynthesizer::vocabulary() {
    std::vector<std::string_view> words;
    for (auto type : core::kAllMedicalImageTypes) {
        appendUnique(words, baseTypeKeywords(type));
        appendUnique(words, routineKeywords(type));
    }
    for (const auto* category : {&dermatologyFindings(), &radiologyFindings(),
                                 &clinicalPhotoFindings()}) {
        for (auto finding : category->findings) {
            appendUnique(words, findingKeywords(finding));
        }
        appendUnique(words, category->summary);
    }
    for (auto significance : core::kAllClinicalSignificances) {
        appendUnique(words, significanceKeywords(significance));
    }
    for (auto indicator : {NormalIndicator::UniformColoration, NormalIndicator::NormalColoration,
                           NormalIndicator::ConsistentPigmentation, NormalIndicator::SmoothTexture,
                           NormalIndicator::NormalTexture, NormalIndicator::NoObviousLesions,
                           NormalIndicator::RoutineImaging, NormalIndicator::ClinicalDocumentation,
                           NormalIndicator::AnalysisLimited}) {
        appendUnique(words, normalIndicatorKeywords(indicator));
    }
    appendUnique(words, dicomKeywords());
    appendUnique(words, {kHighResolutionKeyword, kGrayscaleKeyword, kColorKeyword});
    return words;
}

bool DescriptionSynthesizer::isHighResolution(const core::ImageAnalysis& analysis) const {
    return analysis.width >= highResolutionDimension_
        || analysis.height >= highResolutionDimension_;
}

}  // namespace med_classifier::services
