#include "core/medical_image_types.hpp"

#include <algorithm>

namespace med_classifier::core {

std::string_view toTag(MedicalImageType type) {
    switch (type) {
        case MedicalImageType::ChestXray: return "chest_xray";
        case MedicalImageType::ComputedTomography: return "computed_tomography";
        case MedicalImageType::MagneticResonance: return "magnetic_resonance";
        case MedicalImageType::Ultrasound: return "ultrasound";
        case MedicalImageType::Mammography: return "mammography";
        case MedicalImageType::DermatologicalImage: return "dermatological_image";
        case MedicalImageType::RetinalImage: return "retinal_image";
        case MedicalImageType::PathologicalImage: return "pathological_image";
        case MedicalImageType::Endoscopy: return "endoscopy";
        case MedicalImageType::ClinicalPhotograph: return "clinical_photograph";
        case MedicalImageType::MedicalRadiograph: return "medical_radiograph";
        case MedicalImageType::RadiologicalScan: return "radiological_scan";
        case MedicalImageType::HighResolutionClinicalImage: return "high_resolution_clinical_image";
        case MedicalImageType::MedicalDocument: return "medical_document";
        case MedicalImageType::LabResultDocument: return "lab_result_document";
        case MedicalImageType::MedicalImage: return "medical_image";
    }
    return "medical_image";
}

std::string_view toTag(ClinicalSignificance significance) {
    switch (significance) {
        case ClinicalSignificance::RoutineDocumentation: return "routine_documentation";
        case ClinicalSignificance::RoutineSkinDocumentation: return "routine_skin_documentation";
        case ClinicalSignificance::ScreeningExamination: return "screening_examination";
        case ClinicalSignificance::ConditionMonitoring: return "condition_monitoring";
        case ClinicalSignificance::FollowUpRecommended: return "follow_up_recommended";
        case ClinicalSignificance::ProfessionalReviewRecommended: return "professional_review_recommended";
        case ClinicalSignificance::PathologicalExamination: return "pathological_examination";
    }
    return "routine_documentation";
}

std::string_view toTag(PathologyFinding finding) {
    switch (finding) {
        case PathologyFinding::ColorVariation: return "color_variation";
        case PathologyFinding::RednessPattern: return "redness_pattern";
        case PathologyFinding::HyperpigmentationAreas: return "hyperpigmentation_areas";
        case PathologyFinding::HypopigmentationAreas: return "hypopigmentation_areas";
        case PathologyFinding::DefinedBorders: return "defined_borders";
        case PathologyFinding::TextureIrregularity: return "texture_irregularity";
        case PathologyFinding::PotentialLesions: return "potential_lesions";
        case PathologyFinding::SkinToneVariation: return "skin_tone_variation";
        case PathologyFinding::ImageComplexity: return "image_complexity";
        case PathologyFinding::VisualVariation: return "visual_variation";
        case PathologyFinding::HistologicalAnalysis: return "histological_analysis";
    }
    return "image_complexity";
}

std::string_view toTag(NormalIndicator indicator) {
    switch (indicator) {
        case NormalIndicator::UniformColoration: return "uniform_coloration";
        case NormalIndicator::NormalColoration: return "normal_coloration";
        case NormalIndicator::ConsistentPigmentation: return "consistent_pigmentation";
        case NormalIndicator::SmoothTexture: return "smooth_texture";
        case NormalIndicator::NormalTexture: return "normal_texture";
        case NormalIndicator::NoObviousLesions: return "no_obvious_lesions";
        case NormalIndicator::RoutineImaging: return "routine_imaging";
        case NormalIndicator::ClinicalDocumentation: return "clinical_documentation";
        case NormalIndicator::AnalysisLimited: return "analysis_limited";
    }
    return "analysis_limited";
}

std::optional<MedicalImageType> medicalImageTypeFromTag(std::string_view tag) {
    for (auto type : kAllMedicalImageTypes) {
        if (toTag(type) == tag) {
            return type;
        }
    }
    return std::nullopt;
}

std::optional<ClinicalSignificance> clinicalSignificanceFromTag(std::string_view tag) {
    for (auto significance : kAllClinicalSignificances) {
        if (toTag(significance) == tag) {
            return significance;
        }
    }
    return std::nullopt;
}

std::string toSpacedTag(MedicalImageType type) {
    std::string spaced(toTag(type));
    std::replace(spaced.begin(), spaced.end(), '_', ' ');
    return spaced;
}

bool isRadiologicalType(MedicalImageType type) {
    return type == MedicalImageType::ChestXray
        || type == MedicalImageType::ComputedTomography
        || type == MedicalImageType::MagneticResonance
        || type == MedicalImageType::RadiologicalScan;
}

}  // namespace med_classifier::core
