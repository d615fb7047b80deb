/**
 * @file medical_image_types.hpp
 * @brief Value types shared by the medical image classification pipeline
 * @details Defines the closed set of image categories, clinical significance
 *          levels, the pathology finding and normal indicator vocabularies,
 *          and the ImageAnalysis result record. Every enum has a stable
 *          snake_case tag used in descriptions, keywords and JSON output.
 *
 * @author kcenon
 * @since 1.0.0
 */
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace med_classifier::core {

/**
 * @brief Closed set of image categories produced by the classifier
 */
enum class MedicalImageType {
    ChestXray,
    ComputedTomography,
    MagneticResonance,
    Ultrasound,
    Mammography,
    DermatologicalImage,
    RetinalImage,
    PathologicalImage,
    Endoscopy,
    ClinicalPhotograph,
    MedicalRadiograph,
    RadiologicalScan,
    HighResolutionClinicalImage,
    MedicalDocument,
    LabResultDocument,
    MedicalImage  ///< Fallback when nothing more specific is known
};

/**
 * @brief Register used when describing an image
 */
enum class ClinicalSignificance {
    RoutineDocumentation,
    RoutineSkinDocumentation,
    ScreeningExamination,
    ConditionMonitoring,
    FollowUpRecommended,
    ProfessionalReviewRecommended,
    PathologicalExamination
};

/**
 * @brief Visual indicators that raise pathological confidence
 */
enum class PathologyFinding {
    ColorVariation,
    RednessPattern,
    HyperpigmentationAreas,
    HypopigmentationAreas,
    DefinedBorders,
    TextureIrregularity,
    PotentialLesions,
    SkinToneVariation,
    ImageComplexity,
    VisualVariation,
    HistologicalAnalysis
};

/**
 * @brief Indicators consistent with normal appearance
 *
 * Kept as a separate type from PathologyFinding so a tag can never appear
 * in both vocabularies.
 */
enum class NormalIndicator {
    UniformColoration,
    NormalColoration,
    ConsistentPigmentation,
    SmoothTexture,
    NormalTexture,
    NoObviousLesions,
    RoutineImaging,
    ClinicalDocumentation,
    AnalysisLimited
};

inline constexpr std::array<MedicalImageType, 16> kAllMedicalImageTypes = {
    MedicalImageType::ChestXray,
    MedicalImageType::ComputedTomography,
    MedicalImageType::MagneticResonance,
    MedicalImageType::Ultrasound,
    MedicalImageType::Mammography,
    MedicalImageType::DermatologicalImage,
    MedicalImageType::RetinalImage,
    MedicalImageType::PathologicalImage,
    MedicalImageType::Endoscopy,
    MedicalImageType::ClinicalPhotograph,
    MedicalImageType::MedicalRadiograph,
    MedicalImageType::RadiologicalScan,
    MedicalImageType::HighResolutionClinicalImage,
    MedicalImageType::MedicalDocument,
    MedicalImageType::LabResultDocument,
    MedicalImageType::MedicalImage
};

inline constexpr std::array<ClinicalSignificance, 7> kAllClinicalSignificances = {
    ClinicalSignificance::RoutineDocumentation,
    ClinicalSignificance::RoutineSkinDocumentation,
    ClinicalSignificance::ScreeningExamination,
    ClinicalSignificance::ConditionMonitoring,
    ClinicalSignificance::FollowUpRecommended,
    ClinicalSignificance::ProfessionalReviewRecommended,
    ClinicalSignificance::PathologicalExamination
};

/// snake_case tag, e.g. "chest_xray"
[[nodiscard]] std::string_view toTag(MedicalImageType type);
[[nodiscard]] std::string_view toTag(ClinicalSignificance significance);
[[nodiscard]] std::string_view toTag(PathologyFinding finding);
[[nodiscard]] std::string_view toTag(NormalIndicator indicator);

[[nodiscard]] std::optional<MedicalImageType> medicalImageTypeFromTag(std::string_view tag);
[[nodiscard]] std::optional<ClinicalSignificance> clinicalSignificanceFromTag(std::string_view tag);

/// Tag with underscores replaced by spaces, e.g. "chest xray"
[[nodiscard]] std::string toSpacedTag(MedicalImageType type);

/// True for chest X-ray, CT, MR and generic radiological scans
[[nodiscard]] bool isRadiologicalType(MedicalImageType type);

/**
 * @brief Grayscale intensity statistics on a 0-255 scale
 */
struct IntensityStatistics {
    double mean = 0.0;
    double stdDev = 0.0;
    double min = 0.0;
    double max = 0.0;
    double range = 0.0;
    double contrastRatio = 0.0;  ///< stdDev / mean, 0 when mean is 0
    bool hasHighContrast = false;
    bool hasDarkBackground = false;
    bool hasBrightRegions = false;

    // Intensity distribution
    std::vector<int> histogramPeaks;  ///< Bin indices of local maxima
    bool isBimodal = false;
    double backgroundPeakRatio = 0.0;  ///< Share of pixels in the darkest bin
    double skewness = 0.0;             ///< mean - median
};

/**
 * @brief Color statistics for RGB images
 */
struct ColorStatistics {
    std::array<double, 3> meanRgb = {0.0, 0.0, 0.0};
    double colorVariance = 0.0;
    int dominantChannel = 0;  ///< 0 = red, 1 = green, 2 = blue
    double skinToneLikelihood = 0.0;
};

/**
 * @brief Structural measures of the gray image
 */
struct TextureMetrics {
    double edgeDensity = 0.0;
    double textureComplexity = 0.0;
    bool hasRegularPatterns = false;
};

/**
 * @brief Outcome of the type-specific pathology analysis
 */
struct PathologyFindings {
    bool hasPathologicalFindings = false;
    double pathologicalConfidence = 0.0;
    std::vector<PathologyFinding> specificFindings;
    std::vector<NormalIndicator> normalIndicators;
    ClinicalSignificance clinicalSignificance = ClinicalSignificance::RoutineDocumentation;
};

/**
 * @brief Measured characteristics of a decoded, non-DICOM image
 */
struct ImageCharacteristics {
    std::optional<IntensityStatistics> intensity;
    std::optional<ColorStatistics> color;
    std::optional<TextureMetrics> texture;
    std::vector<std::string> filenameIndicators;
    double medicalRelevanceScore = 0.0;
    std::optional<PathologyFindings> pathologicalAnalysis;
};

/**
 * @brief Structural DICOM attributes used for classification and description
 */
struct DicomInfo {
    std::string modality;
    std::string bodyPartExamined;
    std::string studyDescription;
    std::string seriesDescription;
    std::vector<std::string> imageType;
    std::string photometricInterpretation;
    int rows = 0;
    int columns = 0;

    // Opaque identifiers passed through for the document pipeline
    std::string patientId;
    std::string studyDate;
    std::string acquisitionDate;
    std::string institutionName;
    std::string manufacturer;
    std::string manufacturerModel;
};

/**
 * @brief Complete classification result for one image
 *
 * Built once per call and returned by value. The DICOM path fills `dicom`,
 * the pixel heuristic path fills `medicalContext`; never both.
 */
struct ImageAnalysis {
    bool isDicom = false;
    MedicalImageType medicalType = MedicalImageType::MedicalImage;
    int width = 0;
    int height = 0;
    bool isGrayscale = false;
    double aspectRatio = 0.0;
    std::string colorMode;
    std::string format;
    std::size_t fileSizeBytes = 0;

    std::optional<DicomInfo> dicom;
    std::optional<ImageCharacteristics> medicalContext;

    std::optional<std::string> analysisError;
    bool fallbackAnalysis = false;
};

}  // namespace med_classifier::core
