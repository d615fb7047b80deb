#include "core/medical_image_types.hpp"

#include <gtest/gtest.h>

#include <set>
#include <string>

namespace med_classifier::core::test {

// ============================================================================
// Tags
// ============================================================================
TEST(MedicalImageTypesTest, ImageTypeTagsRoundTrip)
{
    std::set<std::string_view> seen;
    for (auto type : kAllMedicalImageTypes) {
        auto tag = toTag(type);
        EXPECT_TRUE(seen.insert(tag).second) << "duplicate tag " << tag;
        EXPECT_EQ(medicalImageTypeFromTag(tag), type);
    }
}

TEST(MedicalImageTypesTest, SignificanceTagsRoundTrip)
{
    for (auto significance : kAllClinicalSignificances) {
        EXPECT_EQ(clinicalSignificanceFromTag(toTag(significance)), significance);
    }
}

TEST(MedicalImageTypesTest, UnknownTagIsRejected)
{
    EXPECT_FALSE(medicalImageTypeFromTag("x_ray").has_value());
    EXPECT_FALSE(medicalImageTypeFromTag("").has_value());
    EXPECT_FALSE(clinicalSignificanceFromTag("urgent").has_value());
}

TEST(MedicalImageTypesTest, KnownTags)
{
    EXPECT_EQ(toTag(MedicalImageType::ChestXray), "chest_xray");
    EXPECT_EQ(toTag(MedicalImageType::HighResolutionClinicalImage),
              "high_resolution_clinical_image");
    EXPECT_EQ(toTag(MedicalImageType::MedicalImage), "medical_image");
    EXPECT_EQ(toTag(ClinicalSignificance::ProfessionalReviewRecommended),
              "professional_review_recommended");
    EXPECT_EQ(toTag(PathologyFinding::PotentialLesions), "potential_lesions");
    EXPECT_EQ(toTag(NormalIndicator::NoObviousLesions), "no_obvious_lesions");
}

TEST(MedicalImageTypesTest, SpacedTag)
{
    EXPECT_EQ(toSpacedTag(MedicalImageType::ChestXray), "chest xray");
    EXPECT_EQ(toSpacedTag(MedicalImageType::LabResultDocument), "lab result document");
    EXPECT_EQ(toSpacedTag(MedicalImageType::Endoscopy), "endoscopy");
}

TEST(MedicalImageTypesTest, FindingAndNormalVocabulariesAreDisjoint)
{
    std::set<std::string_view> findings;
    for (auto finding : {PathologyFinding::ColorVariation, PathologyFinding::RednessPattern,
                         PathologyFinding::HyperpigmentationAreas,
                         PathologyFinding::HypopigmentationAreas,
                         PathologyFinding::DefinedBorders, PathologyFinding::TextureIrregularity,
                         PathologyFinding::PotentialLesions, PathologyFinding::SkinToneVariation,
                         PathologyFinding::ImageComplexity, PathologyFinding::VisualVariation,
                         PathologyFinding::HistologicalAnalysis}) {
        findings.insert(toTag(finding));
    }
    EXPECT_EQ(findings.size(), 11u);

    for (auto indicator : {NormalIndicator::UniformColoration, NormalIndicator::NormalColoration,
                           NormalIndicator::ConsistentPigmentation, NormalIndicator::SmoothTexture,
                           NormalIndicator::NormalTexture, NormalIndicator::NoObviousLesions,
                           NormalIndicator::RoutineImaging, NormalIndicator::ClinicalDocumentation,
                           NormalIndicator::AnalysisLimited}) {
        EXPECT_EQ(findings.count(toTag(indicator)), 0u) << toTag(indicator);
    }
}

// ============================================================================
// Radiological grouping
// ============================================================================
TEST(MedicalImageTypesTest, RadiologicalTypes)
{
    EXPECT_TRUE(isRadiologicalType(MedicalImageType::ChestXray));
    EXPECT_TRUE(isRadiologicalType(MedicalImageType::ComputedTomography));
    EXPECT_TRUE(isRadiologicalType(MedicalImageType::MagneticResonance));
    EXPECT_TRUE(isRadiologicalType(MedicalImageType::RadiologicalScan));

    EXPECT_FALSE(isRadiologicalType(MedicalImageType::Ultrasound));
    EXPECT_FALSE(isRadiologicalType(MedicalImageType::Mammography));
    EXPECT_FALSE(isRadiologicalType(MedicalImageType::MedicalRadiograph));
    EXPECT_FALSE(isRadiologicalType(MedicalImageType::DermatologicalImage));
}

TEST(MedicalImageTypesTest, DefaultAnalysisIsGenericAndEmpty)
{
    ImageAnalysis analysis;
    EXPECT_EQ(analysis.medicalType, MedicalImageType::MedicalImage);
    EXPECT_FALSE(analysis.isDicom);
    EXPECT_FALSE(analysis.dicom.has_value());
    EXPECT_FALSE(analysis.medicalContext.has_value());
    EXPECT_FALSE(analysis.fallbackAnalysis);
}

}  // namespace med_classifier::core::test
