#include "services/classification/filename_terms.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace med_classifier::services::test {

using core::MedicalImageType;

// ============================================================================
// Tokenization
// ============================================================================
TEST(FilenameTermsTest, TokensSplitLettersAndDigits)
{
    FilenameTokens tokens("CT2_Head-Axial.DCM");
    EXPECT_EQ(tokens.lowered(), "ct2_head-axial.dcm");
    std::vector<std::string> expected = {"ct", "2", "head", "axial", "dcm"};
    EXPECT_EQ(tokens.tokens(), expected);
}

TEST(FilenameTermsTest, TokenTermsNeedWholeTokens)
{
    EXPECT_TRUE(FilenameTokens("ct_head.png").contains({"ct", TermMatch::Token}));
    EXPECT_FALSE(FilenameTokens("abstract.png").contains({"ct", TermMatch::Token}));
    EXPECT_FALSE(FilenameTokens("focus_area.png").contains({"us", TermMatch::Token}));
    EXPECT_TRUE(FilenameTokens("abstract.png").contains({"ct", TermMatch::Substring}));
}

// ============================================================================
// Indicators
// ============================================================================
TEST(FilenameTermsTest, IndicatorsInDictionaryOrder)
{
    std::vector<std::string> expected = {"xray", "chest"};
    EXPECT_EQ(findFilenameIndicators("Chest_XRay_2024.jpg"), expected);
}

TEST(FilenameTermsTest, OverlappingTermsBothReported)
{
    std::vector<std::string> expected = {"mammo", "mammography"};
    EXPECT_EQ(findFilenameIndicators("mammography_left.png"), expected);
}

TEST(FilenameTermsTest, NoIndicatorsInCameraName)
{
    EXPECT_TRUE(findFilenameIndicators("IMG_4821.jpg").empty());
    EXPECT_TRUE(findFilenameIndicators("").empty());
}

TEST(FilenameTermsTest, ScanIsAnIndicatorButNotACategory)
{
    std::vector<std::string> expected = {"scan"};
    EXPECT_EQ(findFilenameIndicators("patient_scan.png"), expected);
    EXPECT_FALSE(filenameTypeOverride("patient_scan.png").has_value());
}

// ============================================================================
// Category override
// ============================================================================
TEST(FilenameTermsTest, CategoryOverrides)
{
    EXPECT_EQ(filenameTypeOverride("cxr_001.png"), MedicalImageType::ChestXray);
    EXPECT_EQ(filenameTypeOverride("ct_head.png"), MedicalImageType::ComputedTomography);
    EXPECT_EQ(filenameTypeOverride("brain_mri.png"), MedicalImageType::MagneticResonance);
    EXPECT_EQ(filenameTypeOverride("echocardiogram.png"), MedicalImageType::Ultrasound);
    EXPECT_EQ(filenameTypeOverride("mammo_cc.png"), MedicalImageType::Mammography);
    EXPECT_EQ(filenameTypeOverride("skin_lesion.jpg"), MedicalImageType::DermatologicalImage);
    EXPECT_EQ(filenameTypeOverride("Fundus_OD.JPG"), MedicalImageType::RetinalImage);
    EXPECT_EQ(filenameTypeOverride("biopsy_slide.tif"), MedicalImageType::PathologicalImage);
    EXPECT_EQ(filenameTypeOverride("colonoscopy_3.png"), MedicalImageType::Endoscopy);
    EXPECT_EQ(filenameTypeOverride("blood_panel.png"), MedicalImageType::LabResultDocument);
    EXPECT_EQ(filenameTypeOverride("discharge_note.png"), MedicalImageType::MedicalDocument);
}

TEST(FilenameTermsTest, FirstCategoryWins)
{
    // Chest terms are checked before CT terms
    EXPECT_EQ(filenameTypeOverride("chest_ct.png"), MedicalImageType::ChestXray);
    // Lab terms are checked before document terms
    EXPECT_EQ(filenameTypeOverride("lab_report.png"), MedicalImageType::LabResultDocument);
}

TEST(FilenameTermsTest, AmbiguousShortTermsDoNotOverride)
{
    EXPECT_FALSE(filenameTypeOverride("abstract.png").has_value());
    EXPECT_FALSE(filenameTypeOverride("eyeball.png").has_value());
    EXPECT_FALSE(filenameTypeOverride("uscis_form.png").has_value());
    EXPECT_FALSE(filenameTypeOverride("vacation.jpg").has_value());
}

TEST(FilenameTermsTest, LongTermsMatchInsideWords)
{
    EXPECT_EQ(filenameTypeOverride("rashes.jpg"), MedicalImageType::DermatologicalImage);
    EXPECT_EQ(filenameTypeOverride("Rash2.JPG"), MedicalImageType::DermatologicalImage);
    EXPECT_EQ(filenameTypeOverride("bloodtests.png"), MedicalImageType::LabResultDocument);
    EXPECT_EQ(filenameTypeOverride("latest.png"), MedicalImageType::LabResultDocument);
}

TEST(FilenameTermsTest, ShortTermsAcceptPlural)
{
    EXPECT_EQ(filenameTypeOverride("eyes.png"), MedicalImageType::RetinalImage);
    EXPECT_EQ(filenameTypeOverride("both_eyes_2024.jpg"), MedicalImageType::RetinalImage);
    EXPECT_EQ(filenameTypeOverride("labs_march.png"), MedicalImageType::LabResultDocument);
    EXPECT_EQ(filenameTypeOverride("cts_followup.png"), MedicalImageType::ComputedTomography);
    EXPECT_FALSE(filenameTypeOverride("eyess.png").has_value());
}

TEST(FilenameTermsTest, ThreeLetterTermsAreTokens)
{
    EXPECT_EQ(filenameTypeOverride("cxr-pa.png"), MedicalImageType::ChestXray);
    EXPECT_FALSE(filenameTypeOverride("zaxcxrq.png").has_value());
    EXPECT_EQ(filenameTypeOverride("mri.png"), MedicalImageType::MagneticResonance);
    EXPECT_FALSE(filenameTypeOverride("admiring.png").has_value());
}

}  // namespace med_classifier::services::test
