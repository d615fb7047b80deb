#include "core/analysis_serializer.hpp"

#include <gtest/gtest.h>

#include <string>

namespace med_classifier::core::test {

using json = nlohmann::json;

namespace {

ImageAnalysis makeSkinAnalysis()
{
    ImageAnalysis analysis;
    analysis.medicalType = MedicalImageType::DermatologicalImage;
    analysis.width = 400;
    analysis.height = 300;
    analysis.aspectRatio = 1.33;
    analysis.colorMode = "RGB";
    analysis.format = "PNG";
    analysis.fileSizeBytes = 2048;

    ImageCharacteristics context;
    context.filenameIndicators = {"dermatology"};
    context.medicalRelevanceScore = 0.8;

    ColorStatistics color;
    color.meanRgb = {210.0, 160.0, 140.0};
    color.skinToneLikelihood = 1.0;
    context.color = color;

    PathologyFindings findings;
    findings.hasPathologicalFindings = true;
    findings.pathologicalConfidence = 0.3;
    findings.specificFindings = {PathologyFinding::RednessPattern};
    findings.normalIndicators = {NormalIndicator::SmoothTexture};
    findings.clinicalSignificance = ClinicalSignificance::FollowUpRecommended;
    context.pathologicalAnalysis = findings;

    analysis.medicalContext = context;
    return analysis;
}

}  // anonymous namespace

// ============================================================================
// Image analysis
// ============================================================================
TEST(AnalysisSerializerTest, TopLevelKeys)
{
    auto j = AnalysisSerializer::toJson(makeSkinAnalysis());

    EXPECT_EQ(j["is_dicom"], false);
    EXPECT_EQ(j["medical_type"], "dermatological_image");
    EXPECT_EQ(j["width"], 400);
    EXPECT_EQ(j["height"], 300);
    EXPECT_EQ(j["mode"], "RGB");
    EXPECT_EQ(j["format"], "PNG");
    EXPECT_EQ(j["file_size"], 2048);
    EXPECT_FALSE(j.contains("dicom_info"));
    EXPECT_FALSE(j.contains("analysis_error"));
    EXPECT_FALSE(j.contains("fallback_analysis"));
}

TEST(AnalysisSerializerTest, MedicalContextCarriesPathology)
{
    auto j = AnalysisSerializer::toJson(makeSkinAnalysis());
    ASSERT_TRUE(j.contains("medical_context"));

    const auto& context = j["medical_context"];
    EXPECT_DOUBLE_EQ(context["medical_relevance_score"].get<double>(), 0.8);
    EXPECT_EQ(context["filename_indicators"], json::array({"dermatology"}));
    EXPECT_DOUBLE_EQ(context["color_analysis"]["skin_tone_likelihood"].get<double>(), 1.0);
    EXPECT_FALSE(context.contains("intensity_stats"));

    const auto& pathology = context["pathological_analysis"];
    EXPECT_EQ(pathology["has_pathological_findings"], true);
    EXPECT_EQ(pathology["specific_findings"], json::array({"redness_pattern"}));
    EXPECT_EQ(pathology["normal_indicators"], json::array({"smooth_texture"}));
    EXPECT_EQ(pathology["clinical_significance"], "follow_up_recommended");
}

TEST(AnalysisSerializerTest, FallbackFlags)
{
    ImageAnalysis analysis;
    analysis.analysisError = "Decoding failed: bad header";
    analysis.fallbackAnalysis = true;

    auto j = AnalysisSerializer::toJson(analysis);
    EXPECT_EQ(j["medical_type"], "medical_image");
    EXPECT_EQ(j["analysis_error"], "Decoding failed: bad header");
    EXPECT_EQ(j["fallback_analysis"], true);
}

// ============================================================================
// DICOM
// ============================================================================
TEST(AnalysisSerializerTest, DicomInfo)
{
    DicomInfo info;
    info.modality = "MR";
    info.bodyPartExamined = "BRAIN";
    info.imageType = {"ORIGINAL", "PRIMARY"};
    info.rows = 256;
    info.columns = 192;
    info.patientId = "ANON";

    ImageAnalysis analysis;
    analysis.isDicom = true;
    analysis.medicalType = MedicalImageType::MagneticResonance;
    analysis.dicom = info;

    auto j = AnalysisSerializer::toJson(analysis);
    EXPECT_EQ(j["is_dicom"], true);
    ASSERT_TRUE(j.contains("dicom_info"));
    EXPECT_EQ(j["dicom_info"]["modality"], "MR");
    EXPECT_EQ(j["dicom_info"]["body_part"], "BRAIN");
    EXPECT_EQ(j["dicom_info"]["image_type"], json::array({"ORIGINAL", "PRIMARY"}));
    EXPECT_EQ(j["dicom_info"]["rows"], 256);
    EXPECT_EQ(j["dicom_info"]["columns"], 192);
    EXPECT_EQ(j["dicom_info"]["dicom_metadata"]["patient_id"], "ANON");
    EXPECT_FALSE(j.contains("medical_context"));
}

TEST(AnalysisSerializerTest, IntensityDistributionIsNested)
{
    IntensityStatistics stats;
    stats.mean = 74.0;
    stats.histogramPeaks = {3, 39};
    stats.isBimodal = true;

    ImageCharacteristics characteristics;
    characteristics.intensity = stats;

    auto j = AnalysisSerializer::toJson(characteristics);
    ASSERT_TRUE(j.contains("intensity_stats"));
    EXPECT_DOUBLE_EQ(j["intensity_stats"]["mean_intensity"].get<double>(), 74.0);
    EXPECT_EQ(j["intensity_stats"]["intensity_distribution"]["is_bimodal"], true);
    EXPECT_EQ(j["intensity_stats"]["intensity_distribution"]["histogram_peaks"],
              json::array({3, 39}));
}

// ============================================================================
// Text output
// ============================================================================
TEST(AnalysisSerializerTest, DumpReplacesLatin1Text)
{
    DicomInfo info;
    info.modality = "CT";
    info.institutionName = "Cl\xEDnica San Jos\xE9";

    ImageAnalysis analysis;
    analysis.isDicom = true;
    analysis.dicom = info;

    auto j = AnalysisSerializer::toJson(analysis);
    EXPECT_THROW((void)j.dump(), json::type_error);

    std::string text;
    ASSERT_NO_THROW(text = AnalysisSerializer::dump(j, 2));
    EXPECT_NE(text.find("Cl\xEF\xBF\xBDnica San Jos\xEF\xBF\xBD"), std::string::npos);
    EXPECT_NE(text.find("\"modality\": \"CT\""), std::string::npos);
}

TEST(AnalysisSerializerTest, DumpKeepsValidUtf8)
{
    json j = {{"file", "r\xC3\xB6ntgen.png"}};
    EXPECT_EQ(AnalysisSerializer::dump(j), j.dump());
}

}  // namespace med_classifier::core::test
