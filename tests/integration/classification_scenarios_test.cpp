#include <gtest/gtest.h>

#include <algorithm>
#include <cstdint>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "core/analysis_serializer.hpp"
#include "core/classifier_config.hpp"
#include "services/classification/document_chunk_builder.hpp"
#include "services/classification/embedding_context_builder.hpp"
#include "services/classification/medical_context_utils.hpp"
#include "services/classification/medical_image_classifier.hpp"

#include "test_utils/synthetic_image_generator.hpp"

using namespace med_classifier::services;
using med_classifier::core::ClinicalSignificance;
using med_classifier::core::MedicalImageType;
using med_classifier::core::PathologyFinding;
namespace synth = med_classifier::test_utils;

namespace {

bool contains(const std::string& text, const std::string& fragment) {
    return text.find(fragment) != std::string::npos;
}

template <typename T>
bool containsItem(const std::vector<T>& items, const T& item) {
    return std::find(items.begin(), items.end(), item) != items.end();
}

}  // anonymous namespace

class ClassificationScenarios : public ::testing::Test {
protected:
    MedicalImageClassifier classifier_;
};

// =============================================================================
// Grayscale radiograph
// Pipeline: PNG bytes -> decoder -> features -> type -> relevance
// =============================================================================

TEST_F(ClassificationScenarios, ChestRadiographFromCameraName) {
    auto bytes = synth::createChestRadiographPng(1200, 900);
    ASSERT_FALSE(bytes.empty());

    // PNG content behind a .jpg name is still decoded as PNG
    auto analysis = classifier_.analyzeMedicalImage(bytes, "IMG_4821.jpg");

    EXPECT_FALSE(analysis.isDicom);
    EXPECT_FALSE(analysis.fallbackAnalysis);
    EXPECT_EQ(analysis.medicalType, MedicalImageType::ChestXray);
    EXPECT_EQ(analysis.format, "PNG");
    EXPECT_EQ(analysis.width, 1200);
    EXPECT_EQ(analysis.height, 900);
    EXPECT_TRUE(analysis.isGrayscale);
    EXPECT_DOUBLE_EQ(analysis.aspectRatio, 1.33);

    ASSERT_TRUE(analysis.medicalContext.has_value());
    EXPECT_TRUE(analysis.medicalContext->filenameIndicators.empty());
    // base 0.5 + grayscale 0.2 + large 0.1 + specific type 0.2
    EXPECT_NEAR(analysis.medicalContext->medicalRelevanceScore, 1.0, 1e-9);

    auto description = classifier_.createMedicalDescription("IMG_4821.jpg", analysis);
    EXPECT_TRUE(contains(description, "Medical image: Chest X-ray"));
}

TEST_F(ClassificationScenarios, FilenameCategoryOverridesPixels) {
    auto bytes = synth::createSkinPng(256);
    auto analysis = classifier_.analyzeMedicalImage(bytes, "chest_xray_followup.png");

    EXPECT_EQ(analysis.medicalType, MedicalImageType::ChestXray);
    ASSERT_TRUE(analysis.medicalContext.has_value());
    const auto& indicators = analysis.medicalContext->filenameIndicators;
    EXPECT_TRUE(containsItem(indicators, std::string("xray")));
    EXPECT_TRUE(containsItem(indicators, std::string("chest")));
}

// =============================================================================
// Dermatology
// =============================================================================

TEST_F(ClassificationScenarios, UniformSkinNeedsFollowUp) {
    auto bytes = synth::createSkinPng(400);
    auto analysis = classifier_.analyzeMedicalImage(bytes, "photo_0001.png");

    EXPECT_EQ(analysis.medicalType, MedicalImageType::DermatologicalImage);
    EXPECT_FALSE(analysis.isGrayscale);
    ASSERT_TRUE(analysis.medicalContext.has_value());
    EXPECT_NEAR(analysis.medicalContext->medicalRelevanceScore, 0.7, 1e-9);

    ASSERT_TRUE(analysis.medicalContext->pathologicalAnalysis.has_value());
    const auto& pathology = *analysis.medicalContext->pathologicalAnalysis;
    EXPECT_EQ(pathology.clinicalSignificance, ClinicalSignificance::FollowUpRecommended);
    EXPECT_TRUE(pathology.hasPathologicalFindings);

    auto keywords = classifier_.generateMedicalKeywords(analysis);
    ASSERT_FALSE(keywords.empty());
    EXPECT_EQ(keywords.front(), "dermatology");
    EXPECT_LE(keywords.size(), 15u);

    auto description = classifier_.createMedicalDescription("photo_0001.png", analysis);
    EXPECT_TRUE(contains(description, "for skin documentation with follow-up recommended"));
}

TEST_F(ClassificationScenarios, LesionNeedsConditionMonitoring) {
    auto bytes = synth::createSkinWithLesionPng(200, 30);
    auto analysis = classifier_.analyzeMedicalImage(bytes, "photo_0002.png");

    EXPECT_EQ(analysis.medicalType, MedicalImageType::DermatologicalImage);
    ASSERT_TRUE(analysis.medicalContext.has_value());
    ASSERT_TRUE(analysis.medicalContext->pathologicalAnalysis.has_value());
    const auto& pathology = *analysis.medicalContext->pathologicalAnalysis;
    EXPECT_TRUE(containsItem(pathology.specificFindings, PathologyFinding::PotentialLesions));
    EXPECT_EQ(pathology.clinicalSignificance, ClinicalSignificance::ConditionMonitoring);
    EXPECT_NEAR(pathology.pathologicalConfidence, 0.75, 1e-9);

    auto keywords = classifier_.generateMedicalKeywords(analysis);
    EXPECT_TRUE(containsItem(keywords, std::string("skin lesion")));
}

// =============================================================================
// Other color modalities
// =============================================================================

TEST_F(ClassificationScenarios, RetinalFundus) {
    auto analysis = classifier_.analyzeMedicalImage(synth::createRetinalPng(300), "img_a.png");
    EXPECT_EQ(analysis.medicalType, MedicalImageType::RetinalImage);
}

TEST_F(ClassificationScenarios, HistologySlide) {
    auto analysis = classifier_.analyzeMedicalImage(synth::createHistologyPng(256), "img_b.png");
    EXPECT_EQ(analysis.medicalType, MedicalImageType::PathologicalImage);
    ASSERT_TRUE(analysis.medicalContext.has_value());
    ASSERT_TRUE(analysis.medicalContext->pathologicalAnalysis.has_value());
    EXPECT_NEAR(analysis.medicalContext->pathologicalAnalysis->pathologicalConfidence,
                0.8, 1e-9);
}

TEST_F(ClassificationScenarios, EndoscopyFrame) {
    auto analysis = classifier_.analyzeMedicalImage(synth::createEndoscopyPng(256), "img_c.png");
    EXPECT_EQ(analysis.medicalType, MedicalImageType::Endoscopy);
}

TEST_F(ClassificationScenarios, ScannedDocument) {
    auto analysis = classifier_.analyzeMedicalImage(synth::createDocumentPng(200), "img_d.png");
    EXPECT_EQ(analysis.medicalType, MedicalImageType::MedicalDocument);
}

// =============================================================================
// DICOM
// =============================================================================

TEST_F(ClassificationScenarios, DicomComputedTomography) {
    auto bytes = synth::createDicomBytes();
    ASSERT_FALSE(bytes.empty());

    auto analysis = classifier_.analyzeMedicalImage(bytes, "scan.dcm");

    EXPECT_TRUE(analysis.isDicom);
    EXPECT_EQ(analysis.medicalType, MedicalImageType::ComputedTomography);
    EXPECT_EQ(analysis.format, "DICOM");
    EXPECT_EQ(analysis.colorMode, "DICOM");
    EXPECT_EQ(analysis.width, 512);
    EXPECT_EQ(analysis.height, 512);
    EXPECT_TRUE(analysis.isGrayscale);
    EXPECT_FALSE(analysis.medicalContext.has_value());
    ASSERT_TRUE(analysis.dicom.has_value());
    EXPECT_EQ(analysis.dicom->bodyPartExamined, "CHEST");

    auto description = classifier_.createMedicalDescription("scan.dcm", analysis);
    EXPECT_TRUE(contains(description, "of chest"));
    EXPECT_TRUE(contains(description, "DICOM medical imaging standard"));

    auto context = EmbeddingContextBuilder::build(analysis);
    EXPECT_EQ(context.rfind("DICOM CT medical image of CHEST", 0), 0u);
}

TEST_F(ClassificationScenarios, DicomWithoutModalityFallsBack) {
    synth::DicomFields fields;
    fields.modality.clear();
    auto bytes = synth::createDicomBytes(fields);
    ASSERT_FALSE(bytes.empty());

    auto analysis = classifier_.analyzeMedicalImage(bytes, "scan.dcm");

    EXPECT_FALSE(analysis.isDicom);
    EXPECT_EQ(analysis.medicalType, MedicalImageType::MedicalImage);
    EXPECT_TRUE(analysis.fallbackAnalysis);
    ASSERT_TRUE(analysis.analysisError.has_value());
    EXPECT_FALSE(analysis.analysisError->empty());
}

// =============================================================================
// Failure handling
// =============================================================================

TEST_F(ClassificationScenarios, CorruptImageYieldsFallback) {
    std::string junk = "\x89PNG this is definitely not a real image";
    std::vector<std::uint8_t> bytes(junk.begin(), junk.end());

    auto analysis = classifier_.analyzeMedicalImage(bytes, "broken.jpg");

    EXPECT_TRUE(analysis.fallbackAnalysis);
    EXPECT_EQ(analysis.medicalType, MedicalImageType::MedicalImage);
    ASSERT_TRUE(analysis.analysisError.has_value());
    ASSERT_TRUE(analysis.medicalContext.has_value());
    EXPECT_TRUE(analysis.medicalContext->filenameIndicators.empty());
    EXPECT_NEAR(analysis.medicalContext->medicalRelevanceScore, 0.3, 1e-9);
    EXPECT_EQ(analysis.fileSizeBytes, bytes.size());

    auto json = med_classifier::core::AnalysisSerializer::toJson(analysis);
    EXPECT_EQ(json["fallback_analysis"], true);
    EXPECT_TRUE(json.contains("analysis_error"));

    // Describing and keywording a fallback never throws
    auto description = classifier_.createMedicalDescription("broken.jpg", analysis);
    EXPECT_FALSE(description.empty());
    EXPECT_FALSE(contains(description, "Resolution:"));
    EXPECT_FALSE(contains(description, "0x0"));
    EXPECT_FALSE(classifier_.generateMedicalKeywords(analysis).empty());
}

// =============================================================================
// Degenerate pixels
// Scores stay within [0, 1] whatever the content
// =============================================================================

TEST_F(ClassificationScenarios, DegenerateImagesKeepScoresInRange) {
    const std::vector<std::pair<std::string, std::vector<std::uint8_t>>> inputs = {
        {"single_pixel", synth::createRgbPng(1, 1, [](int, int) { return synth::kSkinTone; })},
        {"single_gray_pixel", synth::createGrayPng(1, 1, [](int, int) { return 128; })},
        {"all_black", synth::createRgbPng(64, 64, [](int, int) { return synth::Rgb{0, 0, 0}; })},
        {"all_white",
         synth::createRgbPng(64, 64, [](int, int) { return synth::Rgb{255, 255, 255}; })},
        {"all_black_gray", synth::createGrayPng(64, 64, [](int, int) { return 0; })},
    };

    for (const auto& [name, bytes] : inputs) {
        SCOPED_TRACE(name);
        ASSERT_FALSE(bytes.empty());
        auto analysis = classifier_.analyzeMedicalImage(bytes, name + ".png");

        EXPECT_FALSE(analysis.fallbackAnalysis);
        EXPECT_FALSE(analysis.analysisError.has_value());
        ASSERT_TRUE(analysis.medicalContext.has_value());
        const double relevance = analysis.medicalContext->medicalRelevanceScore;
        EXPECT_GE(relevance, 0.0);
        EXPECT_LE(relevance, 1.0);
        ASSERT_TRUE(analysis.medicalContext->pathologicalAnalysis.has_value());
        const double confidence =
            analysis.medicalContext->pathologicalAnalysis->pathologicalConfidence;
        EXPECT_GE(confidence, 0.0);
        EXPECT_LE(confidence, 1.0);

        EXPECT_FALSE(classifier_.createMedicalDescription(name + ".png", analysis).empty());
        EXPECT_FALSE(classifier_.generateMedicalKeywords(analysis).empty());
    }
}

TEST_F(ClassificationScenarios, SinglePixelReportsItsSize) {
    auto bytes = synth::createRgbPng(1, 1, [](int, int) { return synth::Rgb{255, 255, 255}; });
    auto analysis = classifier_.analyzeMedicalImage(bytes, "dot.png");

    EXPECT_EQ(analysis.width, 1);
    EXPECT_EQ(analysis.height, 1);
    EXPECT_DOUBLE_EQ(analysis.aspectRatio, 1.0);
    EXPECT_TRUE(contains(classifier_.createMedicalDescription("dot.png", analysis),
                         "Resolution: 1x1"));
}

TEST_F(ClassificationScenarios, GrayContentInRgbContainerIsGrayscale) {
    // Saved as a 3-channel PNG although every pixel has R == G == B
    auto bytes = synth::createRgbPng(320, 240, [](int x, int y) {
        const auto v = static_cast<unsigned char>((x * 7 + y * 3) % 256);
        return synth::Rgb{v, v, v};
    });
    auto analysis = classifier_.analyzeMedicalImage(bytes, "photo_0004.png");

    EXPECT_FALSE(analysis.fallbackAnalysis);
    EXPECT_EQ(analysis.colorMode, "RGB");
    EXPECT_TRUE(analysis.isGrayscale);
    ASSERT_TRUE(analysis.medicalContext.has_value());
    EXPECT_TRUE(analysis.medicalContext->intensity.has_value());
    EXPECT_FALSE(analysis.medicalContext->color.has_value());
}

TEST_F(ClassificationScenarios, InvalidConfigurationIsRejected) {
    med_classifier::core::ClassifierConfig config;
    config.maxKeywords = 0;

    auto created = MedicalImageClassifier::create(config);
    ASSERT_FALSE(created.has_value());
    EXPECT_EQ(created.error().code, med_classifier::core::ConfigError::Code::InvalidValue);

    auto valid = MedicalImageClassifier::create(med_classifier::core::ClassifierConfig{});
    ASSERT_TRUE(valid.has_value());
    EXPECT_EQ(valid->config().maxKeywords, 15);
}

TEST_F(ClassificationScenarios, ZeroTextureDimensionIsRejectedBeforeAnalysis) {
    static_assert(!std::is_constructible_v<MedicalImageClassifier,
                                           const med_classifier::core::ClassifierConfig&>,
                  "configurations must go through create()");

    med_classifier::core::ClassifierConfig config;
    config.features.maxTextureDimension = 0;

    auto created = MedicalImageClassifier::create(config);
    ASSERT_FALSE(created.has_value());
    EXPECT_EQ(created.error().code, med_classifier::core::ConfigError::Code::InvalidValue);
}

TEST_F(ClassificationScenarios, RelevanceScoreIsClamped) {
    EXPECT_NEAR(classifier_.medicalRelevanceScore(0, false, 100, 100,
                                                  MedicalImageType::MedicalImage),
                0.5, 1e-9);
    EXPECT_NEAR(classifier_.medicalRelevanceScore(1, true, 100, 100,
                                                  MedicalImageType::MedicalImage),
                0.8, 1e-9);
    EXPECT_NEAR(classifier_.medicalRelevanceScore(6, true, 1024, 1024,
                                                  MedicalImageType::ChestXray),
                1.0, 1e-9);
}

// =============================================================================
// Document pipeline
// Pipeline: bytes -> classifier -> chunk -> metadata helpers
// =============================================================================

TEST_F(ClassificationScenarios, ChunkRoundTripThroughMetadata) {
    DocumentChunkBuilder builder(classifier_);
    auto chunk = builder.buildImageChunk(synth::createSkinWithLesionPng(200, 30),
                                         "photo_0003.png");

    EXPECT_TRUE(contains(chunk.content, "Skin condition photo"));
    EXPECT_EQ(chunk.metadata["medical_type"], "dermatological_image");

    auto context = extractMedicalContext(chunk.metadata);
    ASSERT_TRUE(context.has_value());
    auto tags = pathologicalFindings(*context);
    EXPECT_TRUE(containsItem(tags.findings, std::string("potential_lesions")));

    auto scores = confidenceScores(*context);
    EXPECT_NEAR(scores.pathologicalConfidence, 0.75, 1e-9);
    EXPECT_FALSE(hasConflictingConfidence(chunk.metadata));
}
