#include "services/classification/document_chunk_builder.hpp"

#include "services/classification/medical_context_utils.hpp"
#include "test_utils/synthetic_image_generator.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace med_classifier::services::test {

using namespace med_classifier::test_utils;

// ============================================================================
// Test fixture
// ============================================================================
class DocumentChunkBuilderTest : public ::testing::Test {
protected:
    MedicalImageClassifier classifier_;
    DocumentChunkBuilder builder_{classifier_};
};

TEST_F(DocumentChunkBuilderTest, ImageChunkMetadata)
{
    auto bytes = createSkinPng(128);
    ASSERT_FALSE(bytes.empty());

    auto chunk = builder_.buildImageChunk(bytes, "forearm_photo.png");

    EXPECT_EQ(chunk.metadata["source"], "forearm_photo.png");
    EXPECT_EQ(chunk.metadata["content_type"], "image");
    EXPECT_EQ(chunk.metadata["medical_context"], true);
    EXPECT_EQ(chunk.metadata["is_dicom"], false);
    EXPECT_EQ(chunk.metadata["medical_type"], "dermatological_image");
    ASSERT_TRUE(chunk.metadata["image_info"].is_object());
    EXPECT_EQ(chunk.metadata["image_info"]["width"], 128);
    EXPECT_EQ(chunk.metadata["image_info"]["medical_type"], "dermatological_image");
}

TEST_F(DocumentChunkBuilderTest, ContentIsTheDescription)
{
    auto bytes = createSkinPng(128);
    auto analysis = classifier_.analyzeMedicalImage(bytes, "forearm_photo.png");

    auto chunk = builder_.buildImageChunk(analysis, "forearm_photo.png");
    EXPECT_EQ(chunk.content, classifier_.createMedicalDescription("forearm_photo.png", analysis));
    EXPECT_EQ(chunk.content.rfind("Medical image: Skin condition photo.", 0), 0u);
}

TEST_F(DocumentChunkBuilderTest, MetadataCarriesNoPixelData)
{
    auto bytes = createSkinPng(64);
    auto chunk = builder_.buildImageChunk(bytes, "skin.png");
    EXPECT_FALSE(chunk.metadata.contains("data"));
    EXPECT_FALSE(chunk.metadata["image_info"].contains("data"));
}

TEST_F(DocumentChunkBuilderTest, MedicalContextIsRecoverable)
{
    auto bytes = createSkinPng(128);
    auto chunk = builder_.buildImageChunk(bytes, "skin.png");

    auto context = extractMedicalContext(chunk.metadata);
    ASSERT_TRUE(context.has_value());
    auto scores = confidenceScores(*context);
    EXPECT_GT(scores.relevance, 0.0);

    auto tags = pathologicalFindings(*context);
    EXPECT_FALSE(tags.normalIndicators.empty());
}

TEST_F(DocumentChunkBuilderTest, DicomChunk)
{
    auto bytes = createDicomBytes();
    ASSERT_FALSE(bytes.empty());

    auto chunk = builder_.buildImageChunk(bytes, "scan.dcm");
    EXPECT_EQ(chunk.metadata["is_dicom"], true);
    EXPECT_EQ(chunk.metadata["medical_type"], "computed_tomography");
    EXPECT_EQ(chunk.metadata["image_info"]["dicom_info"]["modality"], "CT");
    EXPECT_FALSE(extractMedicalContext(chunk.metadata).has_value());
}

TEST_F(DocumentChunkBuilderTest, CorruptImageStillProducesChunk)
{
    std::string text = "not an image at all";
    std::vector<std::uint8_t> bytes(text.begin(), text.end());

    auto chunk = builder_.buildImageChunk(bytes, "broken.jpg");
    EXPECT_EQ(chunk.metadata["medical_type"], "medical_image");
    EXPECT_EQ(chunk.metadata["image_info"]["fallback_analysis"], true);
    EXPECT_FALSE(chunk.content.empty());
}

}  // namespace med_classifier::services::test
