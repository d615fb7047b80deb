/**
 * @file document_chunk_builder.hpp
 * @brief Retrieval chunks for uploaded medical images
 * @details An image upload becomes a single chunk: the generated description
 *          is the searchable content and the serialized analysis travels in
 *          the metadata. Raw image bytes are never copied into the metadata.
 *
 * @author kcenon
 * @since 1.0.0
 */
#pragma once

#include "services/classification/medical_image_classifier.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace med_classifier::services {

/**
 * @brief Text content plus JSON metadata, ready for embedding and storage
 */
struct DocumentChunk {
    std::string content;
    nlohmann::json metadata;
};

/**
 * @brief Builds document chunks from image uploads
 *
 * Holds a reference to the classifier, which must outlive the builder.
 */
class DocumentChunkBuilder {
public:
    explicit DocumentChunkBuilder(const MedicalImageClassifier& classifier);

    /**
     * @brief Analyze and describe one image
     *
     * Metadata keys: `source`, `content_type` ("image"), `image_info`
     * (serialized analysis), `medical_context` (true), `is_dicom`,
     * `medical_type`.
     */
    [[nodiscard]] DocumentChunk buildImageChunk(std::span<const std::uint8_t> bytes,
                                                std::string_view fileName) const;

    /// Chunk for an analysis that was already computed
    [[nodiscard]] DocumentChunk buildImageChunk(const core::ImageAnalysis& analysis,
                                                std::string_view fileName) const;

private:
    const MedicalImageClassifier& classifier_;
};

}  // namespace med_classifier::services
