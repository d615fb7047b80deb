/**
 * @file embedding_context_builder.hpp
 * @brief Context sentence for multimodal embedding of analyzed images
 * @author kcenon
 * @since 1.0.0
 */
#pragma once

#include "core/medical_image_types.hpp"

#include <string>

namespace med_classifier::services {

/**
 * @brief Builds the text that accompanies an image into the embedding model
 *
 * DICOM analyses are described by modality, body part, study and series;
 * pixel analyses by category and filename indicators. Dimensions and the
 * relevance tier follow, then a fixed clinical suffix.
 */
class EmbeddingContextBuilder {
public:
    [[nodiscard]] static std::string build(const core::ImageAnalysis& analysis);

    /// Context used when no analysis is available
    [[nodiscard]] static std::string genericContext();
};

}  // namespace med_classifier::services
