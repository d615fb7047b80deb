#include "services/classification/document_chunk_builder.hpp"

#include "core/analysis_serializer.hpp"
#include "core/logging.hpp"

namespace med_classifier::services {

namespace {

auto& getLogger() {
    static auto logger = logging::LoggerFactory::create("DocumentChunkBuilder");
    return logger;
}

}  // anonymous namespace

DocumentChunkBuilder::DocumentChunkBuilder(const MedicalImageClassifier& classifier)
    : classifier_(classifier) {}

DocumentChunk DocumentChunkBuilder::buildImageChunk(std::span<const std::uint8_t> bytes,
                                                    std::string_view fileName) const {
    auto analysis = classifier_.analyzeMedicalImage(bytes, fileName);
    return buildImageChunk(analysis, fileName);
}

DocumentChunk DocumentChunkBuilder::buildImageChunk(const core::ImageAnalysis& analysis,
                                                    std::string_view fileName) const {
    DocumentChunk chunk;
    chunk.content = classifier_.createMedicalDescription(fileName, analysis);
    chunk.metadata = {
        {"source", std::string(fileName)},
        {"content_type", "image"},
        {"image_info", core::AnalysisSerializer::toJson(analysis)},
        {"medical_context", true},
        {"is_dicom", analysis.isDicom},
        {"medical_type", std::string(core::toTag(analysis.medicalType))}
    };

    getLogger()->debug("Built image chunk for {} ({} characters)",
                       fileName, chunk.content.size());
    return chunk;
}

}  // namespace med_classifier::services
