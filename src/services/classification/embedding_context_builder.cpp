#include "services/classification/embedding_context_builder.hpp"

#include <format>
#include <vector>

namespace med_classifier::services {

namespace {

constexpr double kHighRelevance = 0.7;
constexpr double kModerateRelevance = 0.5;

std::string joined(const std::vector<std::string>& parts, std::string_view separator) {
    std::string result;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            result += separator;
        }
        result += parts[i];
    }
    return result;
}

}  // anonymous namespace

std::string EmbeddingContextBuilder::build(const core::ImageAnalysis& analysis) {
    std::vector<std::string> parts;

    if (analysis.isDicom && analysis.dicom) {
        const auto& dicom = *analysis.dicom;
        parts.push_back(std::format("DICOM {} medical image",
                                    dicom.modality.empty() ? "Unknown" : dicom.modality));
        if (!dicom.bodyPartExamined.empty() && dicom.bodyPartExamined != "Unknown") {
            parts.push_back("of " + dicom.bodyPartExamined);
        }
        if (!dicom.studyDescription.empty()) {
            parts.push_back("for " + dicom.studyDescription);
        }
        if (!dicom.seriesDescription.empty()) {
            parts.push_back("series " + dicom.seriesDescription);
        }
    } else {
        parts.push_back(core::toSpacedTag(analysis.medicalType));
        if (analysis.medicalContext && !analysis.medicalContext->filenameIndicators.empty()) {
            parts.push_back("with indicators: "
                            + joined(analysis.medicalContext->filenameIndicators, ", "));
        }
    }

    if (!analysis.fallbackAnalysis) {
        parts.push_back(std::format("resolution {}x{}", analysis.width, analysis.height));
    }

    const double relevance = analysis.medicalContext
        ? analysis.medicalContext->medicalRelevanceScore : 0.0;
    if (relevance > kHighRelevance) {
        parts.emplace_back("high medical relevance");
    } else if (relevance > kModerateRelevance) {
        parts.emplace_back("moderate medical relevance");
    }

    parts.emplace_back("for clinical diagnostic evaluation");
    parts.emplace_back("medical documentation");
    parts.emplace_back("healthcare analysis");

    return joined(parts, " ");
}

std::string EmbeddingContextBuilder::genericContext() {
    return "medical image for clinical diagnostic evaluation and healthcare analysis";
}

}  // namespace med_classifier::services
