#include "services/classification/medical_context_utils.hpp"

#include "core/logging.hpp"

namespace med_classifier::services {

namespace {

auto& getLogger() {
    static auto logger = logging::LoggerFactory::create("MedicalContextUtils");
    return logger;
}

double numberOr(const nlohmann::json& object, const char* key, double fallback) {
    auto it = object.find(key);
    if (it == object.end() || !it->is_number()) {
        return fallback;
    }
    return it->get<double>();
}

std::vector<std::string> tagList(const nlohmann::json& object, const char* key) {
    std::vector<std::string> tags;
    auto it = object.find(key);
    if (it == object.end()) {
        return tags;
    }
    if (it->is_array()) {
        for (const auto& item : *it) {
            if (item.is_string()) {
                tags.push_back(item.get<std::string>());
            }
        }
    } else if (it->is_string() && !it->get_ref<const std::string&>().empty()) {
        tags.push_back(it->get<std::string>());
    }
    return tags;
}

bool isConflicting(const ConfidenceScores& scores,
                   double relevanceThreshold, double confidenceThreshold) {
    return scores.relevance >= relevanceThreshold
        && scores.pathologicalConfidence < confidenceThreshold;
}

}  // anonymous namespace

std::optional<nlohmann::json> extractMedicalContext(const nlohmann::json& metadata) {
    if (!metadata.is_object()) {
        return std::nullopt;
    }
    auto it = metadata.find("medical_context");
    if (it == metadata.end()) {
        return std::nullopt;
    }

    if (it->is_boolean() && it->get<bool>()) {
        auto info = metadata.find("image_info");
        if (info == metadata.end() || !info->is_object()) {
            return std::nullopt;
        }
        auto nested = info->find("medical_context");
        if (nested != info->end() && nested->is_object() && !nested->empty()) {
            return *nested;
        }
        return std::nullopt;
    }

    if (it->is_object() && !it->empty()) {
        return *it;
    }
    return std::nullopt;
}

ConfidenceScores confidenceScores(const core::ImageAnalysis& analysis) {
    ConfidenceScores scores;
    if (!analysis.medicalContext) {
        return scores;
    }
    scores.relevance = analysis.medicalContext->medicalRelevanceScore;
    if (analysis.medicalContext->pathologicalAnalysis) {
        scores.pathologicalConfidence =
            analysis.medicalContext->pathologicalAnalysis->pathologicalConfidence;
    }
    return scores;
}

ConfidenceScores confidenceScores(const nlohmann::json& medicalContext) {
    ConfidenceScores scores;
    if (!medicalContext.is_object()) {
        getLogger()->warn("Medical context is not an object, using zero confidence");
        return scores;
    }
    scores.relevance = numberOr(medicalContext, "medical_relevance_score", 0.0);
    auto pathology = medicalContext.find("pathological_analysis");
    if (pathology != medicalContext.end() && pathology->is_object()) {
        scores.pathologicalConfidence = numberOr(*pathology, "pathological_confidence", 0.0);
    }
    return scores;
}

FindingTags pathologicalFindings(const nlohmann::json& medicalContext) {
    FindingTags tags;
    if (!medicalContext.is_object()) {
        return tags;
    }
    auto pathology = medicalContext.find("pathological_analysis");
    if (pathology == medicalContext.end() || !pathology->is_object()) {
        return tags;
    }
    tags.findings = tagList(*pathology, "specific_findings");
    tags.normalIndicators = tagList(*pathology, "normal_indicators");
    return tags;
}

bool hasConflictingConfidence(const core::ImageAnalysis& analysis,
                              double relevanceThreshold, double confidenceThreshold) {
    if (!analysis.medicalContext) {
        return false;
    }
    return isConflicting(confidenceScores(analysis), relevanceThreshold, confidenceThreshold);
}

bool hasConflictingConfidence(const nlohmann::json& metadata,
                              double relevanceThreshold, double confidenceThreshold) {
    auto context = extractMedicalContext(metadata);
    if (!context) {
        return false;
    }
    return isConflicting(confidenceScores(*context), relevanceThreshold, confidenceThreshold);
}

}  // namespace med_classifier::services
