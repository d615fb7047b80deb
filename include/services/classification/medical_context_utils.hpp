/**
 * @file medical_context_utils.hpp
 * @brief Helpers for reading medical context back from analyses and chunk metadata
 * @author kcenon
 * @since 1.0.0
 */
#pragma once

#include "core/medical_image_types.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace med_classifier::services {

namespace context_thresholds {
inline constexpr double kHighRelevance = 0.8;
inline constexpr double kLowPathologicalConfidence = 0.6;
}  // namespace context_thresholds

struct ConfidenceScores {
    double relevance = 0.0;
    double pathologicalConfidence = 0.0;
};

struct FindingTags {
    std::vector<std::string> findings;
    std::vector<std::string> normalIndicators;
};

/**
 * @brief Locate the medical context object in chunk metadata
 *
 * `medical_context` may hold the object itself, or `true` to point at
 * `image_info.medical_context`.
 */
[[nodiscard]] std::optional<nlohmann::json>
extractMedicalContext(const nlohmann::json& metadata);

[[nodiscard]] ConfidenceScores confidenceScores(const core::ImageAnalysis& analysis);

/// Scores from a serialized medical context; missing or mistyped values read as 0
[[nodiscard]] ConfidenceScores confidenceScores(const nlohmann::json& medicalContext);

[[nodiscard]] FindingTags pathologicalFindings(const nlohmann::json& medicalContext);

/**
 * @brief High relevance paired with low pathological confidence
 *
 * False when the analysis carries no medical context.
 */
[[nodiscard]] bool hasConflictingConfidence(
    const core::ImageAnalysis& analysis,
    double relevanceThreshold = context_thresholds::kHighRelevance,
    double confidenceThreshold = context_thresholds::kLowPathologicalConfidence);

/// Same check on chunk metadata
[[nodiscard]] bool hasConflictingConfidence(
    const nlohmann::json& metadata,
    double relevanceThreshold = context_thresholds::kHighRelevance,
    double confidenceThreshold = context_thresholds::kLowPathologicalConfidence);

}  // namespace med_classifier::services
