#pragma once

#include "core/medical_image_types.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace med_classifier::core {

/**
 * @brief JSON rendering of classification results
 *
 * Keys are snake_case and values keep their native JSON types so that the
 * document pipeline can store them as chunk metadata unchanged.
 */
class AnalysisSerializer {
public:
    [[nodiscard]] static nlohmann::json toJson(const ImageAnalysis& analysis);
    [[nodiscard]] static nlohmann::json toJson(const PathologyFindings& findings);
    [[nodiscard]] static nlohmann::json toJson(const ImageCharacteristics& characteristics);
    [[nodiscard]] static nlohmann::json toJson(const DicomInfo& info);

    /**
     * @brief Serialize to text without throwing on invalid UTF-8
     *
     * DICOM text in a legacy character set (ISO_IR 100 and friends) and
     * non-UTF-8 file names reach the JSON as raw bytes; those are written
     * as U+FFFD.
     */
    [[nodiscard]] static std::string dump(const nlohmann::json& json, int indent = -1);
};

}  // namespace med_classifier::core
