// BSD 3-Clause License
//
// Copyright (c) 2021-2025, 🍀☀🌕🌥 🌊
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are met:
//
// 1. Redistributions of source code must retain the above copyright notice, this
//    list of conditions and the following disclaimer.
//
// 2. Redistributions in binary form must reproduce the above copyright notice,
//    this list of conditions and the following disclaimer in the documentation
//    and/or other materials provided with the distribution.
//
// 3. Neither the name of the copyright holder nor the names of its
//    contributors may be used to endorse or promote products derived from
//    this software without specific prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
// AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
// IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
// DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE
// FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL
// DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR
// SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER
// CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY,
// OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
// OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.

#include "core/analysis_serializer.hpp"

namespace med_classifier::core {

using json = nlohmann::json;

namespace {

json intensityToJson(const IntensityStatistics& s) {
    return {
        {"mean_intensity", s.mean},
        {"std_intensity", s.stdDev},
        {"min_intensity", s.min},
        {"max_intensity", s.max},
        {"intensity_range", s.range},
        {"contrast_ratio", s.contrastRatio},
        {"has_high_contrast", s.hasHighContrast},
        {"has_dark_background", s.hasDarkBackground},
        {"has_bright_regions", s.hasBrightRegions},
        {"intensity_distribution", {
            {"histogram_peaks", s.histogramPeaks},
            {"is_bimodal", s.isBimodal},
            {"background_peak_ratio", s.backgroundPeakRatio},
            {"skewness", s.skewness}
        }}
    };
}

json colorToJson(const ColorStatistics& c) {
    return {
        {"mean_rgb", json::array({c.meanRgb[0], c.meanRgb[1], c.meanRgb[2]})},
        {"color_variance", c.colorVariance},
        {"dominant_channel", c.dominantChannel},
        {"skin_tone_likelihood", c.skinToneLikelihood}
    };
}

json textureToJson(const TextureMetrics& t) {
    return {
        {"edge_density", t.edgeDensity},
        {"texture_complexity", t.textureComplexity},
        {"has_regular_patterns", t.hasRegularPatterns}
    };
}

}  // anonymous namespace

json AnalysisSerializer::toJson(const PathologyFindings& findings) {
    json specific = json::array();
    for (auto finding : findings.specificFindings) {
        specific.push_back(std::string(toTag(finding)));
    }
    json normal = json::array();
    for (auto indicator : findings.normalIndicators) {
        normal.push_back(std::string(toTag(indicator)));
    }

    return {
        {"has_pathological_findings", findings.hasPathologicalFindings},
        {"pathological_confidence", findings.pathologicalConfidence},
        {"specific_findings", specific},
        {"normal_indicators", normal},
        {"clinical_significance", std::string(toTag(findings.clinicalSignificance))}
    };
}

json AnalysisSerializer::toJson(const ImageCharacteristics& characteristics) {
    json j = {
        {"filename_indicators", characteristics.filenameIndicators},
        {"medical_relevance_score", characteristics.medicalRelevanceScore}
    };
    if (characteristics.intensity) {
        j["intensity_stats"] = intensityToJson(*characteristics.intensity);
    }
    if (characteristics.color) {
        j["color_analysis"] = colorToJson(*characteristics.color);
    }
    if (characteristics.texture) {
        j["texture_analysis"] = textureToJson(*characteristics.texture);
    }
    if (characteristics.pathologicalAnalysis) {
        j["pathological_analysis"] = toJson(*characteristics.pathologicalAnalysis);
    }
    return j;
}

json AnalysisSerializer::toJson(const DicomInfo& info) {
    return {
        {"modality", info.modality},
        {"body_part", info.bodyPartExamined},
        {"study_description", info.studyDescription},
        {"series_description", info.seriesDescription},
        {"image_type", info.imageType},
        {"photometric_interpretation", info.photometricInterpretation},
        {"rows", info.rows},
        {"columns", info.columns},
        {"dicom_metadata", {
            {"patient_id", info.patientId},
            {"study_date", info.studyDate},
            {"acquisition_date", info.acquisitionDate},
            {"institution_name", info.institutionName},
            {"manufacturer", info.manufacturer},
            {"manufacturer_model", info.manufacturerModel}
        }}
    };
}

json AnalysisSerializer::toJson(const ImageAnalysis& analysis) {
    json j = {
        {"is_dicom", analysis.isDicom},
        {"medical_type", std::string(toTag(analysis.medicalType))},
        {"width", analysis.width},
        {"height", analysis.height},
        {"is_grayscale", analysis.isGrayscale},
        {"aspect_ratio", analysis.aspectRatio},
        {"mode", analysis.colorMode},
        {"format", analysis.format},
        {"file_size", analysis.fileSizeBytes}
    };

    if (analysis.dicom) {
        j["dicom_info"] = toJson(*analysis.dicom);
    }
    if (analysis.medicalContext) {
        j["medical_context"] = toJson(*analysis.medicalContext);
    }
    if (analysis.analysisError) {
        j["analysis_error"] = *analysis.analysisError;
    }
    if (analysis.fallbackAnalysis) {
        j["fallback_analysis"] = true;
    }
    return j;
}

std::string AnalysisSerializer::dump(const json& value, int indent) {
    return value.dump(indent, ' ', false, json::error_handler_t::replace);
}

}  // namespace med_classifier::core
