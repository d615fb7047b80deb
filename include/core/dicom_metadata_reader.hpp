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

/**
 * @file dicom_metadata_reader.hpp
 * @brief Detects DICOM payloads and extracts the structural attributes used for classification
 * @details Parsing is done in memory with GDCM. Pixel data is not decoded:
 *          the modality and descriptive attributes are enough to categorize
 *          a DICOM object.
 *
 * @author kcenon
 * @since 1.0.0
 */
#pragma once

#include "core/medical_image_types.hpp"

#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>

namespace med_classifier::core {

/**
 * @brief Error information for DICOM metadata extraction
 */
struct DicomReadError {
    enum class Code {
        Success,
        NotDicom,
        ParseFailed,
        MissingModality
    };

    Code code = Code::Success;
    std::string message;

    [[nodiscard]] std::string toString() const {
        switch (code) {
            case Code::Success: return "Success";
            case Code::NotDicom: return "Not a DICOM object: " + message;
            case Code::ParseFailed: return "DICOM parse failed: " + message;
            case Code::MissingModality: return "Missing modality: " + message;
        }
        return "Unknown error";
    }
};

/**
 * @brief In-memory DICOM attribute reader
 */
class DicomMetadataReader {
public:
    /// Byte offset of the "DICM" marker after the preamble
    static constexpr std::size_t kMagicOffset = 128;

    /**
     * @brief Cheap pre-check before a full parse
     *
     * True when the extension is .dcm, .dicom, .ima or .img (any case), or
     * when the bytes carry the "DICM" marker at offset 128.
     */
    [[nodiscard]] static bool mightBeDicom(std::span<const std::uint8_t> bytes,
                                           std::string_view fileName);

    /// True when the "DICM" marker is present
    [[nodiscard]] static bool hasDicomMagic(std::span<const std::uint8_t> bytes);

    /**
     * @brief Parse the data set and collect the classification attributes
     * @return DicomInfo, or an error when parsing fails or Modality is empty
     */
    [[nodiscard]] static std::expected<DicomInfo, DicomReadError>
    read(std::span<const std::uint8_t> bytes);

    /**
     * @brief Map a Modality code to an image category
     *
     * Total over all inputs; unknown codes map to MedicalImage.
     */
    [[nodiscard]] static MedicalImageType classifyModality(std::string_view modality);
};

}  // namespace med_classifier::core
