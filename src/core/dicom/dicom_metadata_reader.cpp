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

#include "core/dicom_metadata_reader.hpp"

#include "core/logging.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <sstream>
#include <utility>

#include <gdcmAttribute.h>
#include <gdcmDataSet.h>
#include <gdcmReader.h>
#include <gdcmTag.h>

namespace med_classifier::core {

namespace {

auto& getLogger() {
    static auto logger = logging::LoggerFactory::create("DicomMetadataReader");
    return logger;
}

// DICOM tags
const gdcm::Tag kModality(0x0008, 0x0060);
const gdcm::Tag kBodyPartExamined(0x0018, 0x0015);
const gdcm::Tag kStudyDescription(0x0008, 0x1030);
const gdcm::Tag kSeriesDescription(0x0008, 0x103E);
const gdcm::Tag kImageType(0x0008, 0x0008);
const gdcm::Tag kPhotometricInterpretation(0x0028, 0x0004);
const gdcm::Tag kPatientID(0x0010, 0x0020);
const gdcm::Tag kStudyDate(0x0008, 0x0020);
const gdcm::Tag kAcquisitionDate(0x0008, 0x0022);
const gdcm::Tag kInstitutionName(0x0008, 0x0080);
const gdcm::Tag kManufacturer(0x0008, 0x0070);
const gdcm::Tag kManufacturerModelName(0x0008, 0x1090);

constexpr std::array<std::string_view, 4> kDicomExtensions = {
    ".dcm", ".dicom", ".ima", ".img"
};

constexpr std::array<std::pair<std::string_view, MedicalImageType>, 21> kModalityTable = {{
    {"CR", MedicalImageType::MedicalRadiograph},
    {"DX", MedicalImageType::MedicalRadiograph},
    {"IO", MedicalImageType::MedicalRadiograph},
    {"PX", MedicalImageType::MedicalRadiograph},
    {"CT", MedicalImageType::ComputedTomography},
    {"MR", MedicalImageType::MagneticResonance},
    {"US", MedicalImageType::Ultrasound},
    {"IVUS", MedicalImageType::Ultrasound},
    {"MG", MedicalImageType::Mammography},
    {"XA", MedicalImageType::RadiologicalScan},
    {"RF", MedicalImageType::RadiologicalScan},
    {"NM", MedicalImageType::RadiologicalScan},
    {"PT", MedicalImageType::RadiologicalScan},
    {"ES", MedicalImageType::Endoscopy},
    {"OP", MedicalImageType::RetinalImage},
    {"OPM", MedicalImageType::RetinalImage},
    {"OPT", MedicalImageType::RetinalImage},
    {"GM", MedicalImageType::PathologicalImage},
    {"SM", MedicalImageType::PathologicalImage},
    {"XC", MedicalImageType::ClinicalPhotograph},
    {"DOC", MedicalImageType::MedicalDocument}
}};

std::string getStringValue(const gdcm::DataSet& ds, const gdcm::Tag& tag) {
    if (!ds.FindDataElement(tag)) {
        return "";
    }
    const auto& de = ds.GetDataElement(tag);
    if (de.IsEmpty() || de.GetByteValue() == nullptr) {
        return "";
    }
    std::string value(de.GetByteValue()->GetPointer(),
                      de.GetByteValue()->GetLength());
    while (!value.empty() && (value.back() == ' ' || value.back() == '\0')) {
        value.pop_back();
    }
    while (!value.empty() && value.front() == ' ') {
        value.erase(value.begin());
    }
    return value;
}

/// US attribute value; gdcm::Attribute resolves the VR and byte order
template <std::uint16_t Group, std::uint16_t Element>
int getUnsignedShortValue(const gdcm::DataSet& ds) {
    gdcm::Attribute<Group, Element> attribute;
    const gdcm::Tag tag = attribute.GetTag();
    if (!ds.FindDataElement(tag)) {
        return 0;
    }
    const auto* bv = ds.GetDataElement(tag).GetByteValue();
    if (bv == nullptr || bv->GetLength() < 2) {
        return 0;
    }
    attribute.SetFromDataSet(ds);
    return static_cast<int>(attribute.GetValue());
}

std::vector<std::string> splitMultiValue(const std::string& value) {
    std::vector<std::string> parts;
    std::stringstream stream(value);
    std::string part;
    while (std::getline(stream, part, '\\')) {
        while (!part.empty() && part.back() == ' ') {
            part.pop_back();
        }
        if (!part.empty()) {
            parts.push_back(part);
        }
    }
    return parts;
}

}  // anonymous namespace

bool DicomMetadataReader::hasDicomMagic(std::span<const std::uint8_t> bytes) {
    if (bytes.size() <= kMagicOffset + 4) {
        return false;
    }
    return bytes[kMagicOffset] == 'D' && bytes[kMagicOffset + 1] == 'I'
        && bytes[kMagicOffset + 2] == 'C' && bytes[kMagicOffset + 3] == 'M';
}

bool DicomMetadataReader::mightBeDicom(std::span<const std::uint8_t> bytes,
                                       std::string_view fileName) {
    std::string extension = std::filesystem::path(fileName).extension().string();
    std::transform(extension.begin(), extension.end(), extension.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (std::find(kDicomExtensions.begin(), kDicomExtensions.end(), extension)
        != kDicomExtensions.end()) {
        return true;
    }
    return hasDicomMagic(bytes);
}

std::expected<DicomInfo, DicomReadError>
DicomMetadataReader::read(std::span<const std::uint8_t> bytes) {
    if (bytes.empty()) {
        return std::unexpected(DicomReadError{
            DicomReadError::Code::NotDicom, "empty input"
        });
    }

    std::istringstream stream(std::string(
        reinterpret_cast<const char*>(bytes.data()), bytes.size()));

    gdcm::Reader reader;
    reader.SetStream(stream);
    if (!reader.Read()) {
        getLogger()->debug("GDCM could not parse {} bytes as DICOM", bytes.size());
        return std::unexpected(DicomReadError{
            DicomReadError::Code::ParseFailed,
            "GDCM reader rejected the stream"
        });
    }

    const gdcm::DataSet& ds = reader.GetFile().GetDataSet();

    DicomInfo info;
    info.modality = getStringValue(ds, kModality);
    if (info.modality.empty()) {
        return std::unexpected(DicomReadError{
            DicomReadError::Code::MissingModality,
            "Modality (0008,0060) is empty"
        });
    }

    info.bodyPartExamined = getStringValue(ds, kBodyPartExamined);
    info.studyDescription = getStringValue(ds, kStudyDescription);
    info.seriesDescription = getStringValue(ds, kSeriesDescription);
    info.imageType = splitMultiValue(getStringValue(ds, kImageType));
    info.photometricInterpretation = getStringValue(ds, kPhotometricInterpretation);
    info.rows = getUnsignedShortValue<0x0028, 0x0010>(ds);
    info.columns = getUnsignedShortValue<0x0028, 0x0011>(ds);

    info.patientId = getStringValue(ds, kPatientID);
    info.studyDate = getStringValue(ds, kStudyDate);
    info.acquisitionDate = getStringValue(ds, kAcquisitionDate);
    info.institutionName = getStringValue(ds, kInstitutionName);
    info.manufacturer = getStringValue(ds, kManufacturer);
    info.manufacturerModel = getStringValue(ds, kManufacturerModelName);

    getLogger()->debug("DICOM modality={} body part='{}' {}x{}",
                       info.modality, info.bodyPartExamined, info.columns, info.rows);
    return info;
}

MedicalImageType DicomMetadataReader::classifyModality(std::string_view modality) {
    std::string code(modality);
    std::transform(code.begin(), code.end(), code.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    for (const auto& [key, type] : kModalityTable) {
        if (key == code) {
            return type;
        }
    }
    return MedicalImageType::MedicalImage;
}

}  // namespace med_classifier::core
