#include "services/classification/filename_terms.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <vector>

namespace med_classifier::services {

namespace {

using core::MedicalImageType;

constexpr auto S = TermMatch::Substring;
constexpr auto T = TermMatch::Token;

struct CategoryTerms {
    MedicalImageType type;
    std::vector<FilenameTerm> terms;
};

const std::array<CategoryTerms, 11>& categoryDictionary() {
    static const std::array<CategoryTerms, 11> dictionary = {{
        {MedicalImageType::ChestXray, {{"xray", S}, {"x-ray", S}, {"chest", S}, {"cxr", T}}},
        {MedicalImageType::ComputedTomography, {{"ct", T}, {"computed_tomography", S}}},
        {MedicalImageType::MagneticResonance, {{"mri", T}, {"magnetic_resonance", S}}},
        {MedicalImageType::Ultrasound, {{"ultrasound", S}, {"us", T}, {"echo", S}}},
        {MedicalImageType::Mammography, {{"mammo", S}, {"mammography", S}}},
        {MedicalImageType::DermatologicalImage,
         {{"dermato", S}, {"skin", S}, {"dermatology", S}, {"rash", S}, {"lesion", S}}},
        {MedicalImageType::RetinalImage,
         {{"retina", S}, {"fundus", S}, {"ophthalmology", S}, {"eye", T}}},
        {MedicalImageType::PathologicalImage,
         {{"pathology", S}, {"histology", S}, {"microscopy", S}, {"biopsy", S}}},
        {MedicalImageType::Endoscopy, {{"endoscopy", S}, {"endoscopic", S}, {"colonoscopy", S}}},
        {MedicalImageType::LabResultDocument,
         {{"lab", T}, {"blood", S}, {"test", S}, {"result", S}}},
        {MedicalImageType::MedicalDocument, {{"report", S}, {"discharge", S}, {"summary", S}}}
    }};
    return dictionary;
}

constexpr std::array<FilenameTerm, 19> kIndicatorTerms = {{
    {"xray", S}, {"x-ray", S}, {"chest", S}, {"cxr", T}, {"ct", T},
    {"mri", T}, {"ultrasound", S}, {"us", T}, {"mammo", S}, {"mammography", S},
    {"endoscopy", S}, {"dermato", S}, {"retina", S}, {"fundus", S},
    {"pathology", S}, {"histology", S}, {"microscopy", S}, {"radiograph", S},
    {"scan", S}
}};

}  // anonymous namespace

FilenameTokens::FilenameTokens(std::string_view fileName) : lowered_(fileName) {
    std::transform(lowered_.begin(), lowered_.end(), lowered_.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    std::string current;
    auto flush = [&]() {
        if (!current.empty()) {
            tokens_.push_back(current);
            current.clear();
        }
    };
    for (unsigned char c : lowered_) {
        const bool alpha = std::isalpha(c) != 0;
        const bool digit = std::isdigit(c) != 0;
        if (!alpha && !digit) {
            flush();
            continue;
        }
        if (!current.empty()) {
            const bool previousDigit = std::isdigit(static_cast<unsigned char>(current.back())) != 0;
            if (previousDigit != digit) {
                flush();
            }
        }
        current.push_back(static_cast<char>(c));
    }
    flush();
}

bool FilenameTokens::contains(const FilenameTerm& term) const {
    if (term.match == TermMatch::Substring) {
        return lowered_.find(term.term) != std::string::npos;
    }
    return std::any_of(tokens_.begin(), tokens_.end(), [&term](const std::string& token) {
        if (token == term.term) {
            return true;
        }
        // Plural form: "eyes", "labs"
        return token.size() == term.term.size() + 1 && token.back() == 's' &&
               token.compare(0, term.term.size(), term.term) == 0;
    });
}

std::vector<std::string> findFilenameIndicators(std::string_view fileName) {
    FilenameTokens tokens(fileName);
    std::vector<std::string> indicators;
    for (const auto& term : kIndicatorTerms) {
        if (tokens.contains(term)) {
            indicators.emplace_back(term.term);
        }
    }
    return indicators;
}

std::optional<core::MedicalImageType> filenameTypeOverride(std::string_view fileName) {
    FilenameTokens tokens(fileName);
    for (const auto& category : categoryDictionary()) {
        for (const auto& term : category.terms) {
            if (tokens.contains(term)) {
                return category.type;
            }
        }
    }
    return std::nullopt;
}

}  // namespace med_classifier::services
