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

#include "services/classification/keyword_prioritizer.hpp"

#include <algorithm>
#include <array>
#include <unordered_map>
#include <unordered_set>

namespace med_classifier::services {

namespace {

using namespace keyword_priority;

const std::unordered_map<std::string_view, int>& priorityTable() {
    static const std::unordered_map<std::string_view, int> table = {
        // Specific clinical and modality terms
        {"dermatology", kSpecificClinical},
        {"radiology", kSpecificClinical},
        {"pathology", kSpecificClinical},
        {"ophthalmology", kSpecificClinical},
        {"histology", kSpecificClinical},
        {"microscopy", kSpecificClinical},
        {"sonography", kSpecificClinical},
        {"gastroenterology", kSpecificClinical},
        {"laboratory", kSpecificClinical},
        {"skin lesion", kSpecificClinical},
        {"chest imaging", kSpecificClinical},
        {"diagnostic imaging", kSpecificClinical},
        {"thoracic imaging", kSpecificClinical},
        {"pulmonary imaging", kSpecificClinical},
        {"cardiac imaging", kSpecificClinical},
        {"respiratory system", kSpecificClinical},
        {"cross-sectional imaging", kSpecificClinical},
        {"CT imaging", kSpecificClinical},
        {"soft tissue imaging", kSpecificClinical},
        {"MRI imaging", kSpecificClinical},
        {"diagnostic ultrasound", kSpecificClinical},
        {"breast imaging", kSpecificClinical},
        {"retinal imaging", kSpecificClinical},
        {"eye examination", kSpecificClinical},
        {"tissue analysis", kSpecificClinical},
        {"endoscopic imaging", kSpecificClinical},
        {"internal examination", kSpecificClinical},
        {"clinical chemistry", kSpecificClinical},
        {"diagnostic testing", kSpecificClinical},
        {"dermatological condition", kSpecificClinical},
        {"dermatological finding", kSpecificClinical},

        // Clinical significance and finding phrases
        {"clinical assessment", kClinicalSignificance},
        {"medical review", kClinicalSignificance},
        {"professional assessment", kClinicalSignificance},
        {"skin documentation", kClinicalSignificance},
        {"medical monitoring", kClinicalSignificance},
        {"pigmentation changes", kClinicalSignificance},
        {"color irregularity", kClinicalSignificance},
        {"health screening", kClinicalSignificance},
        {"preventive care", kClinicalSignificance},
        {"hyperpigmentation", kClinicalSignificance},
        {"dark spots", kClinicalSignificance},
        {"hypopigmentation", kClinicalSignificance},
        {"light spots", kClinicalSignificance},
        {"redness", kClinicalSignificance},
        {"skin irritation", kClinicalSignificance},
        {"lesion borders", kClinicalSignificance},
        {"skin texture changes", kClinicalSignificance},
        {"surface irregularity", kClinicalSignificance},
        {"skin tone changes", kClinicalSignificance},
        {"skin condition monitoring", kClinicalSignificance},
        {"complex imaging", kClinicalSignificance},
        {"detailed examination", kClinicalSignificance},
        {"radiological assessment", kClinicalSignificance},
        {"clinical variation", kClinicalSignificance},
        {"visual changes", kClinicalSignificance},
        {"medical observation", kClinicalSignificance},
        {"follow-up care", kClinicalSignificance},
        {"clinical follow-up", kClinicalSignificance},
        {"clinical evaluation", kClinicalSignificance},
        {"diagnostic analysis", kClinicalSignificance},
        {"pathological assessment", kClinicalSignificance},
        {"vision assessment", kClinicalSignificance},
        {"preventive screening", kClinicalSignificance},
        {"women's health", kClinicalSignificance},

        // General medical terms
        {"medical imaging", kGeneralMedical},
        {"clinical documentation", kGeneralMedical},
        {"skin imaging", kGeneralMedical},
        {"screening examination", kGeneralMedical},
        {"medical photography", kGeneralMedical},
        {"clinical photography", kGeneralMedical},
        {"medical record", kGeneralMedical},
        {"patient information", kGeneralMedical},
        {"real-time imaging", kGeneralMedical},
        {"skin health", kGeneralMedical},
        {"routine dermatology", kGeneralMedical},
        {"medical documentation", kGeneralMedical},
        {"DICOM", kGeneralMedical},
        {"medical imaging standard", kGeneralMedical},
        {"digital imaging", kGeneralMedical},
        {"natural skin appearance", kGeneralMedical},
        {"baseline skin documentation", kGeneralMedical},
        {"consistent skin appearance", kGeneralMedical},
        {"normal pigmentation", kGeneralMedical},
        {"normal skin texture", kGeneralMedical},
        {"natural skin surface", kGeneralMedical},
        {"clear skin appearance", kGeneralMedical},
        {"no visible abnormalities", kGeneralMedical},
        {"clinical imaging", kGeneralMedical},

        // Technical descriptors
        {"high resolution", kTechnicalDescriptor},
        {"grayscale imaging", kTechnicalDescriptor},
        {"color imaging", kTechnicalDescriptor},
        {"routine care", kTechnicalDescriptor},
        {"documentation", kTechnicalDescriptor},
        {"routine imaging", kTechnicalDescriptor},
        {"standard imaging", kTechnicalDescriptor},
        {"routine examination", kTechnicalDescriptor},
        {"routine documentation", kTechnicalDescriptor},
        {"imaging quality", kTechnicalDescriptor},
        {"baseline documentation", kTechnicalDescriptor},

        // Generic qualifiers
        {"routine", kGenericQualifier},
        {"standard", kGenericQualifier},
        {"normal", kGenericQualifier},
        {"baseline", kGenericQualifier},
        {"healthy", kGenericQualifier},
        {"resolution", kGenericQualifier}
    };
    return table;
}

struct RedundancyGroup {
    std::string_view name;
    std::vector<std::string_view> members;
};

const std::array<RedundancyGroup, 7>& redundancyGroups() {
    static const std::array<RedundancyGroup, 7> groups = {{
        {"resolution", {"high resolution", "resolution", "imaging quality"}},
        {"routine_terms", {"routine", "routine care", "routine examination", "routine imaging",
                           "standard imaging", "baseline documentation"}},
        {"imaging_type", {"grayscale imaging", "color imaging", "medical imaging",
                          "clinical imaging"}},
        {"documentation", {"documentation", "clinical documentation", "medical documentation"}},
        {"skin_health", {"skin health", "skin documentation", "skin imaging"}},
        {"normal_terms", {"normal", "healthy", "baseline", "standard"}},
        {"examination_type", {"screening examination", "routine examination", "health screening",
                              "preventive care"}}
    }};
    return groups;
}

const RedundancyGroup* findGroup(std::string_view keyword) {
    for (const auto& group : redundancyGroups()) {
        if (std::find(group.members.begin(), group.members.end(), keyword)
            != group.members.end()) {
            return &group;
        }
    }
    return nullptr;
}

constexpr std::string_view kImagingSuffix = " imaging";

}  // anonymous namespace

KeywordPrioritizer::KeywordPrioritizer(std::size_t maxKeywords)
    : maxKeywords_(maxKeywords) {}

int KeywordPrioritizer::priorityOf(std::string_view keyword) {
    const auto& table = priorityTable();
    if (auto it = table.find(keyword); it != table.end()) {
        return it->second;
    }
    if (keyword.size() > kImagingSuffix.size() && keyword.ends_with(kImagingSuffix)) {
        return kModalityImaging;
    }
    return kUnranked;
}

bool KeywordPrioritizer::hasPriority(std::string_view keyword) {
    return priorityTable().contains(keyword);
}

std::optional<std::string_view> KeywordPrioritizer::groupOf(std::string_view keyword) {
    if (const auto* group = findGroup(keyword)) {
        return group->name;
    }
    return std::nullopt;
}

std::vector<std::string>
KeywordPrioritizer::prioritize(const std::vector<std::string>& keywords) const {
    // 1. Exact duplicates
    std::vector<std::string> unique;
    std::unordered_set<std::string> seen;
    for (const auto& keyword : keywords) {
        if (seen.insert(keyword).second) {
            unique.push_back(keyword);
        }
    }

    // 2. Redundancy groups
    std::vector<std::string> collapsed;
    std::unordered_set<std::string_view> usedGroups;
    for (const auto& keyword : unique) {
        const auto* group = findGroup(keyword);
        if (group == nullptr) {
            collapsed.push_back(keyword);
            continue;
        }
        if (usedGroups.contains(group->name)) {
            continue;
        }

        const std::string* best = nullptr;
        for (const auto& candidate : unique) {
            if (findGroup(candidate) != group) {
                continue;
            }
            if (best == nullptr || priorityOf(candidate) > priorityOf(*best)) {
                best = &candidate;
            }
        }
        collapsed.push_back(*best);
        usedGroups.insert(group->name);
    }

    // 3. Substring pairs keep only the higher priority member; ties keep the longer one
    std::vector<std::string> filtered;
    for (const auto& keyword : collapsed) {
        const int priority = priorityOf(keyword);
        const bool redundant = std::any_of(
            collapsed.begin(), collapsed.end(), [&](const std::string& other) {
                if (other == keyword) {
                    return false;
                }
                if (other.find(keyword) != std::string::npos) {
                    return priority <= priorityOf(other);
                }
                if (keyword.find(other) != std::string::npos) {
                    return priority < priorityOf(other);
                }
                return false;
            });
        if (!redundant) {
            filtered.push_back(keyword);
        }
    }

    // 4. Rank and truncate
    std::stable_sort(filtered.begin(), filtered.end(),
                     [](const std::string& a, const std::string& b) {
                         return priorityOf(a) > priorityOf(b);
                     });
    if (filtered.size() > maxKeywords_) {
        filtered.resize(maxKeywords_);
    }
    return filtered;
}

}  // namespace med_classifier::services
