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
 * @file keyword_prioritizer.hpp
 * @brief Deduplication and ranking of generated medical keywords
 * @details Holds the single priority table and redundancy groups for every
 *          keyword the synthesizer can emit. Ranking runs four passes:
 *          exact-duplicate removal, redundancy-group collapse, substring
 *          pruning and a stable priority sort truncated to the keyword limit.
 *
 * @author kcenon
 * @since 1.0.0
 */
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace med_classifier::services {

/// Priority tiers, higher ranks first
namespace keyword_priority {
inline constexpr int kSpecificClinical = 5;
inline constexpr int kClinicalSignificance = 4;
inline constexpr int kGeneralMedical = 3;
inline constexpr int kTechnicalDescriptor = 2;
inline constexpr int kGenericQualifier = 1;
inline constexpr int kUnranked = 0;

/// "<modality> imaging" keywords built from DICOM Modality
inline constexpr int kModalityImaging = kGeneralMedical;
}  // namespace keyword_priority

class KeywordPrioritizer {
public:
    static constexpr std::size_t kDefaultMaxKeywords = 15;

    explicit KeywordPrioritizer(std::size_t maxKeywords = kDefaultMaxKeywords);

    /**
     * @brief Deduplicate, collapse redundant groups and rank
     *
     * 1. Remove exact duplicates, keeping first occurrences.
     * 2. At the first member of a redundancy group, emit the group's
     *    highest-priority member present (earliest on ties); skip the rest.
     * 3. For any pair where one keyword contains the other, drop the lower
     *    priority member. On equal priority the contained keyword is dropped.
     * 4. Stable sort by priority, descending, and truncate.
     */
    [[nodiscard]] std::vector<std::string>
    prioritize(const std::vector<std::string>& keywords) const;

    /// Table priority; "<X> imaging" falls back to kModalityImaging, anything else to kUnranked
    [[nodiscard]] static int priorityOf(std::string_view keyword);

    /// True when the keyword has an explicit table entry
    [[nodiscard]] static bool hasPriority(std::string_view keyword);

    /// Name of the redundancy group containing the keyword
    [[nodiscard]] static std::optional<std::string_view> groupOf(std::string_view keyword);

    [[nodiscard]] std::size_t maxKeywords() const noexcept { return maxKeywords_; }

private:
    std::size_t maxKeywords_;
};

}  // namespace med_classifier::services
