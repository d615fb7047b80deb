#pragma once

#include "core/medical_image_types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace med_classifier::services {

/**
 * @brief How a dictionary term is matched against a file name
 *
 * Terms of three characters or fewer ("ct", "us", "eye", ...) match only a
 * whole token or its plural, where tokens are runs of letters or runs of
 * digits. Longer terms match anywhere in the lowercased name.
 */
enum class TermMatch {
    Substring,
    Token
};

struct FilenameTerm {
    std::string_view term;
    TermMatch match;
};

/**
 * @brief Lowercased file name split for term matching
 */
class FilenameTokens {
public:
    explicit FilenameTokens(std::string_view fileName);

    [[nodiscard]] bool contains(const FilenameTerm& term) const;

    [[nodiscard]] const std::string& lowered() const noexcept { return lowered_; }
    [[nodiscard]] const std::vector<std::string>& tokens() const noexcept { return tokens_; }

private:
    std::string lowered_;
    std::vector<std::string> tokens_;
};

/**
 * @brief Medical terms present in the file name, in dictionary order, without repeats
 */
[[nodiscard]] std::vector<std::string> findFilenameIndicators(std::string_view fileName);

/**
 * @brief Category named by the file name, if any
 *
 * The dictionary is scanned in a fixed category order and the first match
 * wins.
 */
[[nodiscard]] std::optional<core::MedicalImageType> filenameTypeOverride(std::string_view fileName);

}  // namespace med_classifier::services
