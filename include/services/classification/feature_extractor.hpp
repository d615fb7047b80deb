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
 * @file feature_extractor.hpp
 * @brief Pixel statistics used by the type classifier and pathology analyzer
 * @details Computes grayscale detection, intensity statistics and histogram
 *          shape, color statistics with skin-tone likelihood, edge density,
 *          local-variance texture complexity and regular-pattern detection.
 *          All values are on a 0-255 scale; zero denominators yield 0.
 *
 * @author kcenon
 * @since 1.0.0
 */
#pragma once

#include "core/classifier_config.hpp"
#include "core/image_decoder.hpp"
#include "core/medical_image_types.hpp"

#include <optional>
#include <vector>

namespace med_classifier::services {

/**
 * @brief Everything measured from the pixels of one image
 */
struct ImageFeatures {
    bool isGrayscale = false;
    std::optional<core::IntensityStatistics> intensity;  ///< Grayscale images only
    std::optional<core::ColorStatistics> color;          ///< Color images only
    core::TextureMetrics texture;
};

/**
 * @brief Stateless pixel feature extractor
 *
 * @example
 * @code
 * FeatureExtractor extractor(config.features);
 * auto planes = core::ChannelPlanes::fromImage(*decoded.image);
 * auto features = extractor.extract(planes, decoded.isNativeGrayscale());
 * @endcode
 */
class FeatureExtractor {
public:
    /// @throws std::invalid_argument when the parameters fail validation
    explicit FeatureExtractor(core::FeatureParameters parameters = {});

    /**
     * @brief Run every feature computation
     * @param planes Decoded pixel planes
     * @param nativeGrayscale True when the source had one channel (plus optional alpha)
     */
    [[nodiscard]] ImageFeatures extract(const core::ChannelPlanes& planes,
                                        bool nativeGrayscale) const;

    /**
     * @brief Grayscale when single-channel natively, or when the mean
     *        absolute difference between every channel pair is below tolerance
     */
    [[nodiscard]] bool isGrayscale(const core::ChannelPlanes& planes,
                                   bool nativeGrayscale) const;

    [[nodiscard]] core::IntensityStatistics
    computeIntensityStatistics(const std::vector<float>& values) const;

    [[nodiscard]] core::ColorStatistics
    computeColorStatistics(const core::ChannelPlanes& planes) const;

    /// Fraction of pixels inside any configured skin band, scaled and clamped to 1
    [[nodiscard]] double skinToneLikelihood(const core::ChannelPlanes& planes) const;

    /**
     * @brief Fraction of horizontal and vertical neighbor differences above
     *        half the gray standard deviation
     */
    [[nodiscard]] static double edgeDensity(const std::vector<float>& gray,
                                            int width, int height);

    /**
     * @brief Variance of 5x5 local variances over their mean
     *
     * Evaluated on a stride-downsampled copy bounded by maxTextureDimension.
     */
    [[nodiscard]] double textureComplexity(const std::vector<float>& gray,
                                           int width, int height) const;

    /// Near-constant row or column means over the centered crop
    [[nodiscard]] bool hasRegularPatterns(const std::vector<float>& gray,
                                          int width, int height) const;

    [[nodiscard]] const core::FeatureParameters& parameters() const noexcept {
        return parameters_;
    }

private:
    core::FeatureParameters parameters_;
};

/// Population mean and standard deviation; {0, 0} for empty input
struct MeanStd {
    double mean = 0.0;
    double stdDev = 0.0;
};

[[nodiscard]] MeanStd computeMeanStd(const std::vector<float>& values);

}  // namespace med_classifier::services
