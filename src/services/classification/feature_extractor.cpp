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

#include "services/classification/feature_extractor.hpp"

#include "core/logging.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <stdexcept>

namespace med_classifier::services {

namespace {

auto& getLogger() {
    static auto logger = logging::LoggerFactory::create("FeatureExtractor");
    return logger;
}

constexpr double kEpsilon = 1e-6;

/// Mirror index without repeating the edge sample (n = 1 maps to 0)
int reflectIndex(int i, int n) {
    if (n == 1) {
        return 0;
    }
    const int period = 2 * (n - 1);
    i = std::abs(i) % period;
    return i < n ? i : period - i;
}

double median(std::vector<float> values) {
    if (values.empty()) {
        return 0.0;
    }
    const auto mid = values.size() / 2;
    std::nth_element(values.begin(), values.begin() + mid, values.end());
    double upper = values[mid];
    if (values.size() % 2 == 1) {
        return upper;
    }
    double lower = *std::max_element(values.begin(), values.begin() + mid);
    return (lower + upper) / 2.0;
}

double coefficientOfVariation(const std::vector<float>& values) {
    auto stats = computeMeanStd(values);
    return stats.stdDev / (stats.mean + kEpsilon);
}

}  // anonymous namespace

MeanStd computeMeanStd(const std::vector<float>& values) {
    if (values.empty()) {
        return {};
    }
    double sum = 0.0;
    for (float v : values) {
        sum += v;
    }
    const double mean = sum / static_cast<double>(values.size());

    double squared = 0.0;
    for (float v : values) {
        const double d = v - mean;
        squared += d * d;
    }
    return {mean, std::sqrt(squared / static_cast<double>(values.size()))};
}

FeatureExtractor::FeatureExtractor(core::FeatureParameters parameters)
    : parameters_(parameters) {
    if (!parameters_.isValid()) {
        throw std::invalid_argument("FeatureExtractor: feature parameters out of range");
    }
}

ImageFeatures FeatureExtractor::extract(const core::ChannelPlanes& planes,
                                        bool nativeGrayscale) const {
    ImageFeatures features;
    features.isGrayscale = isGrayscale(planes, nativeGrayscale);

    if (features.isGrayscale) {
        features.intensity = computeIntensityStatistics(planes.red);
    } else {
        features.color = computeColorStatistics(planes);
    }

    auto gray = planes.gray();
    features.texture.edgeDensity = edgeDensity(gray, planes.width, planes.height);
    features.texture.textureComplexity = textureComplexity(gray, planes.width, planes.height);
    features.texture.hasRegularPatterns = hasRegularPatterns(gray, planes.width, planes.height);

    getLogger()->debug("Features {}x{}: grayscale={} edge={:.4f} texture={:.4f} regular={}",
                       planes.width, planes.height, features.isGrayscale,
                       features.texture.edgeDensity, features.texture.textureComplexity,
                       features.texture.hasRegularPatterns);
    return features;
}

bool FeatureExtractor::isGrayscale(const core::ChannelPlanes& planes,
                                   bool nativeGrayscale) const {
    if (nativeGrayscale) {
        return true;
    }
    const auto count = planes.pixelCount();
    if (count == 0) {
        return false;
    }

    double rg = 0.0;
    double rb = 0.0;
    double gb = 0.0;
    for (std::size_t i = 0; i < count; ++i) {
        rg += std::abs(planes.red[i] - planes.green[i]);
        rb += std::abs(planes.red[i] - planes.blue[i]);
        gb += std::abs(planes.green[i] - planes.blue[i]);
    }
    const double n = static_cast<double>(count);
    const double maxDifference = std::max({rg / n, rb / n, gb / n});
    return maxDifference < parameters_.grayscaleChannelTolerance;
}

core::IntensityStatistics
FeatureExtractor::computeIntensityStatistics(const std::vector<float>& values) const {
    core::IntensityStatistics stats;
    if (values.empty()) {
        return stats;
    }

    auto [minIt, maxIt] = std::minmax_element(values.begin(), values.end());
    auto meanStd = computeMeanStd(values);

    stats.mean = meanStd.mean;
    stats.stdDev = meanStd.stdDev;
    stats.min = *minIt;
    stats.max = *maxIt;
    stats.range = stats.max - stats.min;
    stats.contrastRatio = stats.mean > 0.0 ? stats.stdDev / stats.mean : 0.0;
    stats.hasHighContrast = stats.contrastRatio > parameters_.highContrastRatio;
    stats.hasDarkBackground = stats.mean < parameters_.darkBackgroundMean;
    stats.hasBrightRegions = stats.max > parameters_.brightRegionMax;

    // Normalized histogram over [0, 255]; 255 falls into the last bin
    const int bins = parameters_.histogramBins;
    const double binWidth = 255.0 / bins;
    std::vector<double> histogram(static_cast<std::size_t>(bins), 0.0);
    for (float v : values) {
        int bin = static_cast<int>(std::clamp(v, 0.0f, 255.0f) / binWidth);
        bin = std::min(bin, bins - 1);
        histogram[static_cast<std::size_t>(bin)] += 1.0;
    }
    for (auto& h : histogram) {
        h /= static_cast<double>(values.size());
    }

    for (int i = 1; i < bins - 1; ++i) {
        const auto h = histogram[static_cast<std::size_t>(i)];
        if (h > histogram[static_cast<std::size_t>(i - 1)]
            && h > histogram[static_cast<std::size_t>(i + 1)]
            && h > parameters_.histogramPeakMinimum) {
            stats.histogramPeaks.push_back(i);
        }
    }
    stats.isBimodal = stats.histogramPeaks.size() == 2;
    stats.backgroundPeakRatio = histogram.front();
    stats.skewness = stats.mean - median(values);

    return stats;
}

core::ColorStatistics
FeatureExtractor::computeColorStatistics(const core::ChannelPlanes& planes) const {
    core::ColorStatistics stats;
    const auto count = planes.pixelCount();
    if (count == 0) {
        return stats;
    }

    const std::vector<float>* channels[3] = {&planes.red, &planes.green, &planes.blue};
    double total = 0.0;
    for (int c = 0; c < 3; ++c) {
        double sum = 0.0;
        for (float v : *channels[c]) {
            sum += v;
        }
        stats.meanRgb[static_cast<std::size_t>(c)] = sum / static_cast<double>(count);
        total += sum;
    }

    // Population variance over all R, G and B samples together
    const double overallMean = total / (3.0 * static_cast<double>(count));
    double squared = 0.0;
    for (int c = 0; c < 3; ++c) {
        for (float v : *channels[c]) {
            const double d = v - overallMean;
            squared += d * d;
        }
    }
    stats.colorVariance = squared / (3.0 * static_cast<double>(count));

    stats.dominantChannel = static_cast<int>(
        std::max_element(stats.meanRgb.begin(), stats.meanRgb.end()) - stats.meanRgb.begin());
    stats.skinToneLikelihood = skinToneLikelihood(planes);

    return stats;
}

double FeatureExtractor::skinToneLikelihood(const core::ChannelPlanes& planes) const {
    const auto count = planes.pixelCount();
    if (count == 0) {
        return 0.0;
    }

    std::size_t inAnyBand = 0;
    for (std::size_t i = 0; i < count; ++i) {
        const float r = planes.red[i];
        const float g = planes.green[i];
        const float b = planes.blue[i];
        if (parameters_.lightSkinBand.contains(r, g, b)
            || parameters_.mediumSkinBand.contains(r, g, b)
            || parameters_.darkSkinBand.contains(r, g, b)) {
            ++inAnyBand;
        }
    }

    const double ratio = static_cast<double>(inAnyBand) / static_cast<double>(count);
    return std::min(1.0, ratio * parameters_.skinLikelihoodScale);
}

double FeatureExtractor::edgeDensity(const std::vector<float>& gray, int width, int height) {
    if (width <= 0 || height <= 0 || gray.empty()) {
        return 0.0;
    }

    const auto pairs = static_cast<double>(height) * (width - 1)
        + static_cast<double>(height - 1) * width;
    if (pairs <= 0.0) {
        return 0.0;
    }

    const double threshold = 0.5 * computeMeanStd(gray).stdDev;
    std::size_t edges = 0;
    for (int y = 0; y < height; ++y) {
        const auto row = static_cast<std::size_t>(y) * width;
        for (int x = 0; x < width; ++x) {
            const float v = gray[row + x];
            if (x + 1 < width && std::abs(gray[row + x + 1] - v) > threshold) {
                ++edges;
            }
            if (y + 1 < height && std::abs(gray[row + width + x] - v) > threshold) {
                ++edges;
            }
        }
    }
    return static_cast<double>(edges) / pairs;
}

double FeatureExtractor::textureComplexity(const std::vector<float>& gray,
                                           int width, int height) const {
    if (width <= 0 || height <= 0 || gray.empty()) {
        return 0.0;
    }

    // Stride downsample so the longest side stays within the bound
    const int longest = std::max(width, height);
    const int stride = std::max(1, (longest + parameters_.maxTextureDimension - 1)
                                       / parameters_.maxTextureDimension);
    const int w = (width + stride - 1) / stride;
    const int h = (height + stride - 1) / stride;

    // Integral images of the reflect-padded sample and its square
    const int radius = parameters_.textureWindowSize / 2;
    const int pw = w + 2 * radius;
    const int ph = h + 2 * radius;
    std::vector<double> sum(static_cast<std::size_t>(pw + 1) * (ph + 1), 0.0);
    std::vector<double> sumSq(sum.size(), 0.0);
    auto at = [pw](int x, int y) {
        return static_cast<std::size_t>(y) * (pw + 1) + static_cast<std::size_t>(x);
    };

    for (int py = 0; py < ph; ++py) {
        const int sy = reflectIndex(py - radius, h) * stride;
        double rowSum = 0.0;
        double rowSumSq = 0.0;
        for (int px = 0; px < pw; ++px) {
            const int sx = reflectIndex(px - radius, w) * stride;
            const double v = gray[static_cast<std::size_t>(sy) * width + sx];
            rowSum += v;
            rowSumSq += v * v;
            sum[at(px + 1, py + 1)] = sum[at(px + 1, py)] + rowSum;
            sumSq[at(px + 1, py + 1)] = sumSq[at(px + 1, py)] + rowSumSq;
        }
    }

    const int window = parameters_.textureWindowSize;
    const double area = static_cast<double>(window) * window;
    std::vector<float> localVariances;
    localVariances.reserve(static_cast<std::size_t>(w) * h);
    for (int y = 0; y < h; ++y) {
        for (int x = 0; x < w; ++x) {
            const double s = sum[at(x + window, y + window)] - sum[at(x, y + window)]
                - sum[at(x + window, y)] + sum[at(x, y)];
            const double sq = sumSq[at(x + window, y + window)] - sumSq[at(x, y + window)]
                - sumSq[at(x + window, y)] + sumSq[at(x, y)];
            const double mean = s / area;
            localVariances.push_back(static_cast<float>(std::max(0.0, sq / area - mean * mean)));
        }
    }

    auto stats = computeMeanStd(localVariances);
    return (stats.stdDev * stats.stdDev) / (stats.mean + kEpsilon);
}

bool FeatureExtractor::hasRegularPatterns(const std::vector<float>& gray,
                                          int width, int height) const {
    if (width <= 0 || height <= 0 || gray.empty()) {
        return false;
    }

    const int crop = std::min(parameters_.regularPatternCropSize, std::min(width, height));
    const int x0 = (width - crop) / 2;
    const int y0 = (height - crop) / 2;

    std::vector<float> rowMeans(static_cast<std::size_t>(crop), 0.0f);
    std::vector<float> columnMeans(static_cast<std::size_t>(crop), 0.0f);
    for (int y = 0; y < crop; ++y) {
        for (int x = 0; x < crop; ++x) {
            const float v = gray[static_cast<std::size_t>(y0 + y) * width + (x0 + x)];
            rowMeans[static_cast<std::size_t>(y)] += v;
            columnMeans[static_cast<std::size_t>(x)] += v;
        }
    }
    for (auto& m : rowMeans) m /= static_cast<float>(crop);
    for (auto& m : columnMeans) m /= static_cast<float>(crop);

    return coefficientOfVariation(rowMeans) < parameters_.regularPatternMaxVariation
        || coefficientOfVariation(columnMeans) < parameters_.regularPatternMaxVariation;
}

}  // namespace med_classifier::services
