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

#include "services/classification/pathology_analyzer.hpp"

#include "test_utils/synthetic_image_generator.hpp"

#include <gtest/gtest.h>

#include <algorithm>

namespace med_classifier::services::test {

using core::ClinicalSignificance;
using core::MedicalImageType;
using core::NormalIndicator;
using core::PathologyFinding;
using namespace med_classifier::test_utils;

namespace {

template <typename Container, typename Value>
bool containsValue(const Container& values, Value value)
{
    return std::find(values.begin(), values.end(), value) != values.end();
}

}  // anonymous namespace

// ============================================================================
// Test fixture
// ============================================================================
class PathologyAnalyzerTest : public ::testing::Test {
protected:
    core::PathologyFindings analyzePlanes(MedicalImageType type,
                                          const core::ChannelPlanes& planes,
                                          bool nativeGrayscale = false) const
    {
        auto features = extractor_.extract(planes, nativeGrayscale);
        return analyzer_.analyze(type, planes, features);
    }

    static core::TextureMetrics texture(double edgeDensity, double complexity)
    {
        core::TextureMetrics metrics;
        metrics.edgeDensity = edgeDensity;
        metrics.textureComplexity = complexity;
        return metrics;
    }

    FeatureExtractor extractor_;
    PathologyAnalyzer analyzer_;
};

// ============================================================================
// Dermatology
// ============================================================================
TEST_F(PathologyAnalyzerTest, UniformSkinShowsOnlyRedness)
{
    auto findings = analyzePlanes(MedicalImageType::DermatologicalImage,
                                  makeUniformPlanes(400, 400, kSkinTone));

    ASSERT_EQ(findings.specificFindings.size(), 1u);
    EXPECT_EQ(findings.specificFindings[0], PathologyFinding::RednessPattern);

    std::vector<NormalIndicator> expectedNormals = {
        NormalIndicator::ConsistentPigmentation,
        NormalIndicator::SmoothTexture,
        NormalIndicator::NormalTexture,
        NormalIndicator::NoObviousLesions
    };
    EXPECT_EQ(findings.normalIndicators, expectedNormals);

    EXPECT_NEAR(findings.pathologicalConfidence, 0.3, 1e-9);
    EXPECT_EQ(findings.clinicalSignificance, ClinicalSignificance::FollowUpRecommended);
    EXPECT_TRUE(findings.hasPathologicalFindings);
}

TEST_F(PathologyAnalyzerTest, DarkPatchIsPotentialLesion)
{
    auto planes = makePlanes(200, 200, [](int x, int y) {
        return skinWithLesionColor(x, y, 200, 30);
    });
    auto findings = analyzePlanes(MedicalImageType::DermatologicalImage, planes);

    EXPECT_TRUE(containsValue(findings.specificFindings, PathologyFinding::PotentialLesions));
    EXPECT_TRUE(containsValue(findings.specificFindings, PathologyFinding::RednessPattern));
    EXPECT_TRUE(containsValue(findings.specificFindings, PathologyFinding::TextureIrregularity));
    EXPECT_FALSE(containsValue(findings.normalIndicators, NormalIndicator::NoObviousLesions));
    EXPECT_NEAR(findings.pathologicalConfidence, 0.75, 1e-9);
    EXPECT_EQ(findings.clinicalSignificance, ClinicalSignificance::ConditionMonitoring);
}

TEST_F(PathologyAnalyzerTest, ScoreWeightsComeFromConfiguration)
{
    core::DermatologyParameters parameters;
    parameters.rednessWeight = 0.1;
    PathologyAnalyzer analyzer(parameters);

    auto planes = makeUniformPlanes(400, 400, kSkinTone);
    auto features = extractor_.extract(planes, false);
    auto findings = analyzer.analyzeDermatological(planes, features);

    ASSERT_EQ(findings.specificFindings.size(), 1u);
    EXPECT_EQ(findings.specificFindings[0], PathologyFinding::RednessPattern);
    EXPECT_NEAR(findings.pathologicalConfidence, 0.1, 1e-9);
    EXPECT_EQ(findings.clinicalSignificance, ClinicalSignificance::RoutineSkinDocumentation);
    EXPECT_FALSE(findings.hasPathologicalFindings);
}

TEST_F(PathologyAnalyzerTest, GrayscaleDermatologyIsLimited)
{
    auto planes = makeGrayPlanes(64, 64, [](int, int) { return 128; });
    auto findings = analyzePlanes(MedicalImageType::DermatologicalImage, planes, true);

    EXPECT_FALSE(findings.hasPathologicalFindings);
    EXPECT_DOUBLE_EQ(findings.pathologicalConfidence, 0.0);
    EXPECT_TRUE(findings.specificFindings.empty());
    ASSERT_EQ(findings.normalIndicators.size(), 1u);
    EXPECT_EQ(findings.normalIndicators[0], NormalIndicator::AnalysisLimited);
    EXPECT_EQ(findings.clinicalSignificance, ClinicalSignificance::RoutineSkinDocumentation);
}

TEST_F(PathologyAnalyzerTest, SignificanceTiers)
{
    EXPECT_EQ(analyzer_.dermatologySignificance(0.75), ClinicalSignificance::ConditionMonitoring);
    EXPECT_EQ(analyzer_.dermatologySignificance(0.45), ClinicalSignificance::ConditionMonitoring);
    EXPECT_EQ(analyzer_.dermatologySignificance(0.4), ClinicalSignificance::FollowUpRecommended);
    EXPECT_EQ(analyzer_.dermatologySignificance(0.3), ClinicalSignificance::FollowUpRecommended);
    EXPECT_EQ(analyzer_.dermatologySignificance(0.25),
              ClinicalSignificance::RoutineSkinDocumentation);
    EXPECT_EQ(analyzer_.dermatologySignificance(0.0),
              ClinicalSignificance::RoutineSkinDocumentation);
}

TEST_F(PathologyAnalyzerTest, CustomSignificanceThresholds)
{
    core::DermatologyParameters params;
    params.conditionMonitoringConfidence = 0.6;
    params.followUpConfidence = 0.5;
    PathologyAnalyzer strict(params);

    EXPECT_EQ(strict.dermatologySignificance(0.55), ClinicalSignificance::FollowUpRecommended);
    EXPECT_EQ(strict.dermatologySignificance(0.45),
              ClinicalSignificance::RoutineSkinDocumentation);
}

// ============================================================================
// Dermatology signals
// ============================================================================
TEST_F(PathologyAnalyzerTest, RednessScore)
{
    auto skin = makeUniformPlanes(10, 10, kSkinTone);
    EXPECT_NEAR(PathologyAnalyzer::rednessScore(skin), 0.7 * 210.0 / 301.0, 1e-5);

    auto blue = makeUniformPlanes(10, 10, Rgb{0, 0, 255});
    EXPECT_DOUBLE_EQ(PathologyAnalyzer::rednessScore(blue), 0.0);

    core::ChannelPlanes empty;
    EXPECT_DOUBLE_EQ(PathologyAnalyzer::rednessScore(empty), 0.0);
}

TEST_F(PathologyAnalyzerTest, SkinToneVariation)
{
    EXPECT_DOUBLE_EQ(PathologyAnalyzer::skinToneVariation(makeUniformPlanes(16, 16, kSkinTone)),
                     0.0);

    auto columns = makeGrayPlanes(16, 16, [](int x, int) {
        return static_cast<unsigned char>(x % 2 == 0 ? 0 : 255);
    });
    EXPECT_DOUBLE_EQ(PathologyAnalyzer::skinToneVariation(columns), 1.0);
}

TEST_F(PathologyAnalyzerTest, CountsSeparateDarkRegions)
{
    auto planes = makeGrayPlanes(100, 100, [](int x, int y) {
        const bool first = x >= 10 && x < 20 && y >= 10 && y < 20;
        const bool second = x >= 60 && x < 70 && y >= 60 && y < 70;
        return static_cast<unsigned char>(first || second ? 0 : 255);
    });
    EXPECT_EQ(analyzer_.countPotentialLesions(planes.gray(), 100, 100), 2);
}

TEST_F(PathologyAnalyzerTest, DiagonalNeighborsAreSeparateRegions)
{
    auto planes = makeGrayPlanes(100, 100, [](int x, int y) {
        const bool first = x >= 10 && x < 20 && y >= 10 && y < 20;
        const bool second = x >= 20 && x < 30 && y >= 20 && y < 30;
        return static_cast<unsigned char>(first || second ? 0 : 255);
    });
    EXPECT_EQ(analyzer_.countPotentialLesions(planes.gray(), 100, 100), 2);
}

TEST_F(PathologyAnalyzerTest, SpecksBelowMinimumAreaAreIgnored)
{
    auto planes = makeGrayPlanes(100, 100, [](int x, int y) {
        const bool patch = x >= 40 && x < 50 && y >= 40 && y < 50;
        const bool speck = (x == 5 && y == 5) || (x == 90 && y == 10) || (x == 10 && y == 90);
        return static_cast<unsigned char>(patch || speck ? 0 : 255);
    });
    EXPECT_EQ(analyzer_.countPotentialLesions(planes.gray(), 100, 100), 1);
}

TEST_F(PathologyAnalyzerTest, PigmentSigmaControlsLesionThreshold)
{
    auto planes = makeGrayPlanes(100, 100, [](int x, int y) {
        const bool patch = x >= 10 && x < 20 && y >= 10 && y < 20;
        return static_cast<unsigned char>(patch ? 0 : 255);
    });

    core::DermatologyParameters parameters;
    parameters.pigmentSigma = 100.0;
    PathologyAnalyzer lenient(parameters);

    EXPECT_EQ(analyzer_.countPotentialLesions(planes.gray(), 100, 100), 1);
    EXPECT_EQ(lenient.countPotentialLesions(planes.gray(), 100, 100), 0);
}

TEST_F(PathologyAnalyzerTest, LargeDarkAreaIsNotALesion)
{
    auto planes = makeGrayPlanes(100, 100, [](int x, int) {
        return static_cast<unsigned char>(x < 50 ? 0 : 255);
    });
    EXPECT_EQ(analyzer_.countPotentialLesions(planes.gray(), 100, 100), 0);
    EXPECT_EQ(analyzer_.countPotentialLesions({}, 0, 0), 0);
}

// ============================================================================
// Radiology, clinical photos and histology
// ============================================================================
TEST_F(PathologyAnalyzerTest, RoutineRadiology)
{
    auto findings = analyzer_.analyzeRadiological(texture(0.05, 0.5));
    EXPECT_FALSE(findings.hasPathologicalFindings);
    EXPECT_DOUBLE_EQ(findings.pathologicalConfidence, 0.0);
    EXPECT_TRUE(findings.specificFindings.empty());
    EXPECT_TRUE(containsValue(findings.normalIndicators, NormalIndicator::RoutineImaging));
    EXPECT_EQ(findings.clinicalSignificance, ClinicalSignificance::ScreeningExamination);
}

TEST_F(PathologyAnalyzerTest, BusyRadiologyNeedsReview)
{
    auto findings = analyzer_.analyzeRadiological(texture(0.25, 2.5));
    EXPECT_FALSE(findings.hasPathologicalFindings);
    EXPECT_DOUBLE_EQ(findings.pathologicalConfidence, 0.3);
    ASSERT_EQ(findings.specificFindings.size(), 1u);
    EXPECT_EQ(findings.specificFindings[0], PathologyFinding::ImageComplexity);
    EXPECT_EQ(findings.clinicalSignificance,
              ClinicalSignificance::ProfessionalReviewRecommended);
}

TEST_F(PathologyAnalyzerTest, ClinicalPhotograph)
{
    ImageFeatures calm;
    calm.color = core::ColorStatistics{};
    calm.color->colorVariance = 500.0;
    auto routine = analyzer_.analyzeClinicalPhotograph(calm);
    EXPECT_EQ(routine.clinicalSignificance, ClinicalSignificance::RoutineDocumentation);
    EXPECT_TRUE(containsValue(routine.normalIndicators, NormalIndicator::ClinicalDocumentation));

    ImageFeatures busy;
    busy.color = core::ColorStatistics{};
    busy.color->colorVariance = 4000.0;
    busy.texture = texture(0.2, 1.0);
    auto review = analyzer_.analyzeClinicalPhotograph(busy);
    EXPECT_DOUBLE_EQ(review.pathologicalConfidence, 0.2);
    EXPECT_TRUE(containsValue(review.specificFindings, PathologyFinding::VisualVariation));
    EXPECT_EQ(review.clinicalSignificance, ClinicalSignificance::ProfessionalReviewRecommended);
}

TEST_F(PathologyAnalyzerTest, Histology)
{
    auto findings = analyzePlanes(MedicalImageType::PathologicalImage,
                                  makeUniformPlanes(64, 64, kHematoxylinEosin));
    EXPECT_TRUE(findings.hasPathologicalFindings);
    EXPECT_DOUBLE_EQ(findings.pathologicalConfidence, 0.8);
    ASSERT_EQ(findings.specificFindings.size(), 1u);
    EXPECT_EQ(findings.specificFindings[0], PathologyFinding::HistologicalAnalysis);
    EXPECT_EQ(findings.clinicalSignificance, ClinicalSignificance::PathologicalExamination);
}

TEST_F(PathologyAnalyzerTest, OtherTypesGetLimitedAnalysis)
{
    for (auto type : {MedicalImageType::Endoscopy, MedicalImageType::RetinalImage,
                      MedicalImageType::MedicalDocument, MedicalImageType::Ultrasound}) {
        auto findings = analyzePlanes(type, makeUniformPlanes(32, 32, kMucosaTone));
        EXPECT_FALSE(findings.hasPathologicalFindings) << core::toTag(type);
        EXPECT_EQ(findings.clinicalSignificance, ClinicalSignificance::RoutineDocumentation);
        ASSERT_EQ(findings.normalIndicators.size(), 1u);
        EXPECT_EQ(findings.normalIndicators[0], NormalIndicator::AnalysisLimited);
    }
}

TEST_F(PathologyAnalyzerTest, RadiologicalTypesDispatchToRadiology)
{
    const int height = 100;
    auto planes = makeGrayPlanes(100, height, [height](int x, int y) {
        return chestRadiographValue(x, y, height);
    });
    auto findings = analyzePlanes(MedicalImageType::ChestXray, planes, true);
    EXPECT_EQ(findings.clinicalSignificance, ClinicalSignificance::ScreeningExamination);
}

}  // namespace med_classifier::services::test
