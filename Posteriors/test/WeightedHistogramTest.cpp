#include "Posteriors/PosteriorDensity.h"

#include <algorithm>
#include <cmath>
#include <limits>

#include "catch2/catch_test_macros.hpp"
#include "catch2/matchers/catch_matchers_floating_point.hpp"

using namespace Catch::Matchers;

namespace {
  std::vector<Sample> MakeSteps(const int n) {
    std::vector<Sample> Steps(n);
    for(int i = 0; i < n; ++i) {
      Steps[i].Physical = {std::sin(0.37*i), 0.15, 0.1 + 0.0013*i, 0.58, (i % 3 == 0) ? -2.5E-3 : 2.5E-3, 7.5E-5};
    }
    return Steps;
  }

  const CoordinateFunction Theta23 = [](const Sample& Step) { return std::array<double, 2>{Step.Get(kTheta23), 0.}; };
  const WeightFunction Weight = [](const Sample& Step) { return 1. + Step.Get(kDeltaCP); };
}

TEST_CASE("BatchSplitting", "[WeightedHistogram]") {
  const auto Steps = MakeSteps(997);
  const Binning bins(std::vector<std::vector<double>>{{0., 0.3, 0.6, 0.9, 1.2}});

  WeightedHistogram Single(bins, true);
  Single.FillBatch(Steps, Theta23, Weight);

  for(const size_t BatchSize : {1ul, 7ul, 500ul}) {
    WeightedHistogram Batched(bins, true);
    for(size_t i = 0; i < Steps.size(); i += BatchSize) {
      SampleBatch Batch(Steps.begin() + long(i), Steps.begin() + long(std::min(i + BatchSize, Steps.size())));
      Batched.FillBatch(Batch, Theta23, Weight);
    }
    for(int p = 0; p < Single.GetNPartitions(); ++p) {
      REQUIRE(Batched.GetBinContents(p) == Single.GetBinContents(p));
      REQUIRE(Batched.GetOutOfRangeWeight(p) == Single.GetOutOfRangeWeight(p));
      REQUIRE(Batched.GetNEntries(p) == Single.GetNEntries(p));
    }
  }
}

TEST_CASE("WeightConservation", "[WeightedHistogram]") {
  const auto Steps = MakeSteps(1000);
  WeightedHistogram Hist(Binning(std::vector<std::vector<double>>{{0.2, 0.5, 0.8}}), false);
  Hist.FillBatch(Steps, Theta23, Weight);

  double Expected = 0.;
  for(const auto& Step : Steps) Expected += Weight(Step);

  REQUIRE(Hist.GetNPartitions() == 1);
  REQUIRE(Hist.GetNOutOfRange() > 0);
  REQUIRE_THAT(Hist.GetInRangeWeight() + Hist.GetOutOfRangeWeight(), WithinRel(Hist.GetTotalWeight(), 1E-12));
  REQUIRE_THAT(Hist.GetTotalWeight(), WithinRel(Expected, 1E-12));
  REQUIRE(Hist.GetNEntries(0) == 1000);
}

TEST_CASE("MalformedSamples", "[WeightedHistogram]") {
  WeightedHistogram Hist(Binning(std::vector<std::vector<double>>{{0., 1.}}));
  const double NaN = std::numeric_limits<double>::quiet_NaN();

  Hist.Fill(0.5, 0., 1.);
  Hist.Fill(NaN, 0., 1.);
  Hist.Fill(0.5, 0., std::numeric_limits<double>::infinity());
  // y is not looked at for 1D
  Hist.Fill(0.5, NaN, 2.);

  REQUIRE(Hist.GetNMalformed() == 2);
  REQUIRE(Hist.GetTotalWeight() == 3.);
  REQUIRE(Hist.GetBinContent(0, 0) == 3.);

  Hist.Reset();
  REQUIRE(Hist.GetNMalformed() == 0);
  REQUIRE(Hist.GetTotalWeight() == 0.);
}

TEST_CASE("MergeShards", "[WeightedHistogram]") {
  const auto Steps = MakeSteps(600);
  const Binning bins(std::vector<std::vector<double>>{{0., 0.4, 0.8}});

  WeightedHistogram Full(bins, true);
  Full.FillBatch(Steps, Theta23, Weight);

  WeightedHistogram First(bins, true);
  WeightedHistogram Second(bins, true);
  First.FillBatch(SampleBatch(Steps.begin(), Steps.begin() + 250), Theta23, Weight);
  Second.FillBatch(SampleBatch(Steps.begin() + 250, Steps.end()), Theta23, Weight);
  First.Add(Second);

  for(int p = 0; p < 2; ++p) {
    for(int i = 0; i < bins.GetNBins(); ++i) {
      REQUIRE_THAT(First.GetBinContent(p, i), WithinAbs(Full.GetBinContent(p, i), 1E-9));
    }
    REQUIRE(First.GetNEntries(p) == Full.GetNEntries(p));
  }
  REQUIRE_THAT(First.GetTotalWeight(), WithinAbs(Full.GetTotalWeight(), 1E-9));

  WeightedHistogram Unsplit(bins, false);
  REQUIRE_THROWS_AS(First.Add(Unsplit), NuMCMCException);
  WeightedHistogram OtherBins(Binning(std::vector<std::vector<double>>{{0., 0.8}}), true);
  REQUIRE_THROWS_AS(First.Add(OtherBins), NuMCMCException);
}

TEST_CASE("Normalisation", "[PosteriorDensity]") {
  const Binning bins(std::vector<std::vector<double>>{{0., 1., 3.}});
  WeightedHistogram Hist(bins, true);
  Hist.Fill(0.5, 0., 3., kNormalOrdering);
  Hist.Fill(2., 0., 1., kNormalOrdering);
  Hist.Fill(0.5, 0., 2., kInvertedOrdering);
  Hist.Fill(5., 0., 2., kInvertedOrdering);

  PosteriorDensity Density(Hist);
  REQUIRE(Density.IsSplit());
  REQUIRE_THAT(Density.GetIntegral(0), WithinAbs(1., 1E-12));
  REQUIRE_THAT(Density.GetIntegral(1), WithinAbs(1., 1E-12));
  REQUIRE_THAT(Density.GetDensity(0, 0), WithinAbs(0.75, 1E-12));
  REQUIRE_THAT(Density.GetDensity(0, 1), WithinAbs(0.125, 1E-12));
  REQUIRE_THAT(Density.GetPartitionShare(0), WithinAbs(4./6., 1E-12));
  REQUIRE_THAT(Density.GetPartitionInRangeFraction(1), WithinAbs(0.5, 1E-12));
  REQUIRE_THAT(Density.GetInRangeFraction(), WithinAbs(0.75, 1E-12));

  // Masses are relative to everything processed
  double Mass = 0.;
  for(int p = 0; p < 2; ++p) {
    for(int i = 0; i < bins.GetNBins(); ++i) Mass += Density.GetBinMass(p, i);
  }
  REQUIRE_THAT(Mass, WithinAbs(0.75, 1E-12));

  const auto Combined = Density.GetCombinedDensities();
  REQUIRE_THAT(Combined[0]*1. + Combined[1]*2., WithinAbs(1., 1E-12));

  auto Exported = Density.ToHistogram("Density_NO", 0);
  REQUIRE(Exported->GetNbinsX() == 2);
  REQUIRE_THAT(Exported->GetBinContent(1), WithinAbs(0.75, 1E-12));
  REQUIRE_THROWS_AS(Density.ToHistogram("Bad", 2), NuMCMCException);
}

TEST_CASE("EmptyHistogram", "[PosteriorDensity]") {
  WeightedHistogram Hist(Binning(std::vector<std::vector<double>>{{0., 1.}}));
  REQUIRE_THROWS_AS(PosteriorDensity(Hist), EmptyHistogram);

  Hist.Fill(2., 0., 1.);
  REQUIRE_THROWS_AS(PosteriorDensity(Hist), EmptyHistogram);

  Hist.Fill(0.5, 0., 0.);
  REQUIRE_THROWS_AS(PosteriorDensity(Hist), EmptyHistogram);
}
