#include "Posteriors/PlotStack.h"

#include <cmath>

#include "catch2/catch_test_macros.hpp"
#include "catch2/matchers/catch_matchers_floating_point.hpp"

_NuMCMC_Safe_Include_Start_ //{
#include "TH1D.h"
#include "TMath.h"
#include "TMemFile.h"
_NuMCMC_Safe_Include_End_ //}

using namespace Catch::Matchers;

namespace {
  /// Theta23 evenly spread over [0, pi/2), all other parameters fixed
  std::vector<Sample> MakeFlatTheta23Chain(const int n, const bool AlternateOrdering = false) {
    std::vector<Sample> Steps(n);
    for(int i = 0; i < n; ++i) {
      const double dm32 = (AlternateOrdering && i % 2 == 1) ? -2.5E-3 : 2.5E-3;
      Steps[i].Physical = {0., 0.15, (i + 0.5) * TMath::PiOver2() / n, 0.58, dm32, 7.5E-5};
    }
    return Steps;
  }

  const std::string ThetaBinning = "{axes: [{linspace: {n: 50, low: 0, high: 1.5707963267948966}}]}";
}

TEST_CASE("FlatToSinSqTheta23", "[PosteriorPlot]") {
  auto Source = std::make_shared<VectorSampleSource>(MakeFlatTheta23Chain(1000));
  PlotStack Stack(Source);
  auto& Plot = Stack.AddPlot("Theta23", {"Theta23"}, Binning(YAML::Load(ThetaBinning)),
                             {ParsePriorSpec("Theta23", "Uniform:sin^2(x)")});
  Stack.FillPlots(-1, 64);

  const auto& Density = Plot.GetDensity();
  REQUIRE_THAT(Density.GetIntegral(0), WithinAbs(1., 1E-9));
  const Binning& bins = Density.GetBinning();
  for(int i = 0; i < bins.GetNBins(); ++i) {
    const double Centre = bins.GetAxis(0).GetBinCenter(i + 1);
    REQUIRE_THAT(Density.GetDensity(0, i), WithinAbs(std::sin(2*Centre), 0.01));
  }
  // First step of a two step chain sits at pi/8
  REQUIRE_THAT(Plot.GetWeight(MakeFlatTheta23Chain(2)[0]), WithinAbs(std::sin(TMath::PiOver4()), 1E-12));

  REQUIRE_THROWS_AS(Plot.Fill(MakeFlatTheta23Chain(10)), NuMCMCException);
  REQUIRE_THROWS_AS(Stack.GetRegistry().RegisterStandardVariable("SinSqTheta23"), NuMCMCException);
}

TEST_CASE("EqualOrderingSplit", "[PosteriorPlot]") {
  auto Source = std::make_shared<VectorSampleSource>(MakeFlatTheta23Chain(1000, true));
  PlotStack Stack(Source);
  Stack.RegisterVariablesFromYAML(YAML::Load("[SinSqTheta23]"));
  Stack.AddPlotsFromYAML(YAML::Load(R"(
- Name: SinSqTheta23
  Variables: [SinSqTheta23]
  Binning: {axes: [{linspace: {n: 20, low: 0, high: 1}}]}
  SplitByOrdering: true
)"));
  Stack.FillPlots();
  Stack.MakeCredibleRegions({1, 2}, true, true);

  auto& Plot = Stack.GetPlot("SinSqTheta23");
  const auto& Density = Plot.GetDensity();
  REQUIRE(Density.GetNPartitions() == 2);
  REQUIRE_THAT(Density.GetPartitionShare(kNormalOrdering), WithinAbs(0.5, 1E-12));
  REQUIRE_THAT(Density.GetPartitionShare(kInvertedOrdering), WithinAbs(0.5, 1E-12));
  REQUIRE_THAT(Density.GetIntegral(0), WithinAbs(1., 1E-9));
  REQUIRE_THAT(Density.GetIntegral(1), WithinAbs(1., 1E-9));
  // Every other step is inverted ordering, each half carries weight 500
  REQUIRE_THAT(Plot.GetHistogram().GetPartitionWeight(kNormalOrdering), WithinAbs(500., 1E-9));
  REQUIRE_THAT(Plot.GetHistogram().GetPartitionWeight(kInvertedOrdering), WithinAbs(500., 1E-9));

  // NO, IO and combined for both levels
  REQUIRE(Plot.GetCredibleRegions().size() == 6);
  for(const auto& Region : Plot.GetCredibleRegions()) {
    REQUIRE(Region.Reached);
  }

  TMemFile Output("PosteriorPlotTest.root", "RECREATE");
  Stack.Write(&Output);
  REQUIRE(Output.Get<TH1D>("SinSqTheta23_Density_NO") != nullptr);
  REQUIRE(Output.Get<TH1D>("SinSqTheta23_Density_IO") != nullptr);
  REQUIRE(Output.Get<TH1D>("SinSqTheta23_Density_Combined") != nullptr);
  REQUIRE(Output.Get<TH1D>("SinSqTheta23_Credible_68.27_Combined") != nullptr);
  Output.Close();
}

TEST_CASE("TwoDimensionalUnequalAreas", "[PosteriorPlot]") {
  // Counts 30, 50, 16 and 4 in bins of area 1, 2, 2 and 4
  std::vector<Sample> Steps;
  const std::vector<std::array<double, 3>> Cells = {{0.5, -0.5, 30}, {2., -0.5, 50}, {0.5, 1., 16}, {2., 1., 4}};
  for(const auto& Cell : Cells) {
    for(int i = 0; i < int(Cell[2]); ++i) {
      Sample Step;
      Step.Physical = {Cell[1], 0.15, Cell[0], 0.58, 2.5E-3, 7.5E-5};
      Steps.push_back(Step);
    }
  }
  auto Source = std::make_shared<VectorSampleSource>(Steps);
  PlotStack Stack(Source);
  Stack.AddPlotsFromYAML(YAML::Load(R"(
- Name: Theta23_DeltaCP
  Variables: [Theta23, DeltaCP]
  Binning: {axes: [{variable: [0, 1, 3]}, {variable: [-1, 0, 2]}]}
)"));
  Stack.FillPlots(-1, 7);
  Stack.MakeCredibleRegions({0.25, 0.7, 0.9});

  auto& Plot = Stack.GetPlot("Theta23_DeltaCP");
  REQUIRE(Plot.GetNDimensions() == 2);
  const auto& Density = Plot.GetDensity();
  const Binning& bins = Density.GetBinning();
  const int Dense = bins.GetBinNumber(0.5, -0.5);
  const int Wide = bins.GetBinNumber(2., -0.5);
  const int Tall = bins.GetBinNumber(0.5, 1.);
  const int Corner = bins.GetBinNumber(2., 1.);

  REQUIRE_THAT(Density.GetDensity(0, Dense), WithinAbs(0.30, 1E-12));
  REQUIRE_THAT(Density.GetDensity(0, Wide), WithinAbs(0.25, 1E-12));
  REQUIRE_THAT(Density.GetDensity(0, Tall), WithinAbs(0.08, 1E-12));
  REQUIRE_THAT(Density.GetDensity(0, Corner), WithinAbs(0.01, 1E-12));
  REQUIRE_THAT(Density.GetIntegral(0), WithinAbs(1., 1E-12));

  // Highest density bin holds fewer steps than its wider neighbour
  const auto& Regions = Plot.GetCredibleRegions();
  REQUIRE(Regions.size() == 3);
  REQUIRE(Regions[0].GetNBins() == 1);
  REQUIRE(Regions[0].Contains(0, Dense));
  REQUIRE_THAT(Regions[0].Mass, WithinAbs(0.3, 1E-12));
  REQUIRE_THAT(Regions[0].Threshold, WithinAbs(0.30, 1E-12));

  REQUIRE(Regions[1].GetNBins() == 2);
  REQUIRE(Regions[1].Contains(0, Wide));
  REQUIRE_THAT(Regions[1].Mass, WithinAbs(0.8, 1E-12));

  REQUIRE(Regions[2].GetNBins() == 3);
  REQUIRE(Regions[2].Contains(0, Tall));
  REQUIRE_FALSE(Regions[2].Contains(0, Corner));
  REQUIRE_THAT(Regions[2].Mass, WithinAbs(0.96, 1E-12));
  REQUIRE_THAT(Regions[2].Threshold, WithinAbs(0.08, 1E-12));
}

TEST_CASE("EmpiricalPriorWeights", "[PosteriorPlot]") {
  // Nodes at 0.4 and 1.2 with density 1 and 3, empty under and overflow
  TH1D Table("EmpiricalTheta23", "", 2, 0., 1.6);
  Table.SetBinContent(1, 1.);
  Table.SetBinContent(2, 3.);
  auto Prior = std::make_shared<const EmpiricalPrior>(std::vector<std::string>{"Theta23"}, TabulatedDensity(Table, kRegularGrid));

  ChainMetadata Metadata;
  VariableRegistry Registry;
  Registry.RegisterStandardVariable("SinSqTheta23");
  Sample Step;
  Step.Physical = {0., 0.16, 0.8, 0.58, 2.5E-3, 7.5E-5};
  const Binning bins(std::vector<std::vector<double>>{{0., 1.6}});

  PosteriorPlot Plot("Empirical", {"Theta23"}, bins, Registry, Metadata, {}, {}, false, {Prior});
  REQUIRE(Plot.GetEmpiricalPriors().size() == 1);
  REQUIRE_THAT(Plot.GetWeight(Step), WithinAbs(2., 1E-12));

  // Joint prior is allowed in a 2D plot
  const Binning bins2D(std::vector<std::vector<double>>{{0., 1.6}, {0., 1.}});
  PosteriorPlot TwoD("EmpiricalTwoD", {"Theta23", "SinSqTheta23"}, bins2D, Registry, Metadata, {}, {}, false, {Prior});
  REQUIRE_THAT(TwoD.GetWeight(Step), WithinAbs(2., 1E-12));

  TH1D DerivedTable("EmpiricalSinSq", "", 2, 0., 1.);
  auto OnDerived = std::make_shared<const EmpiricalPrior>(std::vector<std::string>{"SinSqTheta23"}, TabulatedDensity(DerivedTable));
  REQUIRE_THROWS_AS(PosteriorPlot("Derived", {"Theta23"}, bins, Registry, Metadata, {}, {}, false, {OnDerived}), DimensionalityError);
  REQUIRE_THROWS_AS(PosteriorPlot("Twice", {"Theta23"}, bins, Registry, Metadata,
                                  {ParsePriorSpec("Theta23", "Uniform:sin^2(x)")}, {}, false, {Prior}), NuMCMCException);

  // Chain prior vanishing where the empirical prior is evaluated
  Metadata.SetPrior(ParsePriorSpec("Theta23", "Uniform(0, 0.5):x"));
  PosteriorPlot Windowed("Windowed", {"Theta23"}, bins, Registry, Metadata, {}, {}, false, {Prior});
  REQUIRE_THROWS_AS(Windowed.GetWeight(Step), DegeneratePrior);
}

TEST_CASE("ConstraintWeights", "[PosteriorPlot]") {
  ChainMetadata Metadata;
  Metadata.AddConstraint(std::make_shared<const GaussianConstraint>("T23", "Theta23", 0.8, 0.1, kNormalOnly));
  Metadata.AddConstraint(std::make_shared<const GaussianConstraint>("T13", "Theta13", 0.15, 0.01, kBothOrderings, true));

  VariableRegistry Registry;
  Sample Step;
  Step.Physical = {0., 0.16, 0.9, 0.58, 2.5E-3, 7.5E-5};
  const Binning bins(std::vector<std::vector<double>>{{0., 1.6}});

  PosteriorPlot AutoOnly("AutoOnly", {"Theta23"}, bins, Registry, Metadata);
  REQUIRE(AutoOnly.GetConstraints().size() == 1);
  REQUIRE_THAT(AutoOnly.GetWeight(Step), WithinAbs(std::exp(-0.5), 1E-12));

  PosteriorPlot Both("Both", {"Theta23"}, bins, Registry, Metadata, {}, {"T23"});
  REQUIRE(Both.GetConstraints().size() == 2);
  REQUIRE_THAT(Both.GetWeight(Step), WithinAbs(std::exp(-1.), 1E-12));

  // T23 is only valid for normal ordering
  Step.Physical[kDeltam2_32] = -2.5E-3;
  REQUIRE_THAT(Both.GetWeight(Step), WithinAbs(std::exp(-0.5), 1E-12));

  REQUIRE_THROWS_AS(PosteriorPlot("Unknown", {"Theta23"}, bins, Registry, Metadata, {}, {"Solar"}), NuMCMCException);
}

TEST_CASE("PriorOverrideRules", "[PosteriorPlot]") {
  ChainMetadata Metadata;
  VariableRegistry Registry;
  Registry.RegisterStandardVariable("SinSqTheta23");
  const auto Override = ParsePriorSpec("Theta23", "Uniform:sin^2(x)");

  const Binning bins2D(std::vector<std::vector<double>>{{0., 1.}, {0., 1.}});
  REQUIRE_THROWS_AS(PosteriorPlot("TwoD", {"Theta23", "Theta13"}, bins2D, Registry, Metadata, {Override}), DimensionalityError);
  REQUIRE_NOTHROW(PosteriorPlot("TwoDNoOverride", {"Theta23", "Theta13"}, bins2D, Registry, Metadata));

  const Binning bins1D(std::vector<std::vector<double>>{{0., 1.}});
  REQUIRE_THROWS_AS(PosteriorPlot("Derived", {"SinSqTheta23"}, bins1D, Registry, Metadata,
                                  {ParsePriorSpec("SinSqTheta23", "Uniform:x")}), DimensionalityError);
  REQUIRE_THROWS_AS(PosteriorPlot("Twice", {"Theta23"}, bins1D, Registry, Metadata, {Override, Override}), NuMCMCException);
  REQUIRE_THROWS_AS(PosteriorPlot("Mismatch", {"Theta23"}, bins2D, Registry, Metadata), DimensionalityError);
  REQUIRE_THROWS_AS(PosteriorPlot("Unknown", {"Theta24"}, bins1D, Registry, Metadata), NuMCMCException);

  // Prior on another physical parameter than the plotted one is allowed
  PosteriorPlot Other("Other", {"SinSqTheta23"}, bins1D, Registry, Metadata, {Override});
  REQUIRE(Other.GetReweighters().size() == 1);

  // One override per physical parameter, the factors multiply
  PosteriorPlot Pair("Pair", {"Theta23"}, bins1D, Registry, Metadata, {Override, ParsePriorSpec("Theta13", "Uniform:sin^2(x)")});
  REQUIRE(Pair.GetReweighters().size() == 2);
  Sample Step;
  Step.Physical = {0., 0.16, 0.9, 0.58, 2.5E-3, 7.5E-5};
  REQUIRE_THAT(Pair.GetWeight(Step), WithinAbs(std::sin(1.8) * std::sin(0.32), 1E-12));
}

TEST_CASE("PlotStackBookkeeping", "[PlotStack]") {
  REQUIRE_THROWS_AS(PlotStack(nullptr), NuMCMCException);

  auto Source = std::make_shared<VectorSampleSource>(MakeFlatTheta23Chain(100));
  PlotStack Stack(Source);
  Stack.AddPlot("Theta23", {"Theta23"}, Binning(YAML::Load(ThetaBinning)));
  REQUIRE_THROWS_AS(Stack.AddPlot("Theta23", {"Theta23"}, Binning(YAML::Load(ThetaBinning))), NuMCMCException);
  REQUIRE_THROWS_AS(Stack.AddPlotsFromYAML(YAML::Load("{Name: NotAList}")), NuMCMCException);
  REQUIRE_THROWS_AS(Stack.AddPlotsFromYAML(YAML::Load("[{Variables: [Theta13]}]")), NuMCMCException);
  REQUIRE_THROWS_AS(Stack.GetPlot("Theta13"), NuMCMCException);
  REQUIRE_THROWS_AS(Stack.GetPlot("Theta23").GetDensity(), NuMCMCException);

  Stack.FillPlots(40, 16);
  REQUIRE(Stack.GetNPlots() == 1);
  REQUIRE(Stack.GetPlot(0).GetHistogram().GetNEntries(0) == 40);
  REQUIRE(Stack.GetPlot(0).IsNormalised());
  REQUIRE_THROWS_AS(Stack.FillPlots(-1, 0), NuMCMCException);
}
