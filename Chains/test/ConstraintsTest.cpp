#include "Chains/Constraints.h"

#include "catch2/catch_test_macros.hpp"
#include "catch2/matchers/catch_matchers_floating_point.hpp"

_NuMCMC_Safe_Include_Start_ //{
#include "TH1D.h"
#include "TH2D.h"
#include "TGraph2D.h"
_NuMCMC_Safe_Include_End_ //}

using namespace Catch::Matchers;

TEST_CASE("GaussianConstraint", "[Constraints]") {
  GaussianConstraint Reactor("T13Reactor", "Theta13", 0.15, 0.002);
  REQUIRE(Reactor.GetDimension() == 1);
  REQUIRE_THAT(Reactor.Evaluate(0.15), WithinAbs(1., 1E-12));
  REQUIRE_THAT(Reactor.Evaluate(0.154), WithinAbs(std::exp(-2.), 1E-12));
  REQUIRE(Reactor.AppliesTo(kNormalOrdering));
  REQUIRE(Reactor.AppliesTo(kInvertedOrdering));

  REQUIRE_THROWS_AS(GaussianConstraint("Bad", "Theta13", 0.15, 0.), NuMCMCException);
}

TEST_CASE("ConstraintScope", "[Constraints]") {
  REQUIRE(ParseConstraintScope("NO") == kNormalOnly);
  REQUIRE(ParseConstraintScope("IO") == kInvertedOnly);
  REQUIRE(ParseConstraintScope("Both") == kBothOrderings);
  REQUIRE_THROWS_AS(ParseConstraintScope("Either"), NuMCMCException);

  GaussianConstraint OnlyNormal("Atm", "Deltam2_32", 2.5E-3, 1E-4, kNormalOnly);
  REQUIRE(OnlyNormal.AppliesTo(kNormalOrdering));
  REQUIRE_FALSE(OnlyNormal.AppliesTo(kInvertedOrdering));
}

TEST_CASE("HistogramConstraint", "[Constraints]") {
  TH1D Hist("ConstraintHist", "", 4, 0., 1.);
  for(int i = 1; i <= 4; ++i) Hist.SetBinContent(i, 2.);
  HistogramConstraint Tabulated("Tabulated", {"SinSqTheta23"}, TabulatedDensity(Hist));

  REQUIRE(Tabulated.GetInterpolationMode() == kRegularGrid);
  REQUIRE_THAT(Tabulated.Evaluate(0.5), WithinAbs(2., 1E-12));
  // Last bin centre is 0.875, empty overflow node sits at 1.125
  REQUIRE_THAT(Tabulated.Evaluate(1.0), WithinAbs(1., 1E-12));
  REQUIRE(Tabulated.Evaluate(-0.2) == 0.);
  REQUIRE(Tabulated.Evaluate(1.2) == 0.);

  TH2D Hist2D("ConstraintHist2D", "", 2, 0., 1., 2, 0., 1.);
  REQUIRE_THROWS_AS(HistogramConstraint("Mismatch", {"SinSqTheta23"}, TabulatedDensity(Hist2D)), DimensionalityError);
  REQUIRE_THROWS_AS(HistogramConstraint("TooMany", {"A", "B", "C"}, TabulatedDensity(Hist)), DimensionalityError);
}

TEST_CASE("HistogramConstraintInterpolators", "[Constraints]") {
  // Plane z = 1 + x + 2y on every node including under and overflow
  TH2D Plane("ConstraintPlane", "", 3, 0., 3., 3, 0., 3.);
  for(int ix = 0; ix <= 4; ++ix) {
    for(int iy = 0; iy <= 4; ++iy) {
      Plane.SetBinContent(ix, iy, 1. + (ix - 0.5) + 2. * (iy - 0.5));
    }
  }
  for(const auto Mode : {kRegularGrid, kDelaunayLinear}) {
    HistogramConstraint Tabulated("Plane", {"SinSqTheta23", "DeltaCP"}, TabulatedDensity(Plane, Mode), kBothOrderings);
    REQUIRE(Tabulated.GetInterpolationMode() == Mode);
    REQUIRE_THAT(Tabulated.Evaluate(1.2, 1.7), WithinAbs(5.6, 1E-9));
    REQUIRE_THAT(Tabulated.Evaluate(0.5, 2.5), WithinAbs(6.5, 1E-9));
    REQUIRE(Tabulated.Evaluate(4.0, 1.0) == 0.);
    REQUIRE(Tabulated.Evaluate(1.0, -0.6) == 0.);
  }

  REQUIRE(ParseInterpolationMode("regular") == kRegularGrid);
  REQUIRE(ParseInterpolationMode("linear") == kDelaunayLinear);
  REQUIRE_THROWS_AS(ParseInterpolationMode("cubic"), NuMCMCException);
}

TEST_CASE("TabulatedDensityFromGraph", "[Constraints]") {
  TGraph2D Grid;
  int Point = 0;
  for(int ix = 0; ix < 3; ++ix) {
    for(int iy = 0; iy < 3; ++iy) {
      Grid.SetPoint(Point++, ix, 2. * iy, 3. + ix - iy);
    }
  }
  TabulatedDensity Table(Grid);
  REQUIRE(Table.GetXNodes().size() == 3);
  REQUIRE(Table.GetYNodes().size() == 3);
  REQUIRE_THAT(Table.Evaluate(0.5, 1.), WithinAbs(3., 1E-12));
  REQUIRE_THAT(Table.Evaluate(2., 4.), WithinAbs(3., 1E-12));
  REQUIRE(Table.Evaluate(2.5, 1.) == 0.);

  // One point short of a full grid
  TGraph2D Holes;
  for(int i = 0; i < 8; ++i) Holes.SetPoint(i, i % 3, i / 3, 1.);
  REQUIRE_THROWS_AS(TabulatedDensity(Holes), NuMCMCException);
}

TEST_CASE("Chi2GraphConstraint", "[Constraints]") {
  auto Graph = std::make_unique<TGraph>();
  Graph->SetPoint(0, 0., 4.);
  Graph->SetPoint(1, 1., 0.);
  Graph->SetPoint(2, 2., 4.);
  Chi2GraphConstraint Profile("Profile", "DeltaCP", std::move(Graph));

  REQUIRE_THAT(Profile.Evaluate(1.), WithinAbs(1., 1E-12));
  REQUIRE_THAT(Profile.Evaluate(0.), WithinAbs(std::exp(-2.), 1E-12));
  REQUIRE_THAT(Profile.Evaluate(0.5), WithinAbs(std::exp(-1.), 1E-12));
  REQUIRE(Profile.Evaluate(2.5) == 0.);

  auto Short = std::make_unique<TGraph>();
  Short->SetPoint(0, 0., 1.);
  REQUIRE_THROWS_AS(Chi2GraphConstraint("Short", "DeltaCP", std::move(Short)), NuMCMCException);
}

TEST_CASE("Chi2Graph2DOutsideHull", "[Constraints]") {
  // Triangle leaves the upper right half of its bounding box empty
  auto Triangle = std::make_unique<TGraph2D>();
  Triangle->SetPoint(0, 0., 0., 0.);
  Triangle->SetPoint(1, 2., 0., 0.);
  Triangle->SetPoint(2, 0., 2., 0.);
  Chi2GraphConstraint Profile("Triangle", {"SinSqTheta23", "DeltaCP"}, std::move(Triangle));

  REQUIRE_THAT(Profile.Evaluate(0.5, 0.5), WithinAbs(1., 1E-12));
  REQUIRE(Profile.Evaluate(1.5, 1.5) == 0.);
  REQUIRE(Profile.Evaluate(2.5, 0.5) == 0.);
}

TEST_CASE("MakeConstraintFromYAML", "[Constraints]") {
  auto Constraint = MakeConstraintFromYAML("T13Reactor", YAML::Load(
      "{Type: Gaussian, Variables: Theta13, Mean: 0.15, Sigma: 0.002, Scope: Both, AutoApply: true}"));
  REQUIRE(Constraint->GetName() == "T13Reactor");
  REQUIRE(Constraint->GetVariables() == std::vector<std::string>{"Theta13"});
  REQUIRE(Constraint->IsAutoApply());
  REQUIRE_THAT(Constraint->Evaluate(0.15), WithinAbs(1., 1E-12));

  REQUIRE_THROWS_AS(MakeConstraintFromYAML("Bad", YAML::Load("{Type: Spline, Variables: Theta13}")), NuMCMCException);
  REQUIRE_THROWS_AS(MakeConstraintFromYAML("Missing", YAML::Load("{Type: Histogram, Variables: Theta13, File: DoesNotExist.root, Object: h}")),
                    NuMCMCException);
}
