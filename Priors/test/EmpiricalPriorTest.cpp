#include "Priors/EmpiricalPrior.h"

#include "catch2/catch_test_macros.hpp"
#include "catch2/matchers/catch_matchers_floating_point.hpp"

_NuMCMC_Safe_Include_Start_ //{
#include "TFile.h"
#include "TH1D.h"
#include "TH2D.h"
_NuMCMC_Safe_Include_End_ //}

using namespace Catch::Matchers;

TEST_CASE("EmpiricalPrior1D", "[EmpiricalPrior]") {
  // Triangular prior peaking at 0.5
  TH1D Hist("EmpiricalTriangle", "", 2, 0., 1.);
  Hist.SetBinContent(0, 0.);
  Hist.SetBinContent(1, 1.);
  Hist.SetBinContent(2, 1.);
  Hist.SetBinContent(3, 0.);
  EmpiricalPrior Prior({"SinSqTheta23"}, TabulatedDensity(Hist, kDelaunayLinear));

  REQUIRE(Prior.GetDimension() == 1);
  REQUIRE(Prior.ToString() == "Empirical(linear) on SinSqTheta23");
  REQUIRE_THAT(Prior.Density(0.5), WithinAbs(1., 1E-12));
  REQUIRE_THAT(Prior.Density(0.125), WithinAbs(0.75, 1E-12));
  REQUIRE_THAT(Prior.Density(0.), WithinAbs(0.5, 1E-12));
  REQUIRE(Prior.Density(-0.3) == 0.);

  TH2D Hist2D("EmpiricalWrongDim", "", 2, 0., 1., 2, 0., 1.);
  REQUIRE_THROWS_AS(EmpiricalPrior({"Theta23"}, TabulatedDensity(Hist2D)), DimensionalityError);
  REQUIRE_THROWS_AS(EmpiricalPrior({"Theta23", "Theta23"}, TabulatedDensity(Hist2D)), InvalidPriorParameters);
}

TEST_CASE("EmpiricalPriorFromYAML", "[EmpiricalPrior]") {
  const std::string FileName = "EmpiricalPriorTest.root";
  {
    auto OutFile = std::unique_ptr<TFile>(TFile::Open(FileName.c_str(), "RECREATE"));
    TH2D Flat("h_T23_DCP", "", 4, 0., 1., 4, -3.2, 3.2);
    Flat.SetDirectory(nullptr);
    for(int ix = 0; ix <= 5; ++ix) {
      for(int iy = 0; iy <= 5; ++iy) {
        Flat.SetBinContent(ix, iy, 2.);
      }
    }
    OutFile->WriteObject(&Flat, "h_T23_DCP");
    OutFile->Close();
  }

  auto Prior = MakeEmpiricalPriorFromYAML(YAML::Load(
      "{Variables: [Theta23, DeltaCP], File: EmpiricalPriorTest.root, Object: h_T23_DCP}"));
  REQUIRE(Prior->GetDimension() == 2);
  REQUIRE(Prior->GetTable().GetMode() == kDelaunayLinear);
  REQUIRE_THAT(Prior->Density(0.4, 0.1), WithinAbs(2., 1E-9));
  REQUIRE(Prior->Density(0.4, 5.) == 0.);

  auto Regular = MakeEmpiricalPriorFromYAML(YAML::Load(
      "{Variables: [Theta23, DeltaCP], File: EmpiricalPriorTest.root, Object: h_T23_DCP, Interpolator: regular}"));
  REQUIRE(Regular->GetTable().GetMode() == kRegularGrid);
  REQUIRE_THAT(Regular->Density(0.4, 0.1), WithinAbs(2., 1E-12));

  REQUIRE_THROWS_AS(MakeEmpiricalPriorFromYAML(YAML::Load(
      "{Variables: [Theta23, DeltaCP], File: EmpiricalPriorTest.root, Object: h_T23_DCP, Interpolator: cubic}")), NuMCMCException);
  REQUIRE_THROWS_AS(MakeEmpiricalPriorFromYAML(YAML::Load(
      "{Variables: [Theta23, DeltaCP], File: EmpiricalPriorTest.root, Object: missing}")), NuMCMCException);
  REQUIRE_THROWS_AS(MakeEmpiricalPriorFromYAML(YAML::Load(
      "{Variables: [Theta23, DeltaCP, Theta13], File: EmpiricalPriorTest.root, Object: h_T23_DCP}")), DimensionalityError);
}
