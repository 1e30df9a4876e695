#include "Chains/ChainSampleSource.h"

#include "catch2/catch_test_macros.hpp"
#include "catch2/matchers/catch_matchers_floating_point.hpp"

_NuMCMC_Safe_Include_Start_ //{
#include "TFile.h"
#include "TMacro.h"
#include "TTree.h"
_NuMCMC_Safe_Include_End_ //}

using namespace Catch::Matchers;

namespace {
  /// Write 20 steps to tree "posteriors", DeltaCP optionally stored as Float_t
  void WriteChain(const std::string& FileName, const std::string& MetadataText, const bool FloatDeltaCP = false) {
    auto OutFile = std::unique_ptr<TFile>(TFile::Open(FileName.c_str(), "RECREATE"));
    // Owned by the file
    TTree* Tree = new TTree("posteriors", "posteriors");
    PhysicalValues Values;
    Float_t DeltaCPFloat = 0.f;
    for(int i = 0; i < kNPhysicalParameters; ++i) {
      const std::string Name = PhysicalParameter_ToString(PhysicalParameter(i));
      if(i == kDeltaCP && FloatDeltaCP) {
        Tree->Branch(Name.c_str(), &DeltaCPFloat, (Name + "/F").c_str());
      } else {
        Tree->Branch(Name.c_str(), &Values[i], (Name + "/D").c_str());
      }
    }
    for(int n = 0; n < 20; ++n) {
      Values = {0.1 * n, 0.15, 0.8, 0.58, (n % 2 == 0) ? 2.5E-3 : -2.5E-3, 7.5E-5};
      DeltaCPFloat = Float_t(Values[kDeltaCP]);
      Tree->Fill();
    }
    Tree->Write();
    if(!MetadataText.empty()) {
      TMacro Macro("NuMCMC_Metadata", "NuMCMC_Metadata");
      Macro.AddLine(MetadataText.c_str());
      Macro.Write();
    }
    OutFile->Close();
  }
}

TEST_CASE("ChainSampleSourceReads", "[ChainSampleSource]") {
  WriteChain("ChainSampleSourceTest.root", "{Priors: {Theta23: 'Uniform:sin^2(x)'}, Citation: Test chain}");
  ChainSampleSource Source({"ChainSampleSourceTest.root"}, "posteriors");

  REQUIRE(Source.GetNEntries() == 20);
  REQUIRE(Source.GetMetadata().GetPrior(kTheta23)->GetSpec().Transform == kSinSq);
  REQUIRE(Source.GetMetadata().GetCitation() == "Test chain");

  SampleBatch Batch;
  REQUIRE(Source.NextBatch(Batch, 8) == 8);
  REQUIRE_THAT(Batch[3].Get(kDeltaCP), WithinAbs(0.3, 1E-12));
  REQUIRE(Batch[3].GetMassOrdering() == kInvertedOrdering);
  REQUIRE(Source.NextBatch(Batch, 100) == 12);
  REQUIRE(Source.NextBatch(Batch, 100) == 0);

  REQUIRE_THROWS_AS(ChainSampleSource({"ChainSampleSourceTest.root"}, "NoSuchTree"), NuMCMCException);
}

TEST_CASE("ChainSampleSourceBadMetadata", "[ChainSampleSource]") {
  // Unbalanced bracket, not YAML at all
  WriteChain("ChainSampleSourceBadYAML.root", "Priors: [Theta23");
  ChainSampleSource Unparsable({"ChainSampleSourceBadYAML.root"}, "posteriors");
  REQUIRE(Unparsable.GetMetadata().GetPrior(kTheta23)->GetSpec().ToString() == "Uniform:x");

  WriteChain("ChainSampleSourceBadPrior.root", "{Priors: {Theta23: 'Gaussian(1):x'}}");
  ChainSampleSource BadPrior({"ChainSampleSourceBadPrior.root"}, "posteriors");
  REQUIRE(BadPrior.GetMetadata().GetPrior(kTheta23)->GetSpec().ToString() == "Uniform:x");

  // Metadata from config wins over the file
  ChainSampleSource FromConfig({"ChainSampleSourceBadYAML.root"}, "posteriors", YAML::Load("{Priors: {Theta13: 'Uniform:sin^2(2x)'}}"));
  REQUIRE(FromConfig.GetMetadata().GetPrior(kTheta13)->GetSpec().Transform == kSinSq2x);
}

TEST_CASE("ChainSampleSourceBranchType", "[ChainSampleSource]") {
  WriteChain("ChainSampleSourceFloat.root", "", true);
  REQUIRE_THROWS_AS(ChainSampleSource({"ChainSampleSourceFloat.root"}, "posteriors"), NuMCMCException);
}
