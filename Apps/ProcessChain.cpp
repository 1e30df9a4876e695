// C++ includes
#include <memory>
#include <string>
#include <vector>

// NuMCMC includes
#include "Manager/Manager.h"
#include "Chains/ChainSampleSource.h"
#include "Posteriors/PlotStack.h"

_NuMCMC_Safe_Include_Start_ //{
// ROOT includes
#include "TFile.h"
_NuMCMC_Safe_Include_End_ //}

/// @file ProcessChain.cpp
/// @brief Turn an oscillation chain into posterior densities and credible regions
///
/// Usage: ProcessChain config.yaml [Section:Key=Value ...]
/// @code
/// General:
///   OutputFile: Posteriors.root
///   BatchSize: 100000
///   MaxEntries: -1
///   LogLevel: info
/// Chain:
///   Files: [chain.root]
///   TreeName: posteriors
/// DerivedVariables: [SinSqTheta23]
/// Plots:
///   - Name: SinSqTheta23
///     Variables: [SinSqTheta23]
///     Binning: {axes: [{linspace: {n: 50, low: 0.3, high: 0.7}}]}
///     Priors: {Theta23: "Uniform:sin^2(x)"}
///     SplitByOrdering: true
/// Credible:
///   Levels: [1, 2, 3]
///   InSigmas: true
///   CombineOrderings: true
/// @endcode

/// @brief Run full chain processing
void ProcessChain(manager* Manager);

int main(int argc, char *argv[])
{
  SetNuMCMCLoggerFormat();
  NuMCMCUtils::NuMCMCUsage(argc, argv);

  auto Manager = std::make_unique<manager>(argv[1]);
  std::vector<std::string> Overrides;
  for(int i = 2; i < argc; ++i) {
    Overrides.push_back(argv[i]);
  }
  Manager->ApplyOverrides(Overrides);

  ProcessChain(Manager.get());

  return 0;
}

// **************************************************
void ProcessChain(manager* Manager) {
// **************************************************
  const YAML::Node& Settings = Manager->raw();

  const std::string OutputFileName = GetFromManager<std::string>(Settings["General"]["OutputFile"], "NuMCMC_Posteriors.root", __FILE__, __LINE__);
  const int BatchSize = GetFromManager<int>(Settings["General"]["BatchSize"], NuMCMC::DefaultBatchSize, __FILE__, __LINE__);
  const Long64_t MaxEntries = GetFromManager<Long64_t>(Settings["General"]["MaxEntries"], -1, __FILE__, __LINE__);
  if(BatchSize <= 0) {
    NUMCMCLOG_ERROR("General:BatchSize has to be positive, got {}", BatchSize);
    throw NuMCMCException(__FILE__, __LINE__);
  }

  if(!CheckNodeExists(Settings, "Chain", "Files")) {
    NUMCMCLOG_ERROR("Config has no Chain:Files");
    throw NuMCMCException(__FILE__, __LINE__);
  }
  const auto Files = NMGet(std::vector<std::string>, Settings["Chain"]["Files"]);
  const std::string TreeName = GetFromManager<std::string>(Settings["Chain"]["TreeName"], "posteriors", __FILE__, __LINE__);
  YAML::Node MetadataNode;
  if(CheckNodeExists(Settings, "Chain", "Metadata")) MetadataNode = Settings["Chain"]["Metadata"];

  auto Source = std::make_shared<ChainSampleSource>(Files, TreeName, MetadataNode);

  PlotStack Stack(Source);
  Stack.RegisterVariablesFromYAML(Settings["DerivedVariables"]);
  Stack.AddPlotsFromYAML(Settings["Plots"]);

  Stack.FillPlots(MaxEntries, size_t(BatchSize));

  if(CheckNodeExists(Settings, "Credible")) {
    const auto Levels = GetFromManager<std::vector<double>>(Settings["Credible"]["Levels"], {0.6827, 0.9545}, __FILE__, __LINE__);
    const bool InSigmas = GetFromManager<bool>(Settings["Credible"]["InSigmas"], false, __FILE__, __LINE__);
    const bool Combine = GetFromManager<bool>(Settings["Credible"]["CombineOrderings"], false, __FILE__, __LINE__);
    Stack.MakeCredibleRegions(Levels, InSigmas, Combine);
  }

  auto OutputFile = std::unique_ptr<TFile>(TFile::Open(OutputFileName.c_str(), "RECREATE"));
  if(!OutputFile || OutputFile->IsZombie()) {
    NUMCMCLOG_ERROR("Couldn't open output file {}", OutputFileName);
    throw NuMCMCException(__FILE__, __LINE__);
  }
  Manager->SaveSettings(OutputFile.get());
  Stack.Write(OutputFile.get());

  const std::string& Citation = Source->GetMetadata().GetCitation();
  if(!Citation.empty()) {
    NUMCMCLOG_INFO("Chain released by: {}", Citation);
  }
  OutputFile->Close();
  NUMCMCLOG_INFO("Posteriors written to {}", OutputFileName);
}
