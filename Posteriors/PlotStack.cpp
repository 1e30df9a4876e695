#include "Posteriors/PlotStack.h"

// C++ includes
#include <algorithm>

_NuMCMC_Safe_Include_Start_ //{
// ROOT includes
#include "TDirectory.h"
#include "TStopwatch.h"
_NuMCMC_Safe_Include_End_ //}

// **************************************************
PlotStack::PlotStack(std::shared_ptr<SampleSource> source) : Source(std::move(source)) {
// **************************************************
  if(!Source) {
    NUMCMCLOG_ERROR("PlotStack needs a sample source");
    throw NuMCMCException(__FILE__, __LINE__);
  }
}

// **************************************************
PlotStack::~PlotStack() {
// **************************************************

}

// **************************************************
void PlotStack::RegisterVariablesFromYAML(const YAML::Node& Node) {
// **************************************************
  if(!Node) return;
  for(const auto& Name : NMGet(std::vector<std::string>, Node)) {
    Registry.RegisterStandardVariable(Name);
  }
}

// **************************************************
PosteriorPlot& PlotStack::AddPlot(const std::string& Name, const std::vector<std::string>& Variables, Binning binning,
                                  const std::vector<PriorSpec>& PriorOverrides,
                                  const std::vector<std::string>& ConstraintNames,
                                  const bool SplitByOrdering,
                                  const std::vector<std::shared_ptr<const EmpiricalPrior>>& EmpiricalPriors) {
// **************************************************
  for(const auto& Plot : Plots) {
    if(Plot->GetName() == Name) {
      NUMCMCLOG_ERROR("Plot {} already exists", Name);
      throw NuMCMCException(__FILE__, __LINE__);
    }
  }
  Plots.push_back(std::make_unique<PosteriorPlot>(Name, Variables, std::move(binning), Registry, Source->GetMetadata(),
                                                  PriorOverrides, ConstraintNames, SplitByOrdering, EmpiricalPriors));
  return *Plots.back();
}

// **************************************************
void PlotStack::AddPlotsFromYAML(const YAML::Node& Node) {
// **************************************************
  if(!Node || !Node.IsSequence()) {
    NUMCMCLOG_ERROR("Plots have to be given as a list");
    throw NuMCMCException(__FILE__, __LINE__);
  }
  for(const auto& PlotNode : Node) {
    const auto Variables = NMGet(std::vector<std::string>, PlotNode["Variables"]);
    std::string DefaultName = "";
    for(const auto& Var : Variables) DefaultName += (DefaultName.empty() ? "" : "_") + Var;
    const std::string Name = GetFromManager<std::string>(PlotNode["Name"], DefaultName, __FILE__, __LINE__);

    if(!CheckNodeExists(PlotNode, "Binning")) {
      NUMCMCLOG_ERROR("Plot {} has no Binning", Name);
      throw NuMCMCException(__FILE__, __LINE__);
    }

    std::vector<PriorSpec> PriorOverrides;
    if(PlotNode["Priors"]) {
      for(const auto& PriorNode : PlotNode["Priors"]) {
        PriorOverrides.push_back(MakePriorSpecFromYAML(PriorNode.first.as<std::string>(), PriorNode.second));
      }
    }
    std::vector<std::shared_ptr<const EmpiricalPrior>> EmpiricalPriors;
    if(PlotNode["EmpiricalPriors"]) {
      for(const auto& PriorNode : PlotNode["EmpiricalPriors"]) {
        EmpiricalPriors.push_back(MakeEmpiricalPriorFromYAML(PriorNode));
      }
    }
    const auto ConstraintNames = GetFromManager<std::vector<std::string>>(PlotNode["Constraints"], {}, __FILE__, __LINE__);
    const bool Split = GetFromManager<bool>(PlotNode["SplitByOrdering"], false, __FILE__, __LINE__);

    AddPlot(Name, Variables, Binning(PlotNode["Binning"]), PriorOverrides, ConstraintNames, Split, EmpiricalPriors);
  }
}

// **************************************************
void PlotStack::FillPlots(const Long64_t MaxEntries, const size_t BatchSize) {
// **************************************************
  if(Plots.empty()) {
    NUMCMCLOG_WARN("No plots to fill");
    return;
  }
  if(BatchSize == 0) {
    NUMCMCLOG_ERROR("Batch size has to be positive");
    throw NuMCMCException(__FILE__, __LINE__);
  }
  Registry.Lock();

  const Long64_t nEntries = (MaxEntries >= 0) ? std::min(MaxEntries, Source->GetNEntries()) : Source->GetNEntries();
  NUMCMCLOG_INFO("Filling {} plots from {} steps in batches of {}", Plots.size(), nEntries, BatchSize);

  TStopwatch clock;
  clock.Start();

  Source->Reset();
  SampleBatch Batch;
  Long64_t nRead = 0;
  while(nRead < nEntries) {
    const size_t Want = size_t(std::min(Long64_t(BatchSize), nEntries - nRead));
    const size_t Got = Source->NextBatch(Batch, Want);
    if(Got == 0) break;
    for(auto& Plot : Plots) {
      Plot->Fill(Batch);
    }
    nRead += Long64_t(Got);
  }
  clock.Stop();
  NUMCMCLOG_INFO("Filling took {:.2f}s to finish for {} steps", clock.RealTime(), nRead);

  for(auto& Plot : Plots) {
    Plot->Normalise();
  }
}

// **************************************************
void PlotStack::MakeCredibleRegions(const std::vector<double>& Levels, const bool CredibleInSigmas, const bool Combine) {
// **************************************************
  for(auto& Plot : Plots) {
    Plot->MakeCredibleRegions(Levels, CredibleInSigmas, Combine);
    Plot->Print();
  }
}

// **************************************************
void PlotStack::Write(TDirectory* Dir) const {
// **************************************************
  for(const auto& Plot : Plots) {
    Plot->Write(Dir);
  }
}

// **************************************************
PosteriorPlot& PlotStack::GetPlot(const std::string& Name) {
// **************************************************
  for(auto& Plot : Plots) {
    if(Plot->GetName() == Name) return *Plot;
  }
  NUMCMCLOG_ERROR("Plot {} doesn't exist", Name);
  throw NuMCMCException(__FILE__, __LINE__);
}
