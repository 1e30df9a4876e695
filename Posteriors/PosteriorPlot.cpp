#include "Posteriors/PosteriorPlot.h"

// C++ includes
#include <algorithm>

_NuMCMC_Safe_Include_Start_ //{
// ROOT includes
#include "TDirectory.h"
// fmt includes
#include "spdlog/fmt/ranges.h"
_NuMCMC_Safe_Include_End_ //}

// **************************************************
PosteriorPlot::PosteriorPlot(std::string name, std::vector<std::string> variables, Binning binning,
                             const VariableRegistry& registry, const ChainMetadata& Metadata,
                             const std::vector<PriorSpec>& PriorOverrides,
                             const std::vector<std::string>& ConstraintNames,
                             const bool SplitByOrdering,
                             const std::vector<std::shared_ptr<const EmpiricalPrior>>& Empirical)
: Name(std::move(name)), Variables(std::move(variables)), Registry(registry),
  Histogram(std::move(binning), SplitByOrdering) {
// **************************************************
  if(Variables.size() != 1 && Variables.size() != 2) {
    NUMCMCLOG_ERROR("Plot {} has {} variables, only 1D and 2D plots are supported", Name, Variables.size());
    throw DimensionalityError(__FILE__, __LINE__);
  }
  if(int(Variables.size()) != Histogram.GetBinning().GetNDimensions()) {
    NUMCMCLOG_ERROR("Plot {} has {} variables but {}D binning", Name, Variables.size(), Histogram.GetBinning().GetNDimensions());
    throw DimensionalityError(__FILE__, __LINE__);
  }
  for(const auto& Var : Variables) {
    VariableIndices.push_back(Registry.GetIndex(Var));
  }

  SetupReweighting(Metadata, PriorOverrides);
  SetupEmpiricalPriors(Metadata, Empirical);
  SetupConstraints(Metadata, ConstraintNames);
}

// **************************************************
PosteriorPlot::~PosteriorPlot() {
// **************************************************

}

// **************************************************
void PosteriorPlot::SetupReweighting(const ChainMetadata& Metadata, const std::vector<PriorSpec>& PriorOverrides) {
// **************************************************
  if(PriorOverrides.empty()) return;

  if(GetNDimensions() != 1) {
    NUMCMCLOG_ERROR("Plot {} is {}D, changing priors is only supported for 1D plots", Name, GetNDimensions());
    throw DimensionalityError(__FILE__, __LINE__, "Prior override in " + std::to_string(GetNDimensions()) + "D plot " + Name);
  }

  for(const auto& Spec : PriorOverrides) {
    if(!Registry.IsPhysical(Spec.Variable)) {
      NUMCMCLOG_ERROR("Plot {} asks for prior on {} which is not a physical parameter", Name, Spec.Variable);
      NUMCMCLOG_ERROR("Priors can only be changed for the parameters the chain was generated in");
      throw DimensionalityError(__FILE__, __LINE__, "Prior override on derived variable " + Spec.Variable);
    }
    const int Index = Registry.GetIndex(Spec.Variable);
    if(std::find(ReweightIndices.begin(), ReweightIndices.end(), Index) != ReweightIndices.end()) {
      NUMCMCLOG_ERROR("Plot {} has more than one prior override for {}", Name, Spec.Variable);
      throw NuMCMCException(__FILE__, __LINE__);
    }
    auto Replacement = std::make_shared<const PriorModel>(Spec);
    Reweighters.push_back(std::make_unique<PriorReweighter>(Metadata.GetPrior(Spec.Variable), Replacement));
    ReweightIndices.push_back(Index);
  }
}

// **************************************************
void PosteriorPlot::SetupEmpiricalPriors(const ChainMetadata& Metadata, const std::vector<std::shared_ptr<const EmpiricalPrior>>& Priors) {
// **************************************************
  for(const auto& Prior : Priors) {
    std::array<int, 2> Indices = {-1, -1};
    std::array<std::shared_ptr<const PriorModel>, 2> Replaced;
    for(int i = 0; i < Prior->GetDimension(); ++i) {
      const std::string& Var = Prior->GetVariables()[i];
      if(!Registry.IsPhysical(Var)) {
        NUMCMCLOG_ERROR("Plot {} asks for {} but {} is not a physical parameter", Name, Prior->ToString(), Var);
        throw DimensionalityError(__FILE__, __LINE__, "Empirical prior on derived variable " + Var);
      }
      const int Index = Registry.GetIndex(Var);
      const bool Overridden = std::find(ReweightIndices.begin(), ReweightIndices.end(), Index) != ReweightIndices.end();
      bool Taken = false;
      for(const auto& Other : EmpiricalIndices) {
        if(Other[0] == Index || Other[1] == Index) Taken = true;
      }
      if(Overridden || Taken) {
        NUMCMCLOG_ERROR("Plot {} has more than one prior replacement for {}", Name, Var);
        throw NuMCMCException(__FILE__, __LINE__);
      }
      Indices[i] = Index;
      Replaced[i] = Metadata.GetPrior(Var);
    }
    EmpiricalPriors.push_back(Prior);
    EmpiricalIndices.push_back(Indices);
    ReplacedPriors.push_back(Replaced);
  }
}

// **************************************************
double PosteriorPlot::GetEmpiricalWeight(const Sample& Step) const {
// **************************************************
  double Weight = NuMCMC::Unity;
  for(size_t i = 0; i < EmpiricalPriors.size(); ++i) {
    const double x = Registry.Evaluate(EmpiricalIndices[i][0], Step);
    const double y = (EmpiricalIndices[i][1] >= 0) ? Registry.Evaluate(EmpiricalIndices[i][1], Step) : 0.;
    double OldDensity = ReplacedPriors[i][0]->Density(x);
    if(ReplacedPriors[i][1]) OldDensity *= ReplacedPriors[i][1]->Density(y);
    if(OldDensity == 0.) {
      NUMCMCLOG_ERROR("Chain prior replaced by {} vanishes at ({}, {})", EmpiricalPriors[i]->ToString(), x, y);
      throw DegeneratePrior(__FILE__, __LINE__, "Chain prior replaced by " + EmpiricalPriors[i]->ToString() + " vanishes");
    }
    Weight *= EmpiricalPriors[i]->Density(x, y) / OldDensity;
  }
  return Weight;
}

// **************************************************
void PosteriorPlot::SetupConstraints(const ChainMetadata& Metadata, const std::vector<std::string>& ConstraintNames) {
// **************************************************
  for(const auto& Constraint : Metadata.GetConstraints()) {
    const bool Requested = std::find(ConstraintNames.begin(), ConstraintNames.end(), Constraint->GetName()) != ConstraintNames.end();
    if(Constraint->IsAutoApply() || Requested) {
      Constraints.push_back(Constraint);
    }
  }
  // Make sure every requested constraint exists
  for(const auto& ConstraintName : ConstraintNames) {
    Metadata.GetConstraint(ConstraintName);
  }

  for(const auto& Constraint : Constraints) {
    std::array<int, 2> Indices = {-1, -1};
    for(int i = 0; i < Constraint->GetDimension(); ++i) {
      Indices[i] = Registry.GetIndex(Constraint->GetVariables()[i]);
    }
    ConstraintIndices.push_back(Indices);
    NUMCMCLOG_DEBUG("Plot {} uses constraint {}", Name, Constraint->GetName());
  }
}

// **************************************************
double PosteriorPlot::GetWeight(const Sample& Step) const {
// **************************************************
  double Weight = NuMCMC::Unity;
  for(size_t i = 0; i < Reweighters.size(); ++i) {
    Weight *= Reweighters[i]->GetWeight(Step.Physical[ReweightIndices[i]]);
  }
  if(!EmpiricalPriors.empty()) Weight *= GetEmpiricalWeight(Step);

  const MassOrdering Ordering = Step.GetMassOrdering();
  for(size_t i = 0; i < Constraints.size(); ++i) {
    if(!Constraints[i]->AppliesTo(Ordering)) continue;
    const double x = Registry.Evaluate(ConstraintIndices[i][0], Step);
    const double y = (ConstraintIndices[i][1] >= 0) ? Registry.Evaluate(ConstraintIndices[i][1], Step) : 0.;
    Weight *= Constraints[i]->Evaluate(x, y);
  }
  return Weight;
}

// **************************************************
std::array<double, 2> PosteriorPlot::GetCoordinates(const Sample& Step) const {
// **************************************************
  std::array<double, 2> Point = {Registry.Evaluate(VariableIndices[0], Step), 0.};
  if(VariableIndices.size() == 2) Point[1] = Registry.Evaluate(VariableIndices[1], Step);
  return Point;
}

// **************************************************
void PosteriorPlot::Fill(const SampleBatch& Batch) {
// **************************************************
  if(IsNormalised()) {
    NUMCMCLOG_ERROR("Plot {} was already normalised, no filling allowed", Name);
    throw NuMCMCException(__FILE__, __LINE__);
  }
  Histogram.FillBatch(Batch,
                      [this](const Sample& Step) { return GetCoordinates(Step); },
                      [this](const Sample& Step) { return GetWeight(Step); });
}

// **************************************************
const PosteriorDensity& PosteriorPlot::Normalise() {
// **************************************************
  if(!IsNormalised()) {
    if(Histogram.GetNMalformed() > 0) {
      NUMCMCLOG_WARN("Plot {} skipped {} malformed samples", Name, Histogram.GetNMalformed());
    }
    Density = std::make_unique<PosteriorDensity>(Histogram);
  }
  return *Density;
}

// **************************************************
const PosteriorDensity& PosteriorPlot::GetDensity() const {
// **************************************************
  if(!IsNormalised()) {
    NUMCMCLOG_ERROR("Plot {} wasn't normalised yet", Name);
    throw NuMCMCException(__FILE__, __LINE__);
  }
  return *Density;
}

// **************************************************
const std::vector<CredibleRegion>& PosteriorPlot::MakeCredibleRegions(const std::vector<double>& Levels,
                                                                      const bool CredibleInSigmas, const bool Combine) {
// **************************************************
  Regions = GetCredibleRegions(Normalise(), Levels, CredibleInSigmas, Combine);
  return Regions;
}

// **************************************************
std::string PosteriorPlot::GetPartitionName(const int Partition) const {
// **************************************************
  return Histogram.IsSplit() ? MassOrdering_ToString(MassOrdering(Partition)) : "All";
}

// **************************************************
void PosteriorPlot::Write(TDirectory* Dir) const {
// **************************************************
  const PosteriorDensity& Dens = GetDensity();
  Dir->cd();

  for(int p = 0; p < Dens.GetNPartitions(); ++p) {
    auto Hist = Dens.ToHistogram(Name + "_Density_" + GetPartitionName(p), p);
    Hist->GetXaxis()->SetTitle(Variables[0].c_str());
    if(GetNDimensions() == 2) Hist->GetYaxis()->SetTitle(Variables[1].c_str());
    Hist->Write();
  }
  if(Dens.IsSplit()) {
    auto Hist = Dens.ToHistogram(Name + "_Density_Combined", 0, true);
    Hist->Write();
  }

  for(const auto& Region : Regions) {
    const std::string Suffix = Region.Combined ? "Combined" : GetPartitionName(Region.Partition);
    auto Hist = MakeRegionHistogram(Dens, Region, fmt::format("{}_Credible_{:.2f}_{}", Name, 100. * Region.Level, Suffix));
    Hist->Write();
  }
}

// **************************************************
void PosteriorPlot::Print() const {
// **************************************************
  NUMCMCLOG_INFO("Plot {} of {}", Name, fmt::join(Variables, " vs "));
  for(const auto& Reweighter : Reweighters) {
    NUMCMCLOG_INFO("  prior on {} changed from {} to {}", Reweighter->GetVariable(),
                   Reweighter->GetOriginalPrior().GetSpec().ToString(),
                   Reweighter->GetReplacementPrior().GetSpec().ToString());
  }
  for(const auto& Prior : EmpiricalPriors) {
    NUMCMCLOG_INFO("  chain prior replaced by {}", Prior->ToString());
  }
  for(const auto& Constraint : Constraints) {
    NUMCMCLOG_INFO("  constrained by {} ({})", Constraint->GetName(), ConstraintScope_ToString(Constraint->GetScope()));
  }
  NUMCMCLOG_INFO("  in range weight {:.4g}, out of range weight {:.4g}, malformed samples {}",
                 Histogram.GetInRangeWeight(), Histogram.GetOutOfRangeWeight(), Histogram.GetNMalformed());
  for(const auto& Region : Regions) {
    NUMCMCLOG_INFO("  {:.2f}% region ({}): {} bins, mass {:.4f}, threshold {:.4g}{}", 100. * Region.Level,
                   Region.Combined ? "Combined" : GetPartitionName(Region.Partition),
                   Region.GetNBins(), Region.Mass, Region.Threshold, Region.Reached ? "" : ", level not reached");
  }
}
