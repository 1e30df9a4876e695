#include "Priors/PriorReweighter.h"

// **************************************************
PriorReweighter::PriorReweighter(std::shared_ptr<const PriorModel> Original, std::shared_ptr<const PriorModel> Replacement)
: OriginalPrior(std::move(Original)), ReplacementPrior(std::move(Replacement)) {
// **************************************************
  CheckCompatibility();
}

// **************************************************
PriorReweighter::PriorReweighter(const PriorSpec& Original, const PriorSpec& Replacement)
: OriginalPrior(std::make_shared<const PriorModel>(Original)),
  ReplacementPrior(std::make_shared<const PriorModel>(Replacement)) {
// **************************************************
  CheckCompatibility();
}

// **************************************************
void PriorReweighter::CheckCompatibility() const {
// **************************************************
  if(!OriginalPrior || !ReplacementPrior) {
    NUMCMCLOG_ERROR("PriorReweighter needs both original and replacement prior");
    throw NuMCMCException(__FILE__, __LINE__);
  }
  const std::string& OldVar = OriginalPrior->GetSpec().Variable;
  const std::string& NewVar = ReplacementPrior->GetSpec().Variable;
  if(OldVar != NewVar) {
    NUMCMCLOG_ERROR("Trying to replace prior on {} with prior on {}", OldVar, NewVar);
    NUMCMCLOG_ERROR("Prior can only be changed for one variable at a time");
    throw DimensionalityError(__FILE__, __LINE__, "Prior replacement between " + OldVar + " and " + NewVar);
  }
  NUMCMCLOG_INFO("Reweighting {} from {} to {}", OldVar,
                 OriginalPrior->GetSpec().ToString(), ReplacementPrior->GetSpec().ToString());
}

// **************************************************
double PriorReweighter::GetWeight(const double x) const {
// **************************************************
  const double OldDensity = OriginalPrior->Density(x);
  if(OldDensity == 0.) {
    NUMCMCLOG_ERROR("Original prior {} on {} vanishes at {}", OriginalPrior->GetSpec().ToString(), GetVariable(), x);
    throw DegeneratePrior(__FILE__, __LINE__, "Original prior on " + GetVariable() + " vanishes at " + std::to_string(x));
  }
  return ReplacementPrior->Density(x) / OldDensity;
}
