#pragma once

// C++ includes
#include <memory>
#include <string>

// NuMCMC includes
#include "Priors/PriorModel.h"

/// @brief Importance weight for replacing the prior of a single physical variable
/// @details weight(x) = density_new(x) / density_old(x). Both priors must target the
/// same variable, joint replacement across variables is not supported.
class PriorReweighter {
 public:
  /// @brief Constructor
  /// @param Original Prior the chain was generated with
  /// @param Replacement Prior the user wants
  /// @throws DimensionalityError if the two priors target different variables
  PriorReweighter(std::shared_ptr<const PriorModel> Original, std::shared_ptr<const PriorModel> Replacement);

  /// @brief Convenience constructor building both models from specs
  PriorReweighter(const PriorSpec& Original, const PriorSpec& Replacement);

  /// @brief Get importance weight of a sample with value x of the variable
  /// @throws DegeneratePrior if the original density vanishes at x
  double GetWeight(const double x) const;

  /// @brief Name of reweighted variable
  inline const std::string& GetVariable() const { return OriginalPrior->GetSpec().Variable; }
  /// @brief Whether both priors are identical, weight is then always one
  inline bool IsIdentity() const { return OriginalPrior->GetSpec() == ReplacementPrior->GetSpec(); }

  inline const PriorModel& GetOriginalPrior() const { return *OriginalPrior; }
  inline const PriorModel& GetReplacementPrior() const { return *ReplacementPrior; }

 private:
  /// @brief Make sure priors are compatible
  void CheckCompatibility() const;

  /// Prior baked into the chain
  std::shared_ptr<const PriorModel> OriginalPrior;
  /// Prior requested by the user
  std::shared_ptr<const PriorModel> ReplacementPrior;
};
