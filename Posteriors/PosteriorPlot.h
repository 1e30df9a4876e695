#pragma once

// C++ includes
#include <memory>
#include <string>
#include <vector>

// NuMCMC includes
#include "Chains/VariableRegistry.h"
#include "Chains/ChainMetadata.h"
#include "Priors/PriorReweighter.h"
#include "Priors/EmpiricalPrior.h"
#include "Posteriors/CredibleRegion.h"

class TDirectory;

/// @brief Single 1D or 2D posterior of a chain
/// @details Lifecycle is create, Fill any number of batches, Normalise, build credible regions.
/// Once normalised the plot is frozen and can't be filled anymore.
/// Sample weight is the product of prior reweighting factors for every overridden physical
/// parameter, of every empirical prior divided by the chain priors it replaces and of every
/// constraint applicable to the sample's mass ordering.
class PosteriorPlot {
 public:
  /// @brief Constructor
  /// @param Name Name used for output histograms
  /// @param Variables One or two variables to plot
  /// @param binning Bin edges, dimension has to match number of variables
  /// @param Registry Variables available, has to outlive the plot
  /// @param Metadata Chain priors and constraints
  /// @param PriorOverrides Replacement priors, only for physical parameters and only in 1D plots
  /// @param ConstraintNames Constraints from metadata to apply in addition to the auto applied ones
  /// @param SplitByOrdering Keep normal and inverted ordering separate
  /// @param EmpiricalPriors Tabulated priors replacing the chain priors of their physical parameters
  /// @throws DimensionalityError for prior overrides in 2D plots or on derived variables
  PosteriorPlot(std::string Name, std::vector<std::string> Variables, Binning binning,
                const VariableRegistry& Registry, const ChainMetadata& Metadata,
                const std::vector<PriorSpec>& PriorOverrides = {},
                const std::vector<std::string>& ConstraintNames = {},
                const bool SplitByOrdering = false,
                const std::vector<std::shared_ptr<const EmpiricalPrior>>& EmpiricalPriors = {});
  /// @brief Destructor
  virtual ~PosteriorPlot();

  /// @brief Accumulate batch of chain steps
  /// @throws NuMCMCException if plot was already normalised
  void Fill(const SampleBatch& Batch);

  /// @brief Turn histogram into density and freeze the plot
  const PosteriorDensity& Normalise();

  /// @brief Build credible regions, normalises plot if needed
  /// @param Levels Probability levels or number of sigmas
  /// @param CredibleInSigmas Interpret levels as sigmas
  /// @param Combine Also build union over orderings for split plots
  const std::vector<CredibleRegion>& MakeCredibleRegions(const std::vector<double>& Levels,
                                                         const bool CredibleInSigmas = false, const bool Combine = false);

  /// @brief Weight of a single step
  double GetWeight(const Sample& Step) const;
  /// @brief Coordinates of a single step in plotted variables
  std::array<double, 2> GetCoordinates(const Sample& Step) const;

  /// @brief Write density and region histograms to directory
  void Write(TDirectory* Dir) const;

  /// @brief Log summary of plot
  void Print() const;

  inline const std::string& GetName() const { return Name; }
  inline const std::vector<std::string>& GetVariables() const { return Variables; }
  inline int GetNDimensions() const { return int(Variables.size()); }
  inline bool IsNormalised() const { return Density != nullptr; }
  inline const WeightedHistogram& GetHistogram() const { return Histogram; }
  /// @throws NuMCMCException if plot was not normalised yet
  const PosteriorDensity& GetDensity() const;
  inline const std::vector<CredibleRegion>& GetCredibleRegions() const { return Regions; }
  inline const std::vector<std::unique_ptr<PriorReweighter>>& GetReweighters() const { return Reweighters; }
  inline const std::vector<std::shared_ptr<const ExternalConstraint>>& GetConstraints() const { return Constraints; }
  inline const std::vector<std::shared_ptr<const EmpiricalPrior>>& GetEmpiricalPriors() const { return EmpiricalPriors; }

 private:
  /// @brief Prepare prior reweighting
  void SetupReweighting(const ChainMetadata& Metadata, const std::vector<PriorSpec>& PriorOverrides);
  /// @brief Prepare empirical priors
  void SetupEmpiricalPriors(const ChainMetadata& Metadata, const std::vector<std::shared_ptr<const EmpiricalPrior>>& Priors);
  /// @brief Weight of empirical priors relative to the chain priors they replace
  double GetEmpiricalWeight(const Sample& Step) const;
  /// @brief Prepare constraints
  void SetupConstraints(const ChainMetadata& Metadata, const std::vector<std::string>& ConstraintNames);
  /// @brief Name of partition used in output
  std::string GetPartitionName(const int Partition) const;

  /// Name of plot
  std::string Name;
  /// Plotted variables
  std::vector<std::string> Variables;
  /// Registry used to evaluate variables
  const VariableRegistry& Registry;
  /// Registry index of plotted variables
  std::vector<int> VariableIndices;

  /// Prior reweighting per overridden physical parameter
  std::vector<std::unique_ptr<PriorReweighter>> Reweighters;
  /// Physical parameter reweighted by each reweighter
  std::vector<int> ReweightIndices;
  /// Empirical priors used by this plot
  std::vector<std::shared_ptr<const EmpiricalPrior>> EmpiricalPriors;
  /// Physical parameters of each empirical prior, second is -1 for 1D
  std::vector<std::array<int, 2>> EmpiricalIndices;
  /// Chain priors replaced by each empirical prior
  std::vector<std::array<std::shared_ptr<const PriorModel>, 2>> ReplacedPriors;
  /// Constraints used by this plot
  std::vector<std::shared_ptr<const ExternalConstraint>> Constraints;
  /// Registry indices of constraint variables, second is -1 for 1D
  std::vector<std::array<int, 2>> ConstraintIndices;

  /// Accumulated weights
  WeightedHistogram Histogram;
  /// Normalised density, set once plot is frozen
  std::unique_ptr<PosteriorDensity> Density;
  /// Credible regions
  std::vector<CredibleRegion> Regions;
};
