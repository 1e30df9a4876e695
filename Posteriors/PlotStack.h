#pragma once

// C++ includes
#include <memory>
#include <string>
#include <vector>

// NuMCMC includes
#include "Chains/SampleSource.h"
#include "Posteriors/PosteriorPlot.h"

class TDirectory;

/// @brief Collection of plots filled together in a single pass over a chain
/// @details Owns the variable registry all its plots evaluate against. Derived
/// variables have to be registered before FillPlots, afterwards the registry is locked.
class PlotStack {
 public:
  /// @brief Constructor
  /// @param Source Chain to read from
  explicit PlotStack(std::shared_ptr<SampleSource> Source);
  /// @brief Destructor
  virtual ~PlotStack();

  PlotStack(const PlotStack&) = delete;
  PlotStack& operator=(const PlotStack&) = delete;

  /// @brief Registry to add derived variables to
  inline VariableRegistry& GetRegistry() { return Registry; }

  /// @brief Register standard variables listed in config
  /// @code
  /// DerivedVariables: [SinSqTheta23, JarlskogInvariant]
  /// @endcode
  void RegisterVariablesFromYAML(const YAML::Node& Node);

  /// @brief Add a plot
  /// @return Reference to the new plot
  PosteriorPlot& AddPlot(const std::string& Name, const std::vector<std::string>& Variables, Binning binning,
                         const std::vector<PriorSpec>& PriorOverrides = {},
                         const std::vector<std::string>& ConstraintNames = {},
                         const bool SplitByOrdering = false,
                         const std::vector<std::shared_ptr<const EmpiricalPrior>>& EmpiricalPriors = {});

  /// @brief Add plots from config
  /// @code
  /// Plots:
  ///   - Name: Theta23
  ///     Variables: [Theta23]
  ///     Binning: {axes: [{linspace: {n: 50, low: 0, high: 1.5708}}]}
  ///     Priors: {Theta23: "Uniform:sin^2(x)"}
  ///     Constraints: [T13Reactor]
  ///     SplitByOrdering: true
  ///   - Name: Theta23_DeltaCP
  ///     Variables: [Theta23, DeltaCP]
  ///     Binning: {axes: [{linspace: {n: 50, low: 0, high: 1.5708}}, {linspace: {n: 50, low: -3.1416, high: 3.1416}}]}
  ///     EmpiricalPriors:
  ///       - {Variables: [Theta23, DeltaCP], File: Priors.root, Object: h_T23_DCP, Interpolator: linear}
  /// @endcode
  void AddPlotsFromYAML(const YAML::Node& Node);

  /// @brief Read the chain once and fill every plot, then normalise them
  /// @param MaxEntries Number of steps to read, negative means all
  /// @param BatchSize Steps read in one go
  void FillPlots(const Long64_t MaxEntries = -1, const size_t BatchSize = NuMCMC::DefaultBatchSize);

  /// @brief Build credible regions for every plot at the same levels
  void MakeCredibleRegions(const std::vector<double>& Levels, const bool CredibleInSigmas = false, const bool Combine = false);

  /// @brief Write every plot into directory
  void Write(TDirectory* Dir) const;

  inline int GetNPlots() const { return int(Plots.size()); }
  inline PosteriorPlot& GetPlot(const int i) { return *Plots[i]; }
  /// @brief Find plot by name
  PosteriorPlot& GetPlot(const std::string& Name);

 private:
  /// Chain
  std::shared_ptr<SampleSource> Source;
  /// Physical and derived variables
  VariableRegistry Registry;
  /// Plots to be filled
  std::vector<std::unique_ptr<PosteriorPlot>> Plots;
};
