#pragma once

// C++ includes
#include <memory>
#include <string>
#include <vector>

// NuMCMC includes
#include "Manager/YamlHelper.h"
#include "Chains/SampleStructs.h"
#include "Priors/TabulatedDensity.h"

_NuMCMC_Safe_Include_Start_ //{
// ROOT includes
#include "TGraph.h"
#include "TGraph2D.h"
_NuMCMC_Safe_Include_End_ //}

/// @file Constraints.h
/// @brief External measurements folded into the posterior as multiplicative weights

/// @brief Which mass ordering a constraint is valid for
enum ConstraintScope {
  kBothOrderings = 0,
  kNormalOnly = 1,
  kInvertedOnly = 2,

  kNConstraintScopes //!< This only enumerates
};

/// @brief Convert scope to the string used in configs
std::string ConstraintScope_ToString(const ConstraintScope Scope);
/// @brief Parse scope, accepts "Both", "NO" and "IO"
ConstraintScope ParseConstraintScope(const std::string& Name);

/// @brief Base class for 1D or 2D external constraints
/// @details Constraints are shared read only between plots, Evaluate must not change state.
class ExternalConstraint {
 public:
  /// @brief Constructor
  /// @param Name Name used to request the constraint from a plot
  /// @param Variables One or two variable names the density is defined over
  /// @param Scope Mass ordering the constraint is valid for
  /// @param AutoApply Whether every plot should use it without asking
  ExternalConstraint(std::string Name, std::vector<std::string> Variables, const ConstraintScope Scope, const bool AutoApply);
  /// @brief Destructor
  virtual ~ExternalConstraint();

  /// @brief Unnormalised density of the constraint
  /// @param x Value of first variable
  /// @param y Value of second variable, ignored by 1D constraints
  virtual double Evaluate(const double x, const double y = 0.) const = 0;

  /// @brief Whether the constraint should be used for sample with given ordering
  bool AppliesTo(const MassOrdering Ordering) const;

  inline const std::string& GetName() const { return Name; }
  inline const std::vector<std::string>& GetVariables() const { return Variables; }
  inline int GetDimension() const { return int(Variables.size()); }
  inline ConstraintScope GetScope() const { return Scope; }
  inline bool IsAutoApply() const { return AutoApply; }

 protected:
  /// Name of constraint
  std::string Name;
  /// Variables the constraint is defined over
  std::vector<std::string> Variables;
  /// Mass ordering the constraint is valid for
  ConstraintScope Scope;
  /// Used by every plot
  bool AutoApply;
};

/// @brief 1D Gaussian constraint exp(-0.5 ((x-mean)/sigma)^2)
class GaussianConstraint : public ExternalConstraint {
 public:
  GaussianConstraint(std::string Name, std::string Variable, const double Mean, const double Sigma,
                     const ConstraintScope Scope = kBothOrderings, const bool AutoApply = false);
  virtual ~GaussianConstraint();

  double Evaluate(const double x, const double y = 0.) const override;

 private:
  double Mean;
  double Sigma;
};

/// @brief Tabulated density from TH1D, TH2D or a TGraph2D grid, zero outside the table
class HistogramConstraint : public ExternalConstraint {
 public:
  /// @brief Table dimension has to match number of variables
  HistogramConstraint(std::string Name, std::vector<std::string> Variables, TabulatedDensity Table,
                      const ConstraintScope Scope = kBothOrderings, const bool AutoApply = false);
  virtual ~HistogramConstraint();

  double Evaluate(const double x, const double y = 0.) const override;

  inline InterpolationMode GetInterpolationMode() const { return Table.GetMode(); }

 private:
  TabulatedDensity Table;
};

/// @brief Delta chi2 profile in TGraph or TGraph2D converted to exp(-0.5 chi2), zero outside the graph
class Chi2GraphConstraint : public ExternalConstraint {
 public:
  /// @brief 1D constraint from TGraph
  Chi2GraphConstraint(std::string Name, std::string Variable, std::unique_ptr<TGraph> Graph,
                      const ConstraintScope Scope = kBothOrderings, const bool AutoApply = false);
  /// @brief 2D constraint from TGraph2D
  Chi2GraphConstraint(std::string Name, std::vector<std::string> Variables, std::unique_ptr<TGraph2D> Graph,
                      const ConstraintScope Scope = kBothOrderings, const bool AutoApply = false);
  virtual ~Chi2GraphConstraint();

  double Evaluate(const double x, const double y = 0.) const override;

 private:
  std::unique_ptr<TGraph> Graph1D;
  std::unique_ptr<TGraph2D> Graph2D;
  /// Range of the 1D graph
  double XMin;
  double XMax;
};

/// @brief Build constraint from config
/// @code
/// T13Reactor:
///   Type: Gaussian
///   Variables: [Theta13]
///   Mean: 0.1503
///   Sigma: 0.0023
///   Scope: Both
///   AutoApply: false
/// @endcode
/// Histogram and Chi2Graph types take File and Object instead of Mean and Sigma.
/// Histogram also takes Interpolator, regular (default) or linear.
std::shared_ptr<const ExternalConstraint> MakeConstraintFromYAML(const std::string& Name, const YAML::Node& Node);
