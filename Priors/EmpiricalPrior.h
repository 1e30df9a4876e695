#pragma once

// C++ includes
#include <memory>
#include <string>
#include <vector>

// NuMCMC includes
#include "Priors/TabulatedDensity.h"

/// @file EmpiricalPrior.h
/// @brief Prior over one or two physical variables taken from a histogram or a graph

/// @brief Replacement prior tabulated in the physical variables themselves
/// @details Unlike PriorSpec families there is no transform, the table is the density
/// of the listed variables. Used to replace the chain priors on those variables jointly.
class EmpiricalPrior {
 public:
  /// @brief Constructor
  /// @param Variables One or two variable names, order matches table axes
  /// @param Table Density over the variables
  /// @throws DimensionalityError if number of variables doesn't match the table
  EmpiricalPrior(std::vector<std::string> Variables, TabulatedDensity Table);
  /// @brief Destructor
  virtual ~EmpiricalPrior();

  /// @brief Unnormalised density, zero outside the table
  inline double Density(const double x, const double y = 0.) const { return Table.Evaluate(x, y); }

  inline const std::vector<std::string>& GetVariables() const { return Variables; }
  inline int GetDimension() const { return int(Variables.size()); }
  inline const TabulatedDensity& GetTable() const { return Table; }

  /// @brief String like "Empirical(linear) on Theta23, DeltaCP"
  std::string ToString() const;

 private:
  /// Variables the table is defined over
  std::vector<std::string> Variables;
  /// Tabulated density
  TabulatedDensity Table;
};

/// @brief Build empirical prior from config
/// @code
/// Variables: [Theta23, DeltaCP]
/// File: Priors.root
/// Object: h_T23_DCP
/// Interpolator: linear
/// @endcode
/// Interpolator defaults to linear.
std::shared_ptr<const EmpiricalPrior> MakeEmpiricalPriorFromYAML(const YAML::Node& Node);
