#pragma once

// C++ includes
#include <string>
#include <vector>
#include <memory>

// NuMCMC includes
#include "Manager/YamlHelper.h"
#include "Priors/Transforms.h"

/// @file PriorModel.h
/// @brief Prior families defined over a transformed coordinate and evaluated in the physical variable

/// @brief Functional form of a prior on the transformed coordinate y
enum PriorFamily {
  kUniform = 0,         //!< flat in y, optionally restricted to [low, high]
  kGaussian = 1,        //!< mean, sigma
  kBimodalGaussian = 2, //!< mean1, sigma1, mean2, sigma2, optional bias % of first mode
  kStep = 3,            //!< bias % below boundary, optional boundary

  kNPriorFamilies //!< This only enumerates
};

/// @brief Convert prior family to the name used in prior strings
std::string PriorFamily_ToString(const PriorFamily Family);

/// @brief Parse a family name
/// @throws InvalidPriorParameters for an unknown family
PriorFamily ParsePriorFamily(const std::string& Name);

/// @brief Everything needed to define a prior on one variable
struct PriorSpec {
  /// Variable the prior is placed on, e.g. "Theta23"
  std::string Variable;
  /// Functional form
  PriorFamily Family = kUniform;
  /// Family parameters, arity depends on Family
  std::vector<double> Parameters;
  /// Transform under which Family is defined
  TransformType Transform = kIdentity;

  /// @brief String in the "Family(p1, p2):transform" form
  std::string ToString() const;

  bool operator==(const PriorSpec& Other) const {
    return Variable == Other.Variable && Family == Other.Family &&
           Parameters == Other.Parameters && Transform == Other.Transform;
  }
  bool operator!=(const PriorSpec& Other) const { return !(*this == Other); }
};

/// @brief Parse a prior string such as "Gaussian(0.55, 0.01):sin^2(x)" or "Uniform:x"
/// @param Variable Name of the variable the prior is placed on
/// @param Definition Prior string, missing transform means the identity
PriorSpec ParsePriorSpec(const std::string& Variable, const std::string& Definition);

/// @brief Build prior from YAML, either a prior string or a map with Family, Parameters and Transform
PriorSpec MakePriorSpecFromYAML(const std::string& Variable, const YAML::Node& Node);

/// @brief Evaluates an unnormalised prior density in the physical variable
/// @details density(x) = g(f(x)) |df/dx| where g is the family density on y = f(x).
/// Parameters are validated on construction so evaluation never throws.
class PriorModel {
 public:
  /// @brief Validate spec and prepare evaluation
  /// @throws InvalidPriorParameters if arity or values are inconsistent with the family
  explicit PriorModel(PriorSpec Spec);

  /// @brief Unnormalised density at physical value x
  double Density(const double x) const;

  /// @brief Density of the family on the transformed coordinate, without Jacobian
  double FamilyDensity(const double y) const;

  /// @brief Get definition of this prior
  inline const PriorSpec& GetSpec() const { return Spec; }

 private:
  /// @brief Check parameters and cache the derived constants
  void Validate();

  /// Definition of the prior
  PriorSpec Spec;

  /// Uniform window on y
  double UniformLow;
  double UniformHigh;
  /// Fraction of probability in first mode or below the step
  double BiasFraction;
  /// Step position on y
  double Boundary;
};
