#pragma once

// C++ includes
#include <array>
#include <memory>
#include <string>
#include <vector>

// NuMCMC includes
#include "Priors/PriorModel.h"
#include "Chains/Constraints.h"

/// @brief Chain level information released together with the samples
/// @details Holds the prior each physical parameter was generated with, the external
/// constraints shipped with the chain and a free text citation which is passed through.
class ChainMetadata {
 public:
  /// @brief Constructor, every physical parameter starts with a Uniform:x prior
  ChainMetadata();
  /// @brief Destructor
  virtual ~ChainMetadata();

  /// @brief Read metadata from YAML
  /// @code
  /// Priors:
  ///   Theta23: "Uniform:sin^2(x)"
  ///   DeltaCP: {Family: Uniform, Transform: x}
  /// Constraints:
  ///   T13Reactor: {Type: Gaussian, Variables: [Theta13], Mean: 0.15, Sigma: 0.002}
  /// Citation: "Some experiment 2024"
  /// @endcode
  static ChainMetadata MakeFromYAML(const YAML::Node& Node);

  /// @brief Set prior for a physical parameter
  void SetPrior(const PriorSpec& Spec);
  /// @brief Add external constraint, names have to be unique
  void AddConstraint(std::shared_ptr<const ExternalConstraint> Constraint);
  inline void SetCitation(const std::string& citation) { Citation = citation; }

  /// @brief Prior the chain was generated with for a physical parameter
  inline std::shared_ptr<const PriorModel> GetPrior(const PhysicalParameter Param) const { return Priors[Param]; }
  /// @brief Prior for parameter given by name
  /// @throws DimensionalityError if the name is not a physical parameter
  std::shared_ptr<const PriorModel> GetPrior(const std::string& Name) const;
  /// @brief Find constraint by name
  std::shared_ptr<const ExternalConstraint> GetConstraint(const std::string& Name) const;
  inline const std::vector<std::shared_ptr<const ExternalConstraint>>& GetConstraints() const { return Constraints; }
  inline const std::string& GetCitation() const { return Citation; }

  /// @brief Log content of metadata
  void Print() const;

 private:
  /// Original prior per physical parameter
  std::array<std::shared_ptr<const PriorModel>, kNPhysicalParameters> Priors;
  /// External constraints distributed with the chain
  std::vector<std::shared_ptr<const ExternalConstraint>> Constraints;
  /// Reference for chain
  std::string Citation;
};
