#pragma once

// C++ includes
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

// NuMCMC includes
#include "Chains/SampleStructs.h"

/// Pure function deriving a scalar from the six physical parameters
using DerivationFunction = std::function<double(const PhysicalValues&)>;

/// @brief Name to function mapping for every variable a plot can use
/// @details The six physical parameters are always registered first and occupy
/// indices 0-5. Derived variables are appended in registration order. Once a
/// chain starts being processed the registry is locked and becomes read only.
class VariableRegistry {
 public:
  /// @brief Constructor registering the physical parameters
  VariableRegistry();
  /// @brief Destructor
  virtual ~VariableRegistry();

  /// @brief Register a derived variable
  /// @param Name Unique name of the variable
  /// @param Function Derivation from physical parameters
  /// @throws NuMCMCException if the name is taken or registry is locked
  void RegisterVariable(const std::string& Name, DerivationFunction Function);

  /// @brief Register one of the variables from GetStandardVariableNames()
  void RegisterStandardVariable(const std::string& Name);

  /// @brief Names of commonly used derived oscillation variables
  static std::vector<std::string> GetStandardVariableNames();

  /// @brief Forbid further registration
  inline void Lock() { Locked = true; }
  /// @brief Whether registration is still allowed
  inline bool IsLocked() const { return Locked; }

  /// @brief Check whether variable of this name exists
  bool HasVariable(const std::string& Name) const;
  /// @brief Get index of variable
  /// @throws NuMCMCException for unknown names
  int GetIndex(const std::string& Name) const;
  /// @brief Whether the variable is one of the six physical parameters
  bool IsPhysical(const std::string& Name) const;

  /// @brief Get value of variable for a sample
  inline double Evaluate(const int Index, const Sample& Step) const {
    if(Index < kNPhysicalParameters) return Step.Physical[Index];
    return Functions[Index](Step.Physical);
  }

  /// @brief Number of registered variables, physical ones included
  inline int GetNVariables() const { return int(Names.size()); }
  /// @brief Get name of variable by index
  inline const std::string& GetName(const int Index) const { return Names[Index]; }

 private:
  /// Names ordered by index
  std::vector<std::string> Names;
  /// Derivations ordered by index, empty for physical parameters
  std::vector<DerivationFunction> Functions;
  /// Name to index lookup
  std::unordered_map<std::string, int> NameToIndex;
  /// Read only after locking
  bool Locked;
};
