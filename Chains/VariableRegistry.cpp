#include "Chains/VariableRegistry.h"

// C++ includes
#include <cmath>

namespace {
  /// @brief Square of a number
  inline double Sq(const double x) { return x*x; }
}

// **************************************************
VariableRegistry::VariableRegistry() {
// **************************************************
  Locked = false;
  for(int i = 0; i < kNPhysicalParameters; ++i) {
    const std::string Name = PhysicalParameter_ToString(PhysicalParameter(i));
    NameToIndex[Name] = int(Names.size());
    Names.push_back(Name);
    Functions.emplace_back(nullptr);
  }
}

// **************************************************
VariableRegistry::~VariableRegistry() {
// **************************************************

}

// **************************************************
void VariableRegistry::RegisterVariable(const std::string& Name, DerivationFunction Function) {
// **************************************************
  if(Locked) {
    NUMCMCLOG_ERROR("Trying to register {} after chain processing has started", Name);
    throw NuMCMCException(__FILE__, __LINE__);
  }
  if(Name.empty()) {
    NUMCMCLOG_ERROR("Variable name can't be empty");
    throw NuMCMCException(__FILE__, __LINE__);
  }
  if(HasVariable(Name)) {
    NUMCMCLOG_ERROR("Variable {} is already registered", Name);
    throw NuMCMCException(__FILE__, __LINE__);
  }
  if(!Function) {
    NUMCMCLOG_ERROR("No derivation function given for {}", Name);
    throw NuMCMCException(__FILE__, __LINE__);
  }
  NameToIndex[Name] = int(Names.size());
  Names.push_back(Name);
  Functions.push_back(std::move(Function));
  NUMCMCLOG_DEBUG("Registered derived variable {} with index {}", Name, NameToIndex[Name]);
}

// **************************************************
std::vector<std::string> VariableRegistry::GetStandardVariableNames() {
// **************************************************
  return {"SinSqTheta12", "SinSqTheta13", "SinSqTheta23", "SinSq2Theta13", "SinSq2Theta23",
          "SinDeltaCP", "AbsSinDeltaCP", "CosDeltaCP", "JarlskogInvariant", "AbsUe3", "AbsDeltam2_32"};
}

// **************************************************
void VariableRegistry::RegisterStandardVariable(const std::string& Name) {
// **************************************************
  DerivationFunction Function;
  if(Name == "SinSqTheta12") {
    Function = [](const PhysicalValues& p) { return Sq(std::sin(p[kTheta12])); };
  } else if(Name == "SinSqTheta13") {
    Function = [](const PhysicalValues& p) { return Sq(std::sin(p[kTheta13])); };
  } else if(Name == "SinSqTheta23") {
    Function = [](const PhysicalValues& p) { return Sq(std::sin(p[kTheta23])); };
  } else if(Name == "SinSq2Theta13") {
    Function = [](const PhysicalValues& p) { return Sq(std::sin(2*p[kTheta13])); };
  } else if(Name == "SinSq2Theta23") {
    Function = [](const PhysicalValues& p) { return Sq(std::sin(2*p[kTheta23])); };
  } else if(Name == "SinDeltaCP") {
    Function = [](const PhysicalValues& p) { return std::sin(p[kDeltaCP]); };
  } else if(Name == "AbsSinDeltaCP") {
    Function = [](const PhysicalValues& p) { return std::fabs(std::sin(p[kDeltaCP])); };
  } else if(Name == "CosDeltaCP") {
    Function = [](const PhysicalValues& p) { return std::cos(p[kDeltaCP]); };
  } else if(Name == "JarlskogInvariant") {
    // J = s12 c12 s23 c23 s13 c13^2 sin(dcp)
    Function = [](const PhysicalValues& p) {
      const double s12 = std::sin(p[kTheta12]), c12 = std::cos(p[kTheta12]);
      const double s23 = std::sin(p[kTheta23]), c23 = std::cos(p[kTheta23]);
      const double s13 = std::sin(p[kTheta13]), c13 = std::cos(p[kTheta13]);
      return s12*c12*s23*c23*s13*c13*c13*std::sin(p[kDeltaCP]);
    };
  } else if(Name == "AbsUe3") {
    Function = [](const PhysicalValues& p) { return std::fabs(std::sin(p[kTheta13])); };
  } else if(Name == "AbsDeltam2_32") {
    Function = [](const PhysicalValues& p) { return std::fabs(p[kDeltam2_32]); };
  } else {
    NUMCMCLOG_ERROR("{} is not a standard variable, available are:", Name);
    for(const auto& Known : GetStandardVariableNames()) {
      NUMCMCLOG_ERROR("  {}", Known);
    }
    throw NuMCMCException(__FILE__, __LINE__);
  }
  RegisterVariable(Name, std::move(Function));
}

// **************************************************
bool VariableRegistry::HasVariable(const std::string& Name) const {
// **************************************************
  return NameToIndex.find(Name) != NameToIndex.end();
}

// **************************************************
int VariableRegistry::GetIndex(const std::string& Name) const {
// **************************************************
  auto it = NameToIndex.find(Name);
  if(it == NameToIndex.end()) {
    NUMCMCLOG_ERROR("Variable {} is not registered, available variables are:", Name);
    for(const auto& Known : Names) {
      NUMCMCLOG_ERROR("  {}", Known);
    }
    throw NuMCMCException(__FILE__, __LINE__);
  }
  return it->second;
}

// **************************************************
bool VariableRegistry::IsPhysical(const std::string& Name) const {
// **************************************************
  auto it = NameToIndex.find(Name);
  return it != NameToIndex.end() && it->second < kNPhysicalParameters;
}
