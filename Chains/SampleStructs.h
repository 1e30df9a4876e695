#pragma once

// C++ includes
#include <array>
#include <string>
#include <vector>

// NuMCMC includes
#include "Manager/NuMCMCException.h"

/// @file SampleStructs.h
/// @brief Basic containers describing a single MCMC step of an oscillation chain

/// @brief The six oscillation parameters every chain has to provide
enum PhysicalParameter {
  kDeltaCP = 0,
  kTheta13 = 1,
  kTheta23 = 2,
  kTheta12 = 3,
  kDeltam2_32 = 4,
  kDeltam2_21 = 5,

  kNPhysicalParameters //!< This only enumerates
};

/// @brief Mass ordering label of a step, decided by sign of Deltam2_32
enum MassOrdering {
  kNormalOrdering = 0,
  kInvertedOrdering = 1,

  kNMassOrderings //!< This only enumerates
};

/// Values of the six physical parameters ordered as PhysicalParameter
using PhysicalValues = std::array<double, kNPhysicalParameters>;

// **************************************************
/// @brief Convert physical parameter to the branch/variable name used in chains
inline std::string PhysicalParameter_ToString(const PhysicalParameter Param) {
// **************************************************
  std::string name = "";

  switch(Param) {
    case kDeltaCP:
      name = "DeltaCP";
      break;
    case kTheta13:
      name = "Theta13";
      break;
    case kTheta23:
      name = "Theta23";
      break;
    case kTheta12:
      name = "Theta12";
      break;
    case kDeltam2_32:
      name = "Deltam2_32";
      break;
    case kDeltam2_21:
      name = "Deltam2_21";
      break;
    case kNPhysicalParameters:
      NUMCMCLOG_ERROR("kNPhysicalParameters is not a valid PhysicalParameter!");
      throw NuMCMCException(__FILE__, __LINE__);
    default:
      NUMCMCLOG_ERROR("UNKNOWN PHYSICAL PARAMETER SPECIFIED!");
      NUMCMCLOG_ERROR("You gave parameter {}", static_cast<int>(Param));
      throw NuMCMCException(__FILE__ , __LINE__ );
  }
  return name;
}

// **************************************************
/// @brief Convert mass ordering to short name
inline std::string MassOrdering_ToString(const MassOrdering Ordering) {
// **************************************************
  std::string name = "";

  switch(Ordering) {
    case kNormalOrdering:
      name = "NO";
      break;
    case kInvertedOrdering:
      name = "IO";
      break;
    case kNMassOrderings:
    default:
      NUMCMCLOG_ERROR("You gave mass ordering {}", static_cast<int>(Ordering));
      throw NuMCMCException(__FILE__ , __LINE__ );
  }
  return name;
}

/// @brief Single step of a chain, immutable once read
struct Sample {
  /// Oscillation parameters ordered as PhysicalParameter
  PhysicalValues Physical;

  /// @brief Get value of one physical parameter
  inline double Get(const PhysicalParameter Param) const { return Physical[Param]; }
  /// @brief Normal ordering if Deltam2_32 > 0, inverted otherwise
  inline MassOrdering GetMassOrdering() const {
    return (Physical[kDeltam2_32] > 0) ? kNormalOrdering : kInvertedOrdering;
  }
};

/// Bounded number of consecutive steps read in one go
using SampleBatch = std::vector<Sample>;
