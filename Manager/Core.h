#pragma once

/// @file Core.h
/// @brief Common constants and compiler helpers shared by every NuMCMCTools module

// C++ includes
#include <sstream>
#include <fstream>
#include <iostream>
#include <vector>
#include <iomanip>
#include <cmath>
#include <limits>

namespace NuMCMC {
  /// Default value used for double initialisation
  constexpr static const double _BAD_DOUBLE_ = -999.99;
  /// Default value used for int initialisation
  constexpr static const int _BAD_INT_ = -999;

  /// Some commonly used variables
  constexpr static const double Unity = 1.;
  constexpr static const double Zero = 0.;

  /// Default number of chain entries read in one go
  constexpr static const int DefaultBatchSize = 100000;

  /// Relative slack used when comparing an accumulated probability against a requested level
  constexpr static const double CoverageTolerance = 1e-12;
}

/// noexcept helps with performance but is terrible for debugging, easy way of turning it on or off
#ifndef DEBUG
#define _noexcept_ noexcept
#else
#define _noexcept_
#endif

/// @brief Avoiding warning checking for headers
/// @details Many external files don't strictly adhere to rigorous C++ standards.
/// Inline functions in such headers may cause errors when compiled with strict compiler flags.
/// @warning Use this for any external header file to avoid warnings.
#define _NuMCMC_Safe_Include_Start_ \
_Pragma("GCC diagnostic push") \
_Pragma("GCC diagnostic ignored \"-Wuseless-cast\"") \
_Pragma("GCC diagnostic ignored \"-Wfloat-conversion\"") \
_Pragma("GCC diagnostic ignored \"-Wold-style-cast\"") \
_Pragma("GCC diagnostic ignored \"-Wformat-nonliteral\"") \
_Pragma("GCC diagnostic ignored \"-Wswitch-enum\"") \
_Pragma("GCC diagnostic ignored \"-Wconversion\"") \
_Pragma("GCC diagnostic ignored \"-Wshadow\"")

/// @brief Restore warning checking after including external headers
#define _NuMCMC_Safe_Include_End_ \
_Pragma("GCC diagnostic pop")

// clang need slightly different diagnostics
#if defined(__clang__)
  #undef _NuMCMC_Safe_Include_Start_
  #define _NuMCMC_Safe_Include_Start_ \
  _Pragma("clang diagnostic push") \
  _Pragma("clang diagnostic ignored \"-Wfloat-conversion\"") \
  _Pragma("clang diagnostic ignored \"-Wold-style-cast\"") \
  _Pragma("clang diagnostic ignored \"-Wformat-nonliteral\"") \
  _Pragma("clang diagnostic ignored \"-Wswitch-enum\"") \
  _Pragma("clang diagnostic ignored \"-Wconversion\"") \
  _Pragma("clang diagnostic ignored \"-Wshadow\"")

  #undef _NuMCMC_Safe_Include_End_
  #define _NuMCMC_Safe_Include_End_ \
  _Pragma("clang diagnostic pop")
#endif
