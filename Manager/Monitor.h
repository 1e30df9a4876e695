#pragma once

// C++ includes
#include <string>

// NuMCMC includes
#include "Manager/NuMCMCLogger.h"
#include "Manager/NuMCMCException.h"
#include "Manager/YamlHelper.h"

_NuMCMC_Safe_Include_Start_ //{
// ROOT include
#include "TChain.h"
_NuMCMC_Safe_Include_End_ //}

/// @file Monitor.h
/// @brief Status printouts shared by the executables and the chain reader

namespace NuMCMCUtils {
  /// @brief Log name and version once per process
  void NuMCMCWelcome();
  /// @brief Version set by the build system
  std::string GetNuMCMCVersion();
  /// @brief Read one chain entry and log how long it took
  /// @return Bytes read, zero or negative on failure as for TChain::GetEntry
  Int_t ReadEntryTimed(TChain* chain, const Long64_t entry);
  /// @brief Log progress through the chain
  /// @param Done Entries read so far
  /// @param All Entries to read
  void PrintProgressBar(const Long64_t Done, const Long64_t All);
  /// @brief Log YAML config line by line
  void PrintConfig(const YAML::Node& node);
  /// @brief Throw with a usage message unless a config file was given
  void NuMCMCUsage(int argc, char **argv);
}
