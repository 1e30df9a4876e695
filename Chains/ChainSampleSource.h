#pragma once

// C++ includes
#include <memory>
#include <string>
#include <vector>

// NuMCMC includes
#include "Chains/SampleSource.h"

_NuMCMC_Safe_Include_Start_ //{
// ROOT includes
#include "TChain.h"
_NuMCMC_Safe_Include_End_ //}

/// @brief Reads chain steps from one or more ROOT files
/// @details Every file needs a tree with branches named after the six physical parameters,
/// stored as doubles. Chain metadata is taken from the config if given, otherwise from
/// the NuMCMC_Metadata TMacro stored in the first file.
class ChainSampleSource : public SampleSource {
 public:
  /// @brief Constructor
  /// @param Files ROOT files with chains, wildcards are allowed as in TChain::Add
  /// @param TreeName Name of tree inside files
  /// @param MetadataNode Metadata in YAML, if empty it is read from the file
  ChainSampleSource(const std::vector<std::string>& Files, const std::string& TreeName,
                    const YAML::Node& MetadataNode = YAML::Node());
  /// @brief Destructor
  virtual ~ChainSampleSource();

  size_t NextBatch(SampleBatch& Batch, const size_t MaxRows) override;
  inline void Reset() override { CurrentEntry = 0; }
  inline Long64_t GetNEntries() const override { return nEntries; }
  inline const ChainMetadata& GetMetadata() const override { return Metadata; }

 private:
  /// @brief Add files and check branches
  void ScanInput(const std::vector<std::string>& Files);
  /// @brief Load metadata stored inside the chain file
  void ReadMetadataFromFile(const std::string& FileName);

  /// The chain
  std::unique_ptr<TChain> Chain;
  /// Name of tree
  std::string TreeName;
  /// Metadata of the chain
  ChainMetadata Metadata;
  /// Buffer for branch addresses
  PhysicalValues Buffer;
  /// Number of steps to read
  Long64_t nEntries;
  /// Next entry to be read
  Long64_t CurrentEntry;
};
