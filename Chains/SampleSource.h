#pragma once

// C++ includes
#include <memory>

// NuMCMC includes
#include "Chains/SampleStructs.h"
#include "Chains/ChainMetadata.h"

_NuMCMC_Safe_Include_Start_ //{
// ROOT includes
#include "RtypesCore.h"
_NuMCMC_Safe_Include_End_ //}

/// @brief Interface providing chain steps in bounded batches
class SampleSource {
 public:
  /// @brief Constructor
  SampleSource() = default;
  /// @brief Destructor
  virtual ~SampleSource() {};

  /// @brief Read next steps of the chain
  /// @param Batch Container which will be cleared and filled
  /// @param MaxRows Maximal number of steps to read
  /// @return Number of steps read, zero once the chain is exhausted
  virtual size_t NextBatch(SampleBatch& Batch, const size_t MaxRows) = 0;
  /// @brief Start reading from first step again
  virtual void Reset() = 0;
  /// @brief Total number of steps available
  virtual Long64_t GetNEntries() const = 0;
  /// @brief Metadata of the chain
  virtual const ChainMetadata& GetMetadata() const = 0;
};

/// @brief Sample source over steps held in memory, mostly used for testing
class VectorSampleSource : public SampleSource {
 public:
  /// @brief Constructor
  /// @param Steps Chain steps
  /// @param Metadata Metadata of the chain
  VectorSampleSource(std::vector<Sample> Steps, ChainMetadata Metadata = ChainMetadata());
  /// @brief Destructor
  virtual ~VectorSampleSource();

  size_t NextBatch(SampleBatch& Batch, const size_t MaxRows) override;
  inline void Reset() override { Position = 0; }
  inline Long64_t GetNEntries() const override { return Long64_t(Steps.size()); }
  inline const ChainMetadata& GetMetadata() const override { return Metadata; }

 private:
  /// All chain steps
  std::vector<Sample> Steps;
  /// Metadata of chain
  ChainMetadata Metadata;
  /// Index of next step to be read
  size_t Position;
};
