#pragma once

// C++ includes
#include <array>
#include <functional>
#include <vector>

// NuMCMC includes
#include "Posteriors/Binning.h"
#include "Chains/SampleStructs.h"

/// Coordinates of a sample in the plotted variables, second one unused for 1D
using CoordinateFunction = std::function<std::array<double, 2>(const Sample&)>;
/// Weight of a sample
using WeightFunction = std::function<double(const Sample&)>;

/// @brief Accumulates weighted samples into 1D or 2D bins, optionally split by mass ordering
/// @details When split, partition 0 holds normal and partition 1 inverted ordering samples,
/// otherwise there is a single partition. Samples are processed strictly in the order they are
/// given so the result does not depend on how the chain was split into batches.
class WeightedHistogram {
 public:
  /// @brief Constructor
  /// @param binning Bin edges
  /// @param SplitByOrdering Keep separate arrays for normal and inverted ordering
  WeightedHistogram(Binning binning, const bool SplitByOrdering = false);
  /// @brief Destructor
  virtual ~WeightedHistogram();

  /// @brief Add a single weighted point
  /// @details Non finite coordinates or weight mark the point malformed, it is skipped and counted
  void Fill(const double x, const double y, const double Weight, const MassOrdering Ordering = kNormalOrdering);

  /// @brief Fill every sample of a batch
  /// @param Batch Chain steps
  /// @param Coordinates Plotted coordinates of a step
  /// @param Weight Weight of a step, exceptions thrown here stop the fill
  void FillBatch(const SampleBatch& Batch, const CoordinateFunction& Coordinates, const WeightFunction& Weight);

  /// @brief Merge histogram filled from another shard of the chain
  /// @throws NuMCMCException if binning or splitting differ
  void Add(const WeightedHistogram& Other);

  /// @brief Reset to empty state
  void Reset();

  inline const Binning& GetBinning() const { return binning; }
  inline bool IsSplit() const { return Split; }
  inline int GetNPartitions() const { return int(Weights.size()); }
  /// @brief Partition a step with given ordering goes to
  inline int GetPartition(const MassOrdering Ordering) const { return Split ? int(Ordering) : 0; }

  inline double GetBinContent(const int Partition, const int gbi) const { return Weights[Partition][gbi]; }
  inline const std::vector<double>& GetBinContents(const int Partition) const { return Weights[Partition]; }

  /// @brief Sum of in-range weight of partition
  double GetPartitionWeight(const int Partition) const;
  /// @brief Sum of in-range weight of all partitions
  double GetInRangeWeight() const;
  /// @brief Weight which fell outside of the axes, per partition
  inline double GetOutOfRangeWeight(const int Partition) const { return OutOfRangeWeight[Partition]; }
  /// @brief Weight which fell outside of the axes
  double GetOutOfRangeWeight() const;
  /// @brief Sum of all processed weight, in-range plus out-of-range
  inline double GetTotalWeight() const { return TotalWeight; }

  /// @brief Number of accepted points in a partition, in-range or not
  inline Long64_t GetNEntries(const int Partition) const { return nEntries[Partition]; }
  inline Long64_t GetNOutOfRange() const { return nOutOfRange; }
  inline Long64_t GetNMalformed() const { return nMalformed; }

 private:
  /// Bin edges
  Binning binning;
  /// Whether split by mass ordering
  bool Split;
  /// Weights[partition][global bin]
  std::vector<std::vector<double>> Weights;
  /// Out of range weight per partition
  std::vector<double> OutOfRangeWeight;
  /// Accepted points per partition
  std::vector<Long64_t> nEntries;
  /// Sum of all accepted weights
  double TotalWeight;
  /// Number of points outside the axes
  Long64_t nOutOfRange;
  /// Number of skipped points
  Long64_t nMalformed;
};
