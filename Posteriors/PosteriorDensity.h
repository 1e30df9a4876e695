#pragma once

// C++ includes
#include <memory>
#include <string>
#include <vector>

// NuMCMC includes
#include "Posteriors/WeightedHistogram.h"

_NuMCMC_Safe_Include_Start_ //{
// ROOT includes
#include "TH1D.h"
#include "TH2D.h"
_NuMCMC_Safe_Include_End_ //}

/// @brief Normalised posterior density built from a filled WeightedHistogram
/// @details Every non-empty partition integrates to one on its own. The share of each
/// partition and the fraction of processed weight which stayed in range are kept so
/// absolute probability masses can be recovered. Immutable once built.
class PosteriorDensity {
 public:
  /// @brief Normalise histogram, the histogram itself is left untouched
  /// @throws EmptyHistogram if there is no in-range weight
  explicit PosteriorDensity(const WeightedHistogram& Histogram);
  /// @brief Destructor
  virtual ~PosteriorDensity();

  inline const Binning& GetBinning() const { return binning; }
  inline int GetNPartitions() const { return int(Densities.size()); }
  inline bool IsSplit() const { return Split; }

  /// @brief Density of bin in partition
  inline double GetDensity(const int Partition, const int gbi) const { return Densities[Partition][gbi]; }
  inline const std::vector<double>& GetDensities(const int Partition) const { return Densities[Partition]; }
  /// @brief Ordering summed density, share weighted, integrates to one
  std::vector<double> GetCombinedDensities() const;

  /// @brief Fraction of in-range weight in partition
  inline double GetPartitionShare(const int Partition) const { return Shares[Partition]; }
  /// @brief Fraction of partition weight which ended up in range
  inline double GetPartitionInRangeFraction(const int Partition) const { return PartitionInRange[Partition]; }
  /// @brief Fraction of all processed weight which ended up in range
  inline double GetInRangeFraction() const { return InRangeFraction; }

  /// @brief Probability mass of bin relative to all processed weight
  /// @details density * area * partition share * in-range fraction
  double GetBinMass(const int Partition, const int gbi) const;
  /// @brief Sum over bins of density * area for partition, one unless partition is empty
  double GetIntegral(const int Partition) const;

  /// @brief Export partition as TH1D (1D) or TH2D (2D)
  /// @param Name Name of histogram
  /// @param Partition Partition index, ignored for combined export
  /// @param Combined Export ordering summed density instead
  std::unique_ptr<TH1> ToHistogram(const std::string& Name, const int Partition, const bool Combined = false) const;

 private:
  /// Bin edges
  Binning binning;
  /// Whether split by mass ordering
  bool Split;
  /// Densities[partition][global bin]
  std::vector<std::vector<double>> Densities;
  /// Share of in-range weight per partition
  std::vector<double> Shares;
  /// In-range fraction per partition
  std::vector<double> PartitionInRange;
  /// In-range weight over all processed weight
  double InRangeFraction;
};

/// @brief Create empty TH1D or TH2D with same edges as binning, detached from any directory
std::unique_ptr<TH1> MakeEmptyHistogram(const Binning& binning, const std::string& Name, const std::string& Title = "");
