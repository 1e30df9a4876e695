#pragma once

// C++ includes
#include <memory>
#include <string>
#include <vector>

// NuMCMC includes
#include "Posteriors/PosteriorDensity.h"

/// @file CredibleRegion.h
/// @brief Highest posterior density regions built from a binned density

/// @brief Set of bins of highest density enclosing a requested probability
struct CredibleRegion {
  /// Requested probability, within (0, 1)
  double Level = NuMCMC::_BAD_DOUBLE_;
  /// Partition the region was built in, ignored for combined regions
  int Partition = 0;
  /// Union over mass orderings
  bool Combined = false;
  /// Included global bins per partition, ordered by decreasing density
  std::vector<std::vector<int>> Bins;
  /// Lowest density included in the region
  double Threshold = 0.;
  /// Probability actually enclosed
  double Mass = 0.;
  /// False if the level could not be reached and all bins were taken
  bool Reached = false;

  /// @brief Whether bin of a partition is part of region
  bool Contains(const int partition, const int gbi) const;
  /// @brief Number of included bins over all partitions
  size_t GetNBins() const;
};

/// @brief Convert number of sigmas into two sided Gaussian coverage
double GetSigmaValue(const int sigma);

/// @brief Check level lies within (0, 1)
/// @throws InvalidCredibleLevel otherwise
void CheckCredibleLevel(const double Level);

/// @brief Build HPD region for a single partition
/// @details Bins are ordered by density, bins with exactly equal density are taken
/// together so the region is fully defined by a density threshold. Mass is measured
/// relative to the weight processed in that partition.
/// @param Density Normalised density
/// @param Level Probability to enclose
/// @param Partition Partition index, 0 for unsplit densities
CredibleRegion GetCredibleRegion(const PosteriorDensity& Density, const double Level, const int Partition = 0);

/// @brief Build HPD region over the union of all mass orderings
CredibleRegion GetCombinedCredibleRegion(const PosteriorDensity& Density, const double Level);

/// @brief Build regions for several levels at once
/// @param Density Normalised density
/// @param Levels Requested levels, in sigmas if CredibleInSigmas
/// @param CredibleInSigmas Interpret levels as number of sigmas
/// @param Combine Add combined region for split densities
std::vector<CredibleRegion> GetCredibleRegions(const PosteriorDensity& Density, const std::vector<double>& Levels,
                                               const bool CredibleInSigmas = false, const bool Combine = false);

/// @brief Density histogram where everything outside the region is set to zero
std::unique_ptr<TH1> MakeRegionHistogram(const PosteriorDensity& Density, const CredibleRegion& Region, const std::string& Name);
