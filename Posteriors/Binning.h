#pragma once

// C++ includes
#include <limits>
#include <memory>
#include <string>
#include <vector>

// NuMCMC includes
#include "Manager/YamlHelper.h"

_NuMCMC_Safe_Include_Start_ //{
// ROOT includes
#include "TAxis.h"
_NuMCMC_Safe_Include_End_ //}

/// @brief Product of one or two TAxis with a single global bin index
/// @details Bins follow the ROOT convention [low, high). The global bin index runs
/// over x fastest, gbi = ix + nx*iy, with 0-based axis bins. Anything outside
/// the axes ends up in the single flow bin npos.
/// @code
/// axes:
///   - linspace: {n: 50, low: 0, high: 1.5708}
///   - variable: [0.0, 0.1, 0.3, 0.7]
/// @endcode
struct Binning {
  constexpr static int const npos = std::numeric_limits<int>::max();

  /// @brief Build from YAML node holding "axes"
  explicit Binning(YAML::Node const &config);
  /// @brief Build from bin edges, one vector per axis
  explicit Binning(std::vector<std::vector<double>> const &edges);

  /// @brief Get global bin index for a point, y is ignored for 1D
  int GetBinNumber(const double x, const double y = 0.) const;
  /// @brief Split global bin into 0-based bin number along every axis
  std::vector<int> DecomposeBinNumber(int gbi) const;

  inline int GetNDimensions() const { return int(Axes.size()); }
  /// @brief Number of in-range bins
  inline int GetNBins() const { return nbins_per_slice.back(); }
  /// @brief Width of 1D bin or area of 2D bin
  double GetBinHyperVolume(int gbi) const;

  /// @brief Get axis, index 0 is x
  inline const TAxis& GetAxis(const int i) const { return Axes[i]; }
  /// @brief Edges of axis, size is number of bins + 1
  std::vector<double> GetBinEdges(const int i) const;

  /// @brief Same number of axes with identical edges
  bool operator==(const Binning& other) const;
  bool operator!=(const Binning& other) const { return !(*this == other); }

  std::string to_string() const;
  YAML::Node to_YAML() const;

private:
  /// @brief Check edges and create axes
  void Init(std::vector<std::vector<double>> const &edges);

  /// for each axis tells you how many bins to step to get to the next bin
  std::vector<int> nbins_per_slice;
  std::vector<TAxis> Axes;
};
