#pragma once

// C++ includes
#include <memory>
#include <string>
#include <vector>

// NuMCMC includes
#include "Manager/YamlHelper.h"

_NuMCMC_Safe_Include_Start_ //{
// ROOT includes
#include "TH1.h"
#include "TGraph2D.h"
_NuMCMC_Safe_Include_End_ //}

/// @file TabulatedDensity.h
/// @brief 1D or 2D density known on grid nodes, used by empirical priors and histogram constraints

/// @brief How values between grid nodes are obtained
enum InterpolationMode {
  kRegularGrid = 0,    //!< "regular", (bi)linear inside a grid cell
  kDelaunayLinear = 1, //!< "linear", linear on the Delaunay triangulation of the nodes

  kNInterpolationModes //!< This only enumerates
};

/// @brief Convert mode to the name used in configs
std::string InterpolationMode_ToString(const InterpolationMode Mode);
/// @brief Parse "regular" or "linear"
/// @throws NuMCMCException for anything else
InterpolationMode ParseInterpolationMode(const std::string& Name);

/// @brief Density tabulated on a rectangular grid of nodes, zero outside the grid
/// @details For histograms the nodes are the bin centres including under and overflow,
/// so the outermost nodes sit half a bin outside the axis range. TGraph2D input must
/// hold a complete regular grid. In 1D both interpolation modes are piecewise linear.
class TabulatedDensity {
 public:
  /// @brief Take nodes from TH1D or TH2D bin centres
  /// @throws DimensionalityError for histograms with more than two dimensions
  TabulatedDensity(const TH1& Hist, const InterpolationMode Mode = kRegularGrid);
  /// @brief Take nodes from TGraph2D points on a regular grid
  /// @throws NuMCMCException if the points don't form a complete grid
  TabulatedDensity(const TGraph2D& Graph, const InterpolationMode Mode = kRegularGrid);
  /// @brief Destructor
  ~TabulatedDensity();

  TabulatedDensity(TabulatedDensity&&) = default;
  TabulatedDensity& operator=(TabulatedDensity&&) = default;

  /// @brief Interpolated density, zero outside the grid
  /// @param x Value of first variable
  /// @param y Value of second variable, ignored in 1D
  double Evaluate(const double x, const double y = 0.) const;

  inline int GetDimension() const { return Dimension; }
  inline InterpolationMode GetMode() const { return Mode; }
  inline const std::vector<double>& GetXNodes() const { return XNodes; }
  inline const std::vector<double>& GetYNodes() const { return YNodes; }

 private:
  /// @brief Bilinear interpolation in the grid cell containing (x, y)
  double EvaluateRegular(const double x, const double y) const;
  /// @brief Triangulate nodes for kDelaunayLinear
  void SetupTriangulation();
  /// @brief Value at node (ix, iy)
  inline double GetNode(const size_t ix, const size_t iy) const { return Values[ix + XNodes.size() * iy]; }

  /// 1 or 2
  int Dimension;
  /// Interpolation between nodes
  InterpolationMode Mode;
  /// Node coordinates along each axis, increasing
  std::vector<double> XNodes;
  std::vector<double> YNodes;
  /// Density at nodes, x runs fastest
  std::vector<double> Values;
  /// Delaunay triangulation, only for 2D kDelaunayLinear
  std::unique_ptr<TGraph2D> Triangulation;
};

/// @brief Open ROOT file and build density from the TH1 or TGraph2D stored in it
TabulatedDensity MakeTabulatedDensityFromFile(const std::string& FileName, const std::string& ObjectName,
                                              const InterpolationMode Mode);

/// @brief Build density from config
/// @code
/// File: T23Prior.root
/// Object: h_prior
/// Interpolator: linear
/// @endcode
/// @param Default Mode used when Interpolator is not given
TabulatedDensity MakeTabulatedDensityFromYAML(const YAML::Node& Node, const InterpolationMode Default);
