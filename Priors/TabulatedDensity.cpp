#include "Priors/TabulatedDensity.h"

// C++ includes
#include <algorithm>
#include <cmath>
#include <limits>

_NuMCMC_Safe_Include_Start_ //{
// ROOT includes
#include "TFile.h"
_NuMCMC_Safe_Include_End_ //}

namespace {
  /// @brief Bin centres of an axis plus one node for underflow and one for overflow
  std::vector<double> GetAxisNodes(const TAxis* Axis) {
    const int nBins = Axis->GetNbins();
    std::vector<double> Nodes(nBins + 2);
    Nodes[0] = Axis->GetXmin() - 0.5 * Axis->GetBinWidth(1);
    for(int i = 1; i <= nBins; ++i) {
      Nodes[i] = Axis->GetBinCenter(i);
    }
    Nodes[nBins + 1] = Axis->GetXmax() + 0.5 * Axis->GetBinWidth(nBins);
    return Nodes;
  }

  /// @brief Sorted unique copy of coordinates
  std::vector<double> GetUniqueSorted(const int N, const double* Coordinates) {
    std::vector<double> Unique(Coordinates, Coordinates + N);
    std::sort(Unique.begin(), Unique.end());
    Unique.erase(std::unique(Unique.begin(), Unique.end()), Unique.end());
    return Unique;
  }

  /// @brief Find lower node of the cell holding Value and the fractional position inside it
  /// @return false if Value is outside the nodes
  bool LocateCell(const std::vector<double>& Nodes, const double Value, size_t& Lower, double& Fraction) {
    if(!(Value >= Nodes.front() && Value <= Nodes.back())) return false;
    size_t Upper = size_t(std::upper_bound(Nodes.begin(), Nodes.end(), Value) - Nodes.begin());
    if(Upper >= Nodes.size()) Upper = Nodes.size() - 1;
    Lower = Upper - 1;
    Fraction = (Value - Nodes[Lower]) / (Nodes[Upper] - Nodes[Lower]);
    return true;
  }
}

// **************************************************
std::string InterpolationMode_ToString(const InterpolationMode Mode) {
// **************************************************
  std::string name = "";

  switch(Mode) {
    case kRegularGrid:
      name = "regular";
      break;
    case kDelaunayLinear:
      name = "linear";
      break;
    case kNInterpolationModes:
    default:
      NUMCMCLOG_ERROR("You gave interpolation mode {}", static_cast<int>(Mode));
      throw NuMCMCException(__FILE__ , __LINE__ );
  }
  return name;
}

// **************************************************
InterpolationMode ParseInterpolationMode(const std::string& Name) {
// **************************************************
  for(int i = 0; i < kNInterpolationModes; ++i) {
    if(Name == InterpolationMode_ToString(InterpolationMode(i))) return InterpolationMode(i);
  }
  NUMCMCLOG_ERROR("Interpolator {} not supported, use regular or linear", Name);
  throw NuMCMCException(__FILE__, __LINE__);
}

// **************************************************
TabulatedDensity::TabulatedDensity(const TH1& Hist, const InterpolationMode mode) : Dimension(Hist.GetDimension()), Mode(mode) {
// **************************************************
  if(Dimension != 1 && Dimension != 2) {
    NUMCMCLOG_ERROR("Histogram {} has dimension {}, only 1D and 2D tables are supported", Hist.GetName(), Dimension);
    throw DimensionalityError(__FILE__, __LINE__);
  }
  XNodes = GetAxisNodes(Hist.GetXaxis());
  if(Dimension == 1) {
    Values.resize(XNodes.size());
    for(size_t ix = 0; ix < XNodes.size(); ++ix) {
      Values[ix] = Hist.GetBinContent(int(ix));
    }
  } else {
    YNodes = GetAxisNodes(Hist.GetYaxis());
    Values.resize(XNodes.size() * YNodes.size());
    for(size_t iy = 0; iy < YNodes.size(); ++iy) {
      for(size_t ix = 0; ix < XNodes.size(); ++ix) {
        Values[ix + XNodes.size() * iy] = Hist.GetBinContent(int(ix), int(iy));
      }
    }
  }
  SetupTriangulation();
}

// **************************************************
TabulatedDensity::TabulatedDensity(const TGraph2D& Graph, const InterpolationMode mode) : Dimension(2), Mode(mode) {
// **************************************************
  const int nPoints = Graph.GetN();
  XNodes = GetUniqueSorted(nPoints, Graph.GetX());
  YNodes = GetUniqueSorted(nPoints, Graph.GetY());

  if(XNodes.size() < 2 || YNodes.size() < 2 || XNodes.size() * YNodes.size() != size_t(nPoints)) {
    NUMCMCLOG_ERROR("Graph {} with {} points is not a regular grid ({} x {} distinct values)",
                    Graph.GetName(), nPoints, XNodes.size(), YNodes.size());
    throw NuMCMCException(__FILE__, __LINE__);
  }

  Values.assign(XNodes.size() * YNodes.size(), std::numeric_limits<double>::quiet_NaN());
  for(int i = 0; i < nPoints; ++i) {
    const size_t ix = size_t(std::lower_bound(XNodes.begin(), XNodes.end(), Graph.GetX()[i]) - XNodes.begin());
    const size_t iy = size_t(std::lower_bound(YNodes.begin(), YNodes.end(), Graph.GetY()[i]) - YNodes.begin());
    double& Node = Values[ix + XNodes.size() * iy];
    if(!std::isnan(Node)) {
      NUMCMCLOG_ERROR("Graph {} has two points at ({}, {})", Graph.GetName(), Graph.GetX()[i], Graph.GetY()[i]);
      throw NuMCMCException(__FILE__, __LINE__);
    }
    Node = Graph.GetZ()[i];
  }
  SetupTriangulation();
}

// **************************************************
TabulatedDensity::~TabulatedDensity() {
// **************************************************

}

// **************************************************
void TabulatedDensity::SetupTriangulation() {
// **************************************************
  if(Mode != kDelaunayLinear || Dimension != 2) return;

  Triangulation = std::make_unique<TGraph2D>(int(Values.size()));
  Triangulation->SetDirectory(nullptr);
  int Point = 0;
  for(size_t iy = 0; iy < YNodes.size(); ++iy) {
    for(size_t ix = 0; ix < XNodes.size(); ++ix) {
      Triangulation->SetPoint(Point++, XNodes[ix], YNodes[iy], GetNode(ix, iy));
    }
  }
  // Points outside the convex hull come back as NaN
  Triangulation->SetMarginBinsContent(std::numeric_limits<double>::quiet_NaN());
}

// **************************************************
double TabulatedDensity::Evaluate(const double x, const double y) const {
// **************************************************
  if(Triangulation) {
    const double Value = Triangulation->Interpolate(x, y);
    return std::isfinite(Value) ? Value : 0.;
  }
  return EvaluateRegular(x, y);
}

// **************************************************
double TabulatedDensity::EvaluateRegular(const double x, const double y) const {
// **************************************************
  size_t ix = 0;
  double tx = 0.;
  if(!LocateCell(XNodes, x, ix, tx)) return 0.;
  if(Dimension == 1) return (1. - tx) * Values[ix] + tx * Values[ix + 1];

  size_t iy = 0;
  double ty = 0.;
  if(!LocateCell(YNodes, y, iy, ty)) return 0.;
  return (1. - tx) * (1. - ty) * GetNode(ix, iy) + tx * (1. - ty) * GetNode(ix + 1, iy)
       + (1. - tx) * ty * GetNode(ix, iy + 1) + tx * ty * GetNode(ix + 1, iy + 1);
}

// **************************************************
TabulatedDensity MakeTabulatedDensityFromFile(const std::string& FileName, const std::string& ObjectName,
                                              const InterpolationMode Mode) {
// **************************************************
  NUMCMCLOG_INFO("Loading table from file: {} (object: {}, {} interpolation)", FileName, ObjectName, InterpolationMode_ToString(Mode));
  auto TableFile = std::unique_ptr<TFile>(TFile::Open(FileName.c_str(), "READ"));
  if (!TableFile || TableFile->IsZombie()) {
    NUMCMCLOG_ERROR("Failed to open file: {}", FileName);
    throw NuMCMCException(__FILE__, __LINE__);
  }
  TObject* Object = TableFile->Get(ObjectName.c_str());
  if (!Object) {
    NUMCMCLOG_ERROR("Failed to load {} from {}", ObjectName, FileName);
    throw NuMCMCException(__FILE__, __LINE__);
  }

  if(auto Hist = dynamic_cast<TH1*>(Object)) {
    return TabulatedDensity(*Hist, Mode);
  } else if(auto Graph = dynamic_cast<TGraph2D*>(Object)) {
    return TabulatedDensity(*Graph, Mode);
  }
  NUMCMCLOG_ERROR("{} in {} is a {}, expected TH1D, TH2D or TGraph2D", ObjectName, FileName, Object->ClassName());
  throw NuMCMCException(__FILE__, __LINE__);
}

// **************************************************
TabulatedDensity MakeTabulatedDensityFromYAML(const YAML::Node& Node, const InterpolationMode Default) {
// **************************************************
  const InterpolationMode Mode = Node["Interpolator"] ? ParseInterpolationMode(NMGet(std::string, Node["Interpolator"])) : Default;
  return MakeTabulatedDensityFromFile(NMGet(std::string, Node["File"]), NMGet(std::string, Node["Object"]), Mode);
}
