#include "Posteriors/Binning.h"

// C++ includes
#include <cmath>
#include <sstream>

_NuMCMC_Safe_Include_Start_ //{
// fmt includes
#include "spdlog/fmt/ranges.h"
_NuMCMC_Safe_Include_End_ //}

namespace {
std::vector<double> get_bin_edges_from_node(YAML::Node const &ax_node) {
  // builds a uniform binning from an nbins,start,stop type
  // specification
  if (ax_node["linspace"]) {
    int nbins = NMGet(int, ax_node["linspace"]["n"]);
    double start = NMGet(double, ax_node["linspace"]["low"]);
    double stop = NMGet(double, ax_node["linspace"]["high"]);

    if (nbins <= 0) {
      NUMCMCLOG_ERROR("linspace axis needs positive number of bins, got {}", nbins);
      throw NuMCMCException(__FILE__, __LINE__);
    }

    double width = (stop - start) / double(nbins);
    std::vector<double> bin_edges;
    for (int i = 0; i < nbins; ++i) {
      bin_edges.push_back(start + i * width);
    }
    bin_edges.push_back(stop);
    return bin_edges;
  } else if (ax_node["variable"]) {
    return NMGet(std::vector<double>, ax_node["variable"]);
  } else {
    NUMCMCLOG_ERROR(
        "No valid axis binning definition found, valid values: linspace: "
        "{{n: 10, low: 0, high: 10}}, variable: [edge0, edge1, ....]");
    NUMCMCLOG_ERROR("YAML::Dump follows:\n{}\n", YAMLtoSTRING(ax_node));
    throw NuMCMCException(__FILE__, __LINE__);
  }
}
}

Binning::Binning(YAML::Node const &config) {
  if (!config["axes"] || !config["axes"].IsSequence()) {
    NUMCMCLOG_ERROR("No valid binning definition found, expected a top level node "
                    "keyed \"axes\".");
    NUMCMCLOG_ERROR("YAML::Dump follows:\n{}\n", YAMLtoSTRING(config));
    throw NuMCMCException(__FILE__, __LINE__);
  }
  std::vector<std::vector<double>> edges;
  for (auto const &ax : config["axes"]) {
    edges.push_back(get_bin_edges_from_node(ax));
  }
  Init(edges);
}

Binning::Binning(std::vector<std::vector<double>> const &edges) {
  Init(edges);
}

void Binning::Init(std::vector<std::vector<double>> const &edges) {
  if (edges.size() != 1 && edges.size() != 2) {
    NUMCMCLOG_ERROR("Binning needs 1 or 2 axes, got {}", edges.size());
    throw DimensionalityError(__FILE__, __LINE__);
  }
  nbins_per_slice = {
      1,
  };
  for (auto const &ax_edges : edges) {
    if (ax_edges.size() < 2) {
      NUMCMCLOG_ERROR("Axis needs at least two edges, got: {}", ax_edges);
      throw NuMCMCException(__FILE__, __LINE__);
    }
    for (size_t i = 0; i < ax_edges.size(); ++i) {
      if (!std::isfinite(ax_edges[i]) || (i > 0 && ax_edges[i] <= ax_edges[i - 1])) {
        NUMCMCLOG_ERROR("Bin edges have to be finite and strictly increasing, got: {}", ax_edges);
        throw NuMCMCException(__FILE__, __LINE__);
      }
    }
    Axes.emplace_back(int(ax_edges.size() - 1), ax_edges.data());
    nbins_per_slice.push_back(nbins_per_slice.back() * Axes.back().GetNbins());
  }
}

int Binning::GetBinNumber(const double x, const double y) const {
  const double values[2] = {x, y};

  int gbin = 0;
  for (size_t ax_i = 0; ax_i < Axes.size(); ++ax_i) {
    int ax_bin = Axes[ax_i].FindFixBin(values[ax_i]);
    // flow bin on this axis. The flow bins here are in ROOT convention
    if ((ax_bin == 0) || (ax_bin == (Axes[ax_i].GetNbins() + 1))) {
      return npos;
    }
    // get rid of the ROOT underflow along each axis
    gbin += (ax_bin - 1) * nbins_per_slice[ax_i];
  }
  return gbin;
}

std::vector<int> Binning::DecomposeBinNumber(int gbi) const {
  if ((gbi < 0) || (gbi >= GetNBins())) {
    return {};
  }

  std::vector<int> axis_binning;
  for (int ax_i = int(Axes.size() - 1); ax_i >= 0; --ax_i) {
    int ax_bin = gbi / nbins_per_slice[ax_i];
    axis_binning.insert(axis_binning.begin(), ax_bin);
    gbi = gbi % nbins_per_slice[ax_i];
  }
  return axis_binning;
}

double Binning::GetBinHyperVolume(int gbi) const {
  auto ax_bins = DecomposeBinNumber(gbi);

  if (!ax_bins.size()) {
    NUMCMCLOG_ERROR("Bin {} is not an in-range bin of {}", gbi, to_string());
    throw NuMCMCException(__FILE__, __LINE__);
  }

  double hv = 1;
  for (int axi = 0; axi < GetNDimensions(); ++axi) {
    // back to ROOT underflow convention
    hv *= Axes[axi].GetBinWidth(ax_bins[axi] + 1);
  }
  return hv;
}

std::vector<double> Binning::GetBinEdges(const int i) const {
  std::vector<double> edges;
  for (int b = 1; b <= Axes[i].GetNbins() + 1; ++b) {
    edges.push_back(Axes[i].GetBinLowEdge(b));
  }
  return edges;
}

bool Binning::operator==(const Binning& other) const {
  if (GetNDimensions() != other.GetNDimensions()) return false;
  for (int i = 0; i < GetNDimensions(); ++i) {
    if (GetBinEdges(i) != other.GetBinEdges(i)) return false;
  }
  return true;
}

std::string Binning::to_string() const {
  std::stringstream ss;
  ss << "Binning: " << GetNDimensions() << "D, " << GetNBins() << " bins" << std::endl;
  for (int i = 0; i < GetNDimensions(); ++i) {
    ss << fmt::format("  axis {}: {}", i, GetBinEdges(i)) << std::endl;
  }
  return ss.str();
}

YAML::Node Binning::to_YAML() const {
  YAML::Node config;
  for (int i = 0; i < GetNDimensions(); ++i) {
    YAML::Node ax;
    ax["variable"] = GetBinEdges(i);
    config["axes"].push_back(ax);
  }
  return config;
}
