#include "Posteriors/PosteriorDensity.h"

// **************************************************
PosteriorDensity::PosteriorDensity(const WeightedHistogram& Histogram)
: binning(Histogram.GetBinning()), Split(Histogram.IsSplit()) {
// **************************************************
  const double InRange = Histogram.GetInRangeWeight();
  const double Total = Histogram.GetTotalWeight();
  if(InRange <= 0. || Total <= 0.) {
    NUMCMCLOG_ERROR("Can't normalise histogram without in-range weight");
    NUMCMCLOG_ERROR("In range weight {}, out of range weight {}, malformed points {}",
                    InRange, Histogram.GetOutOfRangeWeight(), Histogram.GetNMalformed());
    throw EmptyHistogram(__FILE__, __LINE__);
  }
  InRangeFraction = InRange/Total;

  const int nPartitions = Histogram.GetNPartitions();
  Densities.assign(nPartitions, std::vector<double>(binning.GetNBins(), 0.));
  Shares.assign(nPartitions, 0.);
  PartitionInRange.assign(nPartitions, 0.);

  for(int p = 0; p < nPartitions; ++p) {
    const double PartitionWeight = Histogram.GetPartitionWeight(p);
    Shares[p] = PartitionWeight/InRange;
    if(PartitionWeight <= 0.) {
      NUMCMCLOG_WARN("Partition {} holds no in-range weight, its density is left empty",
                     Split ? MassOrdering_ToString(MassOrdering(p)) : "All");
      continue;
    }
    PartitionInRange[p] = PartitionWeight/(PartitionWeight + Histogram.GetOutOfRangeWeight(p));
    for(int i = 0; i < binning.GetNBins(); ++i) {
      Densities[p][i] = Histogram.GetBinContent(p, i)/(PartitionWeight * binning.GetBinHyperVolume(i));
    }
  }
  if(InRangeFraction < 1.) {
    NUMCMCLOG_DEBUG("Fraction {:.4f} of weight fell outside of the axes", 1. - InRangeFraction);
  }
}

// **************************************************
PosteriorDensity::~PosteriorDensity() {
// **************************************************

}

// **************************************************
std::vector<double> PosteriorDensity::GetCombinedDensities() const {
// **************************************************
  std::vector<double> Combined(binning.GetNBins(), 0.);
  for(int p = 0; p < GetNPartitions(); ++p) {
    for(int i = 0; i < binning.GetNBins(); ++i) {
      Combined[i] += Shares[p] * Densities[p][i];
    }
  }
  return Combined;
}

// **************************************************
double PosteriorDensity::GetBinMass(const int Partition, const int gbi) const {
// **************************************************
  return Densities[Partition][gbi] * binning.GetBinHyperVolume(gbi) * Shares[Partition] * InRangeFraction;
}

// **************************************************
double PosteriorDensity::GetIntegral(const int Partition) const {
// **************************************************
  double Integral = 0.;
  for(int i = 0; i < binning.GetNBins(); ++i) {
    Integral += Densities[Partition][i] * binning.GetBinHyperVolume(i);
  }
  return Integral;
}

// **************************************************
std::unique_ptr<TH1> PosteriorDensity::ToHistogram(const std::string& Name, const int Partition, const bool Combined) const {
// **************************************************
  if(!Combined && (Partition < 0 || Partition >= GetNPartitions())) {
    NUMCMCLOG_ERROR("Partition {} doesn't exist, density has {} partitions", Partition, GetNPartitions());
    throw NuMCMCException(__FILE__, __LINE__);
  }
  const std::vector<double> Values = Combined ? GetCombinedDensities() : Densities[Partition];

  auto Hist = MakeEmptyHistogram(binning, Name);
  for(int i = 0; i < binning.GetNBins(); ++i) {
    const auto AxisBins = binning.DecomposeBinNumber(i);
    if(binning.GetNDimensions() == 1) {
      Hist->SetBinContent(AxisBins[0] + 1, Values[i]);
    } else {
      Hist->SetBinContent(AxisBins[0] + 1, AxisBins[1] + 1, Values[i]);
    }
  }
  Hist->SetEntries(binning.GetNBins());
  return Hist;
}

// **************************************************
std::unique_ptr<TH1> MakeEmptyHistogram(const Binning& binning, const std::string& Name, const std::string& Title) {
// **************************************************
  std::unique_ptr<TH1> Hist;
  const std::vector<double> XEdges = binning.GetBinEdges(0);
  if(binning.GetNDimensions() == 1) {
    Hist = std::make_unique<TH1D>(Name.c_str(), Title.c_str(), int(XEdges.size() - 1), XEdges.data());
  } else {
    const std::vector<double> YEdges = binning.GetBinEdges(1);
    Hist = std::make_unique<TH2D>(Name.c_str(), Title.c_str(), int(XEdges.size() - 1), XEdges.data(),
                                  int(YEdges.size() - 1), YEdges.data());
  }
  Hist->SetDirectory(nullptr);
  return Hist;
}
