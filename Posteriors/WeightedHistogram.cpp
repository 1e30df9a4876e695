#include "Posteriors/WeightedHistogram.h"

// C++ includes
#include <algorithm>
#include <cmath>
#include <numeric>

// **************************************************
WeightedHistogram::WeightedHistogram(Binning Bins, const bool SplitByOrdering)
: binning(std::move(Bins)), Split(SplitByOrdering) {
// **************************************************
  const int nPartitions = Split ? int(kNMassOrderings) : 1;
  Weights.assign(nPartitions, std::vector<double>(binning.GetNBins(), 0.));
  OutOfRangeWeight.assign(nPartitions, 0.);
  nEntries.assign(nPartitions, 0);
  TotalWeight = 0.;
  nOutOfRange = 0;
  nMalformed = 0;
}

// **************************************************
WeightedHistogram::~WeightedHistogram() {
// **************************************************

}

// **************************************************
void WeightedHistogram::Reset() {
// **************************************************
  for(auto& Partition : Weights) std::fill(Partition.begin(), Partition.end(), 0.);
  std::fill(OutOfRangeWeight.begin(), OutOfRangeWeight.end(), 0.);
  std::fill(nEntries.begin(), nEntries.end(), 0);
  TotalWeight = 0.;
  nOutOfRange = 0;
  nMalformed = 0;
}

// **************************************************
void WeightedHistogram::Fill(const double x, const double y, const double Weight, const MassOrdering Ordering) {
// **************************************************
  const bool Is2D = (binning.GetNDimensions() == 2);
  if(!std::isfinite(x) || (Is2D && !std::isfinite(y)) || !std::isfinite(Weight)) {
    nMalformed++;
    NUMCMCLOG_TRACE("Skipping malformed point x={} y={} weight={}", x, y, Weight);
    return;
  }

  const int Partition = GetPartition(Ordering);
  nEntries[Partition]++;
  TotalWeight += Weight;

  const int gbi = binning.GetBinNumber(x, y);
  if(gbi == Binning::npos) {
    nOutOfRange++;
    OutOfRangeWeight[Partition] += Weight;
    return;
  }
  Weights[Partition][gbi] += Weight;
}

// **************************************************
void WeightedHistogram::FillBatch(const SampleBatch& Batch, const CoordinateFunction& Coordinates, const WeightFunction& Weight) {
// **************************************************
  for(const auto& Step : Batch) {
    const std::array<double, 2> Point = Coordinates(Step);
    const double w = Weight ? Weight(Step) : NuMCMC::Unity;
    Fill(Point[0], Point[1], w, Step.GetMassOrdering());
  }
}

// **************************************************
void WeightedHistogram::Add(const WeightedHistogram& Other) {
// **************************************************
  if(binning != Other.binning || Split != Other.Split) {
    NUMCMCLOG_ERROR("Can't merge histograms with different binning or mass ordering split");
    NUMCMCLOG_ERROR("This: {}", binning.to_string());
    NUMCMCLOG_ERROR("Other: {}", Other.binning.to_string());
    throw NuMCMCException(__FILE__, __LINE__);
  }
  for(int p = 0; p < GetNPartitions(); ++p) {
    for(size_t i = 0; i < Weights[p].size(); ++i) {
      Weights[p][i] += Other.Weights[p][i];
    }
    OutOfRangeWeight[p] += Other.OutOfRangeWeight[p];
    nEntries[p] += Other.nEntries[p];
  }
  TotalWeight += Other.TotalWeight;
  nOutOfRange += Other.nOutOfRange;
  nMalformed += Other.nMalformed;
}

// **************************************************
double WeightedHistogram::GetPartitionWeight(const int Partition) const {
// **************************************************
  return std::accumulate(Weights[Partition].begin(), Weights[Partition].end(), 0.);
}

// **************************************************
double WeightedHistogram::GetInRangeWeight() const {
// **************************************************
  double Sum = 0.;
  for(int p = 0; p < GetNPartitions(); ++p) Sum += GetPartitionWeight(p);
  return Sum;
}

// **************************************************
double WeightedHistogram::GetOutOfRangeWeight() const {
// **************************************************
  return std::accumulate(OutOfRangeWeight.begin(), OutOfRangeWeight.end(), 0.);
}
