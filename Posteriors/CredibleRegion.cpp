#include "Posteriors/CredibleRegion.h"

// C++ includes
#include <algorithm>
#include <cmath>

namespace {
  /// @brief Candidate bin for a region
  struct RegionCandidate {
    /// Value bins are ordered by
    double Density;
    /// Probability carried by bin
    double Mass;
    int Partition;
    int Bin;
  };

  /// @brief Take candidates in decreasing density, whole equal-density groups at a time, until Level is reached
  CredibleRegion CollectRegion(std::vector<RegionCandidate>& Candidates, const double Level, const int nPartitions) {
    // Ties are broken on bin index so the ordering is reproducible, groups are never split anyway
    std::sort(Candidates.begin(), Candidates.end(), [](const RegionCandidate& a, const RegionCandidate& b) {
      if(a.Density != b.Density) return a.Density > b.Density;
      if(a.Partition != b.Partition) return a.Partition < b.Partition;
      return a.Bin < b.Bin;
    });

    CredibleRegion Region;
    Region.Level = Level;
    Region.Bins.resize(nPartitions);

    long double Sum = 0;
    size_t i = 0;
    while(i < Candidates.size()) {
      size_t GroupEnd = i;
      long double GroupMass = 0;
      while(GroupEnd < Candidates.size() && Candidates[GroupEnd].Density == Candidates[i].Density) {
        GroupMass += Candidates[GroupEnd].Mass;
        ++GroupEnd;
      }
      for(size_t j = i; j < GroupEnd; ++j) {
        Region.Bins[Candidates[j].Partition].push_back(Candidates[j].Bin);
      }
      Sum += GroupMass;
      Region.Threshold = Candidates[i].Density;
      i = GroupEnd;

      if(Sum >= Level - NuMCMC::CoverageTolerance) {
        Region.Reached = true;
        break;
      }
    }
    Region.Mass = double(Sum);
    return Region;
  }
}

// **************************************************
bool CredibleRegion::Contains(const int partition, const int gbi) const {
// **************************************************
  if(partition < 0 || partition >= int(Bins.size())) return false;
  return std::find(Bins[partition].begin(), Bins[partition].end(), gbi) != Bins[partition].end();
}

// **************************************************
size_t CredibleRegion::GetNBins() const {
// **************************************************
  size_t n = 0;
  for(const auto& PartitionBins : Bins) n += PartitionBins.size();
  return n;
}

// *********************
double GetSigmaValue(const int sigma) {
// *********************
  double width = 0;
  switch (sigma)
  {
    case 1:
      width = 0.682689492137;
      break;
    case 2:
      width = 0.954499736104;
      break;
    case 3:
      width = 0.997300203937;
      break;
    case 4:
      width = 0.999936657516;
      break;
    case 5:
      width = 0.999999426697;
      break;
    case 6:
      width = 0.999999998027;
      break;
    default:
      NUMCMCLOG_ERROR("{}  is unsupported value of sigma", sigma);
      throw InvalidCredibleLevel(__FILE__ , __LINE__ );
  }
  return width;
}

// **************************************************
void CheckCredibleLevel(const double Level) {
// **************************************************
  if(!(Level > 0. && Level < 1.)) {
    NUMCMCLOG_ERROR("Specified credible level is {}, it has to be between 0 and 1", Level);
    throw InvalidCredibleLevel(__FILE__ , __LINE__ );
  }
}

// **************************************************
CredibleRegion GetCredibleRegion(const PosteriorDensity& Density, const double Level, const int Partition) {
// **************************************************
  CheckCredibleLevel(Level);
  if(Partition < 0 || Partition >= Density.GetNPartitions()) {
    NUMCMCLOG_ERROR("Partition {} doesn't exist, density has {} partitions", Partition, Density.GetNPartitions());
    throw NuMCMCException(__FILE__, __LINE__);
  }
  const Binning& binning = Density.GetBinning();
  const double InRange = Density.GetPartitionInRangeFraction(Partition);

  if(Density.GetPartitionShare(Partition) <= 0.) {
    NUMCMCLOG_WARN("Partition {} is empty, returning empty {:.4f} credible region", Partition, Level);
    CredibleRegion Region;
    Region.Level = Level;
    Region.Partition = Partition;
    Region.Bins.resize(Density.GetNPartitions());
    return Region;
  }

  std::vector<RegionCandidate> Candidates;
  Candidates.reserve(binning.GetNBins());
  for(int i = 0; i < binning.GetNBins(); ++i) {
    const double d = Density.GetDensity(Partition, i);
    Candidates.push_back({d, d * binning.GetBinHyperVolume(i) * InRange, Partition, i});
  }

  CredibleRegion Region = CollectRegion(Candidates, Level, Density.GetNPartitions());
  Region.Partition = Partition;
  if(!Region.Reached) {
    NUMCMCLOG_WARN("Credible level {:.4f} can't be reached in partition {}, only {:.4f} is in range. Using all bins",
                   Level, Partition, Region.Mass);
  }
  return Region;
}

// **************************************************
CredibleRegion GetCombinedCredibleRegion(const PosteriorDensity& Density, const double Level) {
// **************************************************
  CheckCredibleLevel(Level);
  const Binning& binning = Density.GetBinning();

  std::vector<RegionCandidate> Candidates;
  Candidates.reserve(binning.GetNBins() * Density.GetNPartitions());
  for(int p = 0; p < Density.GetNPartitions(); ++p) {
    if(Density.GetPartitionShare(p) <= 0.) continue;
    for(int i = 0; i < binning.GetNBins(); ++i) {
      Candidates.push_back({Density.GetDensity(p, i) * Density.GetPartitionShare(p), Density.GetBinMass(p, i), p, i});
    }
  }

  CredibleRegion Region = CollectRegion(Candidates, Level, Density.GetNPartitions());
  Region.Combined = true;
  if(!Region.Reached) {
    NUMCMCLOG_WARN("Credible level {:.4f} can't be reached, only {:.4f} is in range. Using all bins", Level, Region.Mass);
  }
  return Region;
}

// **************************************************
std::vector<CredibleRegion> GetCredibleRegions(const PosteriorDensity& Density, const std::vector<double>& Levels,
                                               const bool CredibleInSigmas, const bool Combine) {
// **************************************************
  std::vector<CredibleRegion> Regions;
  for(const double Requested : Levels) {
    // Levels may be given either as probability or as number of sigmas
    if(CredibleInSigmas && (Requested != std::round(Requested) || Requested < 1. || Requested > 6.)) {
      NUMCMCLOG_ERROR("Credible level of {} sigma requested, only whole numbers from 1 to 6 are supported", Requested);
      throw InvalidCredibleLevel(__FILE__ , __LINE__ );
    }
    const double Level = CredibleInSigmas ? GetSigmaValue(int(Requested)) : Requested;
    for(int p = 0; p < Density.GetNPartitions(); ++p) {
      Regions.push_back(GetCredibleRegion(Density, Level, p));
    }
    if(Combine && Density.IsSplit()) {
      Regions.push_back(GetCombinedCredibleRegion(Density, Level));
    }
  }
  return Regions;
}

// **************************************************
std::unique_ptr<TH1> MakeRegionHistogram(const PosteriorDensity& Density, const CredibleRegion& Region, const std::string& Name) {
// **************************************************
  const Binning& binning = Density.GetBinning();
  auto Hist = MakeEmptyHistogram(binning, Name, fmt::format("{:.2f}% credible region", 100. * Region.Level));

  std::vector<double> Values(binning.GetNBins(), 0.);
  for(int p = 0; p < int(Region.Bins.size()); ++p) {
    for(const int gbi : Region.Bins[p]) {
      Values[gbi] += Region.Combined ? Density.GetPartitionShare(p) * Density.GetDensity(p, gbi) : Density.GetDensity(p, gbi);
    }
  }
  for(int i = 0; i < binning.GetNBins(); ++i) {
    const auto AxisBins = binning.DecomposeBinNumber(i);
    if(binning.GetNDimensions() == 1) {
      Hist->SetBinContent(AxisBins[0] + 1, Values[i]);
    } else {
      Hist->SetBinContent(AxisBins[0] + 1, AxisBins[1] + 1, Values[i]);
    }
  }
  return Hist;
}
