#include "Manager/Monitor.h"

// C++ includes
#include <algorithm>
#include <sstream>

_NuMCMC_Safe_Include_Start_ //{
// ROOT include
#include "TStopwatch.h"
_NuMCMC_Safe_Include_End_ //}

namespace NuMCMCUtils {

// *************************
void NuMCMCWelcome() {
// *************************
  static bool Printed = false;
  if(Printed) return;
  Printed = true;

  NUMCMCLOG_INFO("NuMCMCTools {}", GetNuMCMCVersion());
  NUMCMCLOG_INFO("Posterior densities and credible regions from neutrino oscillation chains");
}

// ************************
std::string GetNuMCMCVersion() {
// ************************
  #ifdef NuMCMC_VERSION
  return NuMCMC_VERSION;
  #else
  return "unknown";
  #endif
}

// ************************
Int_t ReadEntryTimed(TChain* chain, const Long64_t entry) {
// ************************
  TStopwatch clock;
  clock.Start();
  const Int_t Bytes = chain->GetEntry(entry);
  clock.Stop();

  const double Seconds = clock.RealTime();
  if(Bytes > 0 && Seconds > 0.) {
    NUMCMCLOG_INFO("Entry {} is {} B, read at {:.2f} MB/s", entry, Bytes, Bytes / (1024. * 1024. * Seconds));
  }
  return Bytes;
}

// ************************
void PrintProgressBar(const Long64_t Done, const Long64_t All) {
// ************************
  constexpr int Width = 20;
  const double Fraction = (All > 0) ? std::min(1., double(Done) / double(All)) : 1.;
  const int Filled = int(Width * Fraction);

  std::string Bar(size_t(Filled), '=');
  if(Filled < Width) Bar += ">" + std::string(size_t(Width - Filled - 1), ' ');
  NUMCMCLOG_INFO("[{}] {}/{} ({:.0f}%)", Bar, Done, All, 100. * Fraction);
}

// ***************************************************************************
void PrintConfig(const YAML::Node& node) {
// ***************************************************************************
  std::istringstream Lines(YAMLtoSTRING(node));
  for(std::string Line; std::getline(Lines, Line);) {
    NUMCMCLOG_INFO("{}", Line);
  }
}

// ***************************************************************************
void NuMCMCUsage(int argc, char **argv) {
// ***************************************************************************
  if(argc >= 2) return;
  NUMCMCLOG_ERROR("Missing config file");
  NUMCMCLOG_ERROR("Usage: {} config.yaml [Section:Key=Value ...]", argv[0]);
  throw NuMCMCException(__FILE__, __LINE__);
}

} //end namespace
