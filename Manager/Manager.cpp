#include "Manager/Manager.h"

_NuMCMC_Safe_Include_Start_ //{
// ROOT include
#include "TFile.h"
#include "TTree.h"
_NuMCMC_Safe_Include_End_ //}

// *************************
manager::manager(std::string const &filename)
: config(NMOpenConfig(filename)) {
// *************************
  FileName = filename;

  Initialise();
}

// *************************
manager::manager(const YAML::Node ConfigNode) {
// *************************
  config = ConfigNode;
  FileName = "unknown";

  Initialise();
}

// *************************
void manager::Initialise() {
// *************************
  SetNuMCMCLoggerFormat();
  NuMCMCUtils::NuMCMCWelcome();

  if (CheckNodeExists(config, "General", "LogLevel")) {
    SetNuMCMCLogLevel(NMGet(std::string, config["General"]["LogLevel"]));
  }

  NUMCMCLOG_INFO("Setting config to be: {}", FileName);
  NUMCMCLOG_INFO("Config is now: ");
  NuMCMCUtils::PrintConfig(config);
}

// *************************
manager::~manager() {
// *************************
}

// *************************
// Save all the settings of the class to an output file
void manager::SaveSettings(TFile* const OutputFile) const {
// *************************
  std::string OutputFilename = std::string(OutputFile->GetName());
  OutputFile->cd();

  // Embed the config used for this app
  TMacro ConfigSave = YAMLtoTMacro(config, "NuMCMC_Config");
  ConfigSave.Write();

  // The Branch!
  TTree *SaveBranch = new TTree("Settings", "Settings");

  std::string Version = NuMCMCUtils::GetNuMCMCVersion();
  SaveBranch->Branch("Output", &OutputFilename);
  SaveBranch->Branch("Version", &Version);

  SaveBranch->Fill();
  SaveBranch->Write();

  delete SaveBranch;
}

// *************************
void manager::Print() const {
// *************************
  NUMCMCLOG_INFO("---------------------------------");
  NuMCMCUtils::PrintConfig(config);
  NUMCMCLOG_INFO("---------------------------------");
}

// *************************
void manager::ApplyOverrides(const std::vector<std::string>& Overrides) {
// *************************
  for (const auto& Override : Overrides) {
    const auto EqualPos = Override.find('=');
    const auto ColonPos = Override.find(':');
    if (EqualPos == std::string::npos || ColonPos == std::string::npos || ColonPos > EqualPos) {
      NUMCMCLOG_ERROR("Can't understand override {}, expected Section:Key=Value", Override);
      throw NuMCMCException(__FILE__, __LINE__);
    }
    const std::string Section = Override.substr(0, ColonPos);
    const std::string Key = Override.substr(ColonPos + 1, EqualPos - ColonPos - 1);
    const std::string Value = Override.substr(EqualPos + 1);

    NUMCMCLOG_INFO("Overriding {}:{} with {}", Section, Key, Value);
    //Parse the value so sequences and numbers keep their YAML type
    OverrideSettings(Section, Key, STRINGtoYAML(Value));
    if (Section == "General" && Key == "LogLevel") SetNuMCMCLogLevel(Value);
  }
}
