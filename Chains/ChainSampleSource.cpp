#include "Chains/ChainSampleSource.h"

// C++ includes
#include <algorithm>

// NuMCMC includes
#include "Manager/Monitor.h"

_NuMCMC_Safe_Include_Start_ //{
// ROOT includes
#include "TFile.h"
#include "TLeaf.h"
#include "TMacro.h"
_NuMCMC_Safe_Include_End_ //}

// **************************************************
ChainSampleSource::ChainSampleSource(const std::vector<std::string>& Files, const std::string& treename,
                                     const YAML::Node& MetadataNode) : TreeName(treename) {
// **************************************************
  nEntries = 0;
  CurrentEntry = 0;
  Buffer.fill(NuMCMC::_BAD_DOUBLE_);

  if(Files.empty()) {
    NUMCMCLOG_ERROR("No chain files given");
    throw NuMCMCException(__FILE__, __LINE__);
  }

  ScanInput(Files);

  if(MetadataNode && !MetadataNode.IsNull()) {
    NUMCMCLOG_INFO("Using chain metadata from config");
    Metadata = ChainMetadata::MakeFromYAML(MetadataNode);
  } else {
    ReadMetadataFromFile(Files[0]);
  }
  Metadata.Print();
}

// **************************************************
ChainSampleSource::~ChainSampleSource() {
// **************************************************

}

// **************************************************
void ChainSampleSource::ScanInput(const std::vector<std::string>& Files) {
// **************************************************
  Chain = std::make_unique<TChain>(TreeName.c_str(), TreeName.c_str());
  for(const auto& File : Files) {
    NUMCMCLOG_INFO("Adding file {} to chain", File);
    if(Chain->Add(File.c_str()) == 0) {
      NUMCMCLOG_ERROR("Couldn't add {} with tree {} to chain", File, TreeName);
      throw NuMCMCException(__FILE__, __LINE__);
    }
  }
  nEntries = Chain->GetEntries();
  if(nEntries <= 0) {
    NUMCMCLOG_ERROR("Chain with tree {} has no entries", TreeName);
    throw NuMCMCException(__FILE__, __LINE__);
  }

  // Set all the branches to off
  Chain->SetBranchStatus("*", false);
  for(int i = 0; i < kNPhysicalParameters; ++i) {
    const std::string Name = PhysicalParameter_ToString(PhysicalParameter(i));
    TBranch* Branch = Chain->GetBranch(Name.c_str());
    if(Branch == nullptr) {
      NUMCMCLOG_ERROR("Compulsory variable {} not found in tree {}", Name, TreeName);
      throw NuMCMCException(__FILE__, __LINE__);
    }
    TLeaf* Leaf = Branch->GetLeaf(Name.c_str());
    if(Leaf == nullptr && Branch->GetListOfLeaves()->GetEntries() > 0) Leaf = static_cast<TLeaf*>(Branch->GetListOfLeaves()->At(0));
    const std::string LeafType = (Leaf != nullptr) ? Leaf->GetTypeName() : "";
    if(LeafType != "Double_t") {
      NUMCMCLOG_ERROR("Branch {} in tree {} holds {}, expected Double_t", Name, TreeName, LeafType.empty() ? "no leaf" : LeafType);
      throw NuMCMCException(__FILE__, __LINE__);
    }
    Chain->SetBranchStatus(Name.c_str(), true);
    Chain->SetBranchAddress(Name.c_str(), &Buffer[i]);
  }
  NUMCMCLOG_INFO("Chain has {} entries", nEntries);
}

// **************************************************
void ChainSampleSource::ReadMetadataFromFile(const std::string& FileName) {
// **************************************************
  auto TempFile = std::unique_ptr<TFile>(TFile::Open(FileName.c_str(), "READ"));
  if (!TempFile || TempFile->IsZombie()) {
    NUMCMCLOG_ERROR("Couldn't open {} to read chain metadata", FileName);
    throw NuMCMCException(__FILE__, __LINE__);
  }
  TMacro *MetadataMacro = TempFile->Get<TMacro>("NuMCMC_Metadata");
  if(MetadataMacro == nullptr) {
    NUMCMCLOG_WARN("Didn't find NuMCMC_Metadata in {}, all chain priors assumed Uniform:x", FileName);
    TempFile->Close();
    return;
  }
  NUMCMCLOG_INFO("Reading chain metadata from {}", FileName);
  try {
    Metadata = ChainMetadata::MakeFromYAML(TMacroToYAML(*MetadataMacro));
  } catch (const NuMCMCException& e) {
    NUMCMCLOG_WARN("NuMCMC_Metadata in {} can't be used ({}), all chain priors assumed Uniform:x", FileName, e.what());
    Metadata = ChainMetadata();
  } catch (const YAML::Exception& e) {
    NUMCMCLOG_WARN("NuMCMC_Metadata in {} can't be used ({}), all chain priors assumed Uniform:x", FileName, e.what());
    Metadata = ChainMetadata();
  }
  delete MetadataMacro;
  TempFile->Close();
}

// **************************************************
size_t ChainSampleSource::NextBatch(SampleBatch& Batch, const size_t MaxRows) {
// **************************************************
  Batch.clear();
  if(MaxRows == 0) {
    NUMCMCLOG_ERROR("Asking for batch of zero size");
    throw NuMCMCException(__FILE__, __LINE__);
  }
  const Long64_t Last = std::min(nEntries, CurrentEntry + Long64_t(MaxRows));
  Batch.reserve(size_t(Last - CurrentEntry));

  for(; CurrentEntry < Last; ++CurrentEntry) {
    const Int_t Bytes = (CurrentEntry == 0) ? NuMCMCUtils::ReadEntryTimed(Chain.get(), CurrentEntry) : Chain->GetEntry(CurrentEntry);
    if(Bytes <= 0) {
      NUMCMCLOG_ERROR("Failed to read entry {} of tree {}", CurrentEntry, TreeName);
      throw NuMCMCException(__FILE__, __LINE__);
    }
    Sample Step;
    Step.Physical = Buffer;
    Batch.push_back(Step);
  }
  if(!Batch.empty()) {
    NuMCMCUtils::PrintProgressBar(CurrentEntry, nEntries);
  }
  return Batch.size();
}
