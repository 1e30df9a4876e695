#include "Chains/ChainMetadata.h"

// **************************************************
ChainMetadata::ChainMetadata() {
// **************************************************
  for(int i = 0; i < kNPhysicalParameters; ++i) {
    Priors[i] = std::make_shared<const PriorModel>(ParsePriorSpec(PhysicalParameter_ToString(PhysicalParameter(i)), "Uniform:x"));
  }
  Citation = "";
}

// **************************************************
ChainMetadata::~ChainMetadata() {
// **************************************************

}

// **************************************************
ChainMetadata ChainMetadata::MakeFromYAML(const YAML::Node& Node) {
// **************************************************
  ChainMetadata Metadata;

  const YAML::Node& PriorNode = Node["Priors"];
  for(int i = 0; i < kNPhysicalParameters; ++i) {
    const std::string Name = PhysicalParameter_ToString(PhysicalParameter(i));
    if(!PriorNode || !PriorNode[Name]) {
      NUMCMCLOG_WARN("No prior given for {}, assuming Uniform:x", Name);
      continue;
    }
    Metadata.SetPrior(MakePriorSpecFromYAML(Name, PriorNode[Name]));
  }
  if(PriorNode) {
    for(const auto& Entry : PriorNode) {
      const std::string Name = Entry.first.as<std::string>();
      bool Found = false;
      for(int i = 0; i < kNPhysicalParameters; ++i) {
        if(Name == PhysicalParameter_ToString(PhysicalParameter(i))) Found = true;
      }
      if(!Found) {
        NUMCMCLOG_ERROR("Chain prior given for {} which is not a physical parameter", Name);
        throw DimensionalityError(__FILE__, __LINE__);
      }
    }
  }

  if(Node["Constraints"]) {
    for(const auto& Entry : Node["Constraints"]) {
      Metadata.AddConstraint(MakeConstraintFromYAML(Entry.first.as<std::string>(), Entry.second));
    }
  }
  Metadata.SetCitation(GetFromManager<std::string>(Node["Citation"], "", __FILE__, __LINE__));
  return Metadata;
}

// **************************************************
void ChainMetadata::SetPrior(const PriorSpec& Spec) {
// **************************************************
  for(int i = 0; i < kNPhysicalParameters; ++i) {
    if(Spec.Variable == PhysicalParameter_ToString(PhysicalParameter(i))) {
      Priors[i] = std::make_shared<const PriorModel>(Spec);
      return;
    }
  }
  NUMCMCLOG_ERROR("Chain priors can only be set for physical parameters, got {}", Spec.Variable);
  throw DimensionalityError(__FILE__, __LINE__);
}

// **************************************************
std::shared_ptr<const PriorModel> ChainMetadata::GetPrior(const std::string& Name) const {
// **************************************************
  for(int i = 0; i < kNPhysicalParameters; ++i) {
    if(Name == PhysicalParameter_ToString(PhysicalParameter(i))) return Priors[i];
  }
  NUMCMCLOG_ERROR("{} is not a physical parameter, chain has no prior for it", Name);
  throw DimensionalityError(__FILE__, __LINE__);
}

// **************************************************
void ChainMetadata::AddConstraint(std::shared_ptr<const ExternalConstraint> Constraint) {
// **************************************************
  if(!Constraint) {
    NUMCMCLOG_ERROR("Trying to add empty constraint");
    throw NuMCMCException(__FILE__, __LINE__);
  }
  for(const auto& Existing : Constraints) {
    if(Existing->GetName() == Constraint->GetName()) {
      NUMCMCLOG_ERROR("Constraint {} is already defined", Constraint->GetName());
      throw NuMCMCException(__FILE__, __LINE__);
    }
  }
  Constraints.push_back(std::move(Constraint));
}

// **************************************************
std::shared_ptr<const ExternalConstraint> ChainMetadata::GetConstraint(const std::string& Name) const {
// **************************************************
  for(const auto& Constraint : Constraints) {
    if(Constraint->GetName() == Name) return Constraint;
  }
  NUMCMCLOG_ERROR("Constraint {} not found, available constraints are:", Name);
  for(const auto& Constraint : Constraints) {
    NUMCMCLOG_ERROR("  {}", Constraint->GetName());
  }
  throw NuMCMCException(__FILE__, __LINE__);
}

// **************************************************
void ChainMetadata::Print() const {
// **************************************************
  NUMCMCLOG_INFO("Chain priors:");
  for(int i = 0; i < kNPhysicalParameters; ++i) {
    NUMCMCLOG_INFO("  {:<12} {}", PhysicalParameter_ToString(PhysicalParameter(i)), Priors[i]->GetSpec().ToString());
  }
  if(!Constraints.empty()) {
    NUMCMCLOG_INFO("External constraints:");
    for(const auto& Constraint : Constraints) {
      NUMCMCLOG_INFO("  {:<12} {}D, {} ordering{}", Constraint->GetName(), Constraint->GetDimension(),
                     ConstraintScope_ToString(Constraint->GetScope()), Constraint->IsAutoApply() ? ", auto applied" : "");
    }
  }
  if(!Citation.empty()) NUMCMCLOG_INFO("Please cite: {}", Citation);
}
