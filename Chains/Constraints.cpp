#include "Chains/Constraints.h"

// C++ includes
#include <cmath>
#include <limits>

_NuMCMC_Safe_Include_Start_ //{
// ROOT includes
#include "TFile.h"
#include "TMath.h"
// fmt includes
#include "spdlog/fmt/ranges.h"
_NuMCMC_Safe_Include_End_ //}

// **************************************************
std::string ConstraintScope_ToString(const ConstraintScope Scope) {
// **************************************************
  std::string name = "";

  switch(Scope) {
    case kBothOrderings:
      name = "Both";
      break;
    case kNormalOnly:
      name = "NO";
      break;
    case kInvertedOnly:
      name = "IO";
      break;
    case kNConstraintScopes:
    default:
      NUMCMCLOG_ERROR("You gave constraint scope {}", static_cast<int>(Scope));
      throw NuMCMCException(__FILE__ , __LINE__ );
  }
  return name;
}

// **************************************************
ConstraintScope ParseConstraintScope(const std::string& Name) {
// **************************************************
  for(int i = 0; i < kNConstraintScopes; ++i) {
    if(Name == ConstraintScope_ToString(ConstraintScope(i))) return ConstraintScope(i);
  }
  NUMCMCLOG_ERROR("Constraint scope {} not supported, use Both, NO or IO", Name);
  throw NuMCMCException(__FILE__, __LINE__);
}

// **************************************************
ExternalConstraint::ExternalConstraint(std::string name, std::vector<std::string> variables,
                                       const ConstraintScope scope, const bool autoapply)
: Name(std::move(name)), Variables(std::move(variables)), Scope(scope), AutoApply(autoapply) {
// **************************************************
  if(Variables.size() != 1 && Variables.size() != 2) {
    NUMCMCLOG_ERROR("Constraint {} is defined over {} variables, only 1D and 2D are supported", Name, Variables.size());
    throw DimensionalityError(__FILE__, __LINE__);
  }
}

// **************************************************
ExternalConstraint::~ExternalConstraint() {
// **************************************************

}

// **************************************************
bool ExternalConstraint::AppliesTo(const MassOrdering Ordering) const {
// **************************************************
  if(Scope == kBothOrderings) return true;
  if(Scope == kNormalOnly) return Ordering == kNormalOrdering;
  return Ordering == kInvertedOrdering;
}

// **************************************************
GaussianConstraint::GaussianConstraint(std::string name, std::string Variable, const double mean, const double sigma,
                                       const ConstraintScope scope, const bool autoapply)
: ExternalConstraint(std::move(name), {std::move(Variable)}, scope, autoapply), Mean(mean), Sigma(sigma) {
// **************************************************
  if(Sigma <= 0) {
    NUMCMCLOG_ERROR("Gaussian constraint {} has non positive sigma {}", Name, Sigma);
    throw NuMCMCException(__FILE__, __LINE__);
  }
}

// **************************************************
GaussianConstraint::~GaussianConstraint() {
// **************************************************

}

// **************************************************
double GaussianConstraint::Evaluate(const double x, const double) const {
// **************************************************
  const double Chi = (x - Mean)/Sigma;
  return std::exp(-0.5 * Chi * Chi);
}

// **************************************************
HistogramConstraint::HistogramConstraint(std::string name, std::vector<std::string> variables, TabulatedDensity table,
                                         const ConstraintScope scope, const bool autoapply)
: ExternalConstraint(std::move(name), std::move(variables), scope, autoapply), Table(std::move(table)) {
// **************************************************
  if(Table.GetDimension() != GetDimension()) {
    NUMCMCLOG_ERROR("Constraint {} has {} variables but its table has dimension {}",
                    Name, GetDimension(), Table.GetDimension());
    throw DimensionalityError(__FILE__, __LINE__);
  }
}

// **************************************************
HistogramConstraint::~HistogramConstraint() {
// **************************************************

}

// **************************************************
double HistogramConstraint::Evaluate(const double x, const double y) const {
// **************************************************
  return Table.Evaluate(x, y);
}

// **************************************************
Chi2GraphConstraint::Chi2GraphConstraint(std::string name, std::string Variable, std::unique_ptr<TGraph> Graph,
                                         const ConstraintScope scope, const bool autoapply)
: ExternalConstraint(std::move(name), {std::move(Variable)}, scope, autoapply), Graph1D(std::move(Graph)) {
// **************************************************
  if(!Graph1D || Graph1D->GetN() < 2) {
    NUMCMCLOG_ERROR("Constraint {} needs a graph with at least two points", Name);
    throw NuMCMCException(__FILE__, __LINE__);
  }
  XMin = TMath::MinElement(Graph1D->GetN(), Graph1D->GetX());
  XMax = TMath::MaxElement(Graph1D->GetN(), Graph1D->GetX());
}

// **************************************************
Chi2GraphConstraint::Chi2GraphConstraint(std::string name, std::vector<std::string> variables, std::unique_ptr<TGraph2D> Graph,
                                         const ConstraintScope scope, const bool autoapply)
: ExternalConstraint(std::move(name), std::move(variables), scope, autoapply), Graph2D(std::move(Graph)) {
// **************************************************
  if(!Graph2D || Graph2D->GetN() < 3) {
    NUMCMCLOG_ERROR("Constraint {} needs a 2D graph with at least three points", Name);
    throw NuMCMCException(__FILE__, __LINE__);
  }
  if(GetDimension() != 2) {
    NUMCMCLOG_ERROR("Constraint {} uses TGraph2D but has {} variables", Name, GetDimension());
    throw DimensionalityError(__FILE__, __LINE__);
  }
  Graph2D->SetDirectory(nullptr);
  // Points outside the convex hull come back as NaN
  Graph2D->SetMarginBinsContent(std::numeric_limits<double>::quiet_NaN());
  XMin = Graph2D->GetXmin();
  XMax = Graph2D->GetXmax();
}

// **************************************************
Chi2GraphConstraint::~Chi2GraphConstraint() {
// **************************************************

}

// **************************************************
double Chi2GraphConstraint::Evaluate(const double x, const double y) const {
// **************************************************
  if(x < XMin || x > XMax) return 0.;

  double ChiSquared = 0.;
  if(Graph1D) {
    ChiSquared = Graph1D->Eval(x);
  } else {
    if(y < Graph2D->GetYmin() || y > Graph2D->GetYmax()) return 0.;
    ChiSquared = Graph2D->Interpolate(x, y);
    if(!std::isfinite(ChiSquared)) return 0.;
  }
  return std::exp(-0.5 * ChiSquared);
}

namespace {
  /// @brief Open ROOT file and clone object out of it
  template <typename T>
  std::unique_ptr<T> LoadConstraintObject(const std::string& FileName, const std::string& ObjectName) {
    NUMCMCLOG_INFO("Loading constraint from file: {} (object: {})", FileName, ObjectName);
    auto ConstraintFile = std::unique_ptr<TFile>(TFile::Open(FileName.c_str(), "READ"));
    if (!ConstraintFile || ConstraintFile->IsZombie()) {
      NUMCMCLOG_ERROR("Failed to open constraint file: {}", FileName);
      throw NuMCMCException(__FILE__, __LINE__);
    }
    T* Object = ConstraintFile->Get<T>(ObjectName.c_str());
    if (!Object) {
      NUMCMCLOG_ERROR("Failed to load {} from {}", ObjectName, FileName);
      throw NuMCMCException(__FILE__, __LINE__);
    }
    auto Clone = std::unique_ptr<T>(static_cast<T*>(Object->Clone()));
    ConstraintFile->Close();
    return Clone;
  }
}

// **************************************************
std::shared_ptr<const ExternalConstraint> MakeConstraintFromYAML(const std::string& Name, const YAML::Node& Node) {
// **************************************************
  const std::string Type = GetFromManager<std::string>(Node["Type"], "Gaussian", __FILE__, __LINE__);
  const ConstraintScope Scope = ParseConstraintScope(GetFromManager<std::string>(Node["Scope"], "Both", __FILE__, __LINE__));
  const bool AutoApply = GetFromManager<bool>(Node["AutoApply"], false, __FILE__, __LINE__);

  std::vector<std::string> Variables;
  if(Node["Variables"] && Node["Variables"].IsScalar()) {
    Variables.push_back(Node["Variables"].as<std::string>());
  } else {
    Variables = NMGet(std::vector<std::string>, Node["Variables"]);
  }

  std::shared_ptr<const ExternalConstraint> Constraint;
  if(Type == "Gaussian") {
    if(Variables.size() != 1) {
      NUMCMCLOG_ERROR("Gaussian constraint {} has to be 1D", Name);
      throw DimensionalityError(__FILE__, __LINE__);
    }
    Constraint = std::make_shared<const GaussianConstraint>(Name, Variables[0], NMGet(double, Node["Mean"]),
                                                            NMGet(double, Node["Sigma"]), Scope, AutoApply);
  } else if(Type == "Histogram") {
    Constraint = std::make_shared<const HistogramConstraint>(Name, Variables, MakeTabulatedDensityFromYAML(Node, kRegularGrid),
                                                             Scope, AutoApply);
  } else if(Type == "Chi2Graph") {
    const std::string FileName = NMGet(std::string, Node["File"]);
    const std::string ObjectName = NMGet(std::string, Node["Object"]);
    if(Variables.size() == 1) {
      auto Graph = LoadConstraintObject<TGraph>(FileName, ObjectName);
      Constraint = std::make_shared<const Chi2GraphConstraint>(Name, Variables[0], std::move(Graph), Scope, AutoApply);
    } else {
      auto Graph = LoadConstraintObject<TGraph2D>(FileName, ObjectName);
      Constraint = std::make_shared<const Chi2GraphConstraint>(Name, Variables, std::move(Graph), Scope, AutoApply);
    }
  } else {
    NUMCMCLOG_ERROR("Unknown constraint type: {} for {}, use Gaussian, Histogram or Chi2Graph", Type, Name);
    throw NuMCMCException(__FILE__, __LINE__);
  }
  NUMCMCLOG_INFO("Prepared {} constraint {} on {} ({} ordering{})", Type, Name, fmt::join(Variables, ", "),
                 ConstraintScope_ToString(Scope), AutoApply ? ", auto applied" : "");
  return Constraint;
}
