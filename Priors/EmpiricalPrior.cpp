#include "Priors/EmpiricalPrior.h"

_NuMCMC_Safe_Include_Start_ //{
// fmt includes
#include "spdlog/fmt/ranges.h"
_NuMCMC_Safe_Include_End_ //}

// **************************************************
EmpiricalPrior::EmpiricalPrior(std::vector<std::string> variables, TabulatedDensity table)
: Variables(std::move(variables)), Table(std::move(table)) {
// **************************************************
  if(GetDimension() != Table.GetDimension()) {
    NUMCMCLOG_ERROR("Empirical prior on {} needs a {}D table, got {}D", fmt::join(Variables, ", "),
                    GetDimension(), Table.GetDimension());
    throw DimensionalityError(__FILE__, __LINE__, "Empirical prior dimension mismatch");
  }
  if(GetDimension() == 2 && Variables[0] == Variables[1]) {
    NUMCMCLOG_ERROR("Empirical prior lists {} twice", Variables[0]);
    throw InvalidPriorParameters(__FILE__, __LINE__);
  }
}

// **************************************************
EmpiricalPrior::~EmpiricalPrior() {
// **************************************************

}

// **************************************************
std::string EmpiricalPrior::ToString() const {
// **************************************************
  return fmt::format("Empirical({}) on {}", InterpolationMode_ToString(Table.GetMode()), fmt::join(Variables, ", "));
}

// **************************************************
std::shared_ptr<const EmpiricalPrior> MakeEmpiricalPriorFromYAML(const YAML::Node& Node) {
// **************************************************
  std::vector<std::string> Variables;
  if(Node["Variables"] && Node["Variables"].IsScalar()) {
    Variables.push_back(Node["Variables"].as<std::string>());
  } else {
    Variables = NMGet(std::vector<std::string>, Node["Variables"]);
  }
  if(Variables.size() != 1 && Variables.size() != 2) {
    NUMCMCLOG_ERROR("Empirical prior over {} variables, only 1D and 2D are supported", Variables.size());
    throw DimensionalityError(__FILE__, __LINE__);
  }
  auto Prior = std::make_shared<const EmpiricalPrior>(Variables, MakeTabulatedDensityFromYAML(Node, kDelaunayLinear));
  NUMCMCLOG_INFO("Prepared {}", Prior->ToString());
  return Prior;
}
