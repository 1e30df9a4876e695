#include "Priors/PriorModel.h"

// C++ includes
#include <cctype>
#include <cmath>
#include <limits>
#include <sstream>

_NuMCMC_Safe_Include_Start_ //{
// ROOT includes
#include "TMath.h"
// fmt includes
#include "spdlog/fmt/fmt.h"
#include "spdlog/fmt/ranges.h"
_NuMCMC_Safe_Include_End_ //}

namespace {
  /// @brief Strip leading and trailing whitespace
  std::string Trim(const std::string& Input) {
    const auto First = Input.find_first_not_of(" \t\n\r");
    if (First == std::string::npos) return "";
    const auto Last = Input.find_last_not_of(" \t\n\r");
    return Input.substr(First, Last - First + 1);
  }
}

// **************************************************
std::string PriorFamily_ToString(const PriorFamily Family) {
// **************************************************
  std::string name = "";

  switch(Family) {
    case kUniform:
      name = "Uniform";
      break;
    case kGaussian:
      name = "Gaussian";
      break;
    case kBimodalGaussian:
      name = "BimodalGaussian";
      break;
    case kStep:
      name = "Step";
      break;
    case kNPriorFamilies:
      NUMCMCLOG_ERROR("kNPriorFamilies is not a valid PriorFamily!");
      throw InvalidPriorParameters(__FILE__, __LINE__);
    default:
      NUMCMCLOG_ERROR("UNKNOWN PRIOR FAMILY SPECIFIED!");
      NUMCMCLOG_ERROR("You gave family {}", static_cast<int>(Family));
      throw InvalidPriorParameters(__FILE__ , __LINE__ );
  }
  return name;
}

// **************************************************
PriorFamily ParsePriorFamily(const std::string& Name) {
// **************************************************
  const std::string Trimmed = Trim(Name);
  for(int i = 0; i < kNPriorFamilies; ++i) {
    if(Trimmed == PriorFamily_ToString(PriorFamily(i))) return PriorFamily(i);
  }
  NUMCMCLOG_ERROR("Prior family \"{}\" is not supported, available families are:", Name);
  for(int i = 0; i < kNPriorFamilies; ++i) {
    NUMCMCLOG_ERROR("  {}", PriorFamily_ToString(PriorFamily(i)));
  }
  throw InvalidPriorParameters(__FILE__, __LINE__, "Unknown prior family " + Name);
}

// **************************************************
std::string PriorSpec::ToString() const {
// **************************************************
  std::string Out = PriorFamily_ToString(Family);
  if(!Parameters.empty()) {
    Out += fmt::format("({})", fmt::join(Parameters, ", "));
  }
  return Out + ":" + TransformType_ToString(Transform);
}

// **************************************************
PriorSpec ParsePriorSpec(const std::string& Variable, const std::string& Definition) {
// **************************************************
  PriorSpec Spec;
  Spec.Variable = Variable;

  const auto ColonPos = Definition.find(':');
  const std::string FamilyPart = Trim(Definition.substr(0, ColonPos));
  if(ColonPos == std::string::npos) {
    NUMCMCLOG_DEBUG("No transform given for prior {} on {}, assuming x", Definition, Variable);
    Spec.Transform = kIdentity;
  } else {
    Spec.Transform = ParseTransform(Definition.substr(ColonPos + 1));
  }

  const auto OpenPos = FamilyPart.find('(');
  if(OpenPos == std::string::npos) {
    Spec.Family = ParsePriorFamily(FamilyPart);
    return Spec;
  }

  const auto ClosePos = FamilyPart.rfind(')');
  if(ClosePos == std::string::npos || ClosePos < OpenPos || ClosePos != FamilyPart.size() - 1) {
    NUMCMCLOG_ERROR("Malformed parameter list in prior \"{}\" for {}", Definition, Variable);
    throw InvalidPriorParameters(__FILE__, __LINE__, "Malformed prior " + Definition);
  }
  Spec.Family = ParsePriorFamily(FamilyPart.substr(0, OpenPos));

  std::stringstream ParameterStream(FamilyPart.substr(OpenPos + 1, ClosePos - OpenPos - 1));
  std::string Token;
  while (std::getline(ParameterStream, Token, ',')) {
    Token = Trim(Token);
    size_t Used = 0;
    double Value = 0.;
    try {
      Value = std::stod(Token, &Used);
    } catch (const std::exception& e) {
      NUMCMCLOG_ERROR("Can't convert \"{}\" to number in prior \"{}\": {}", Token, Definition, e.what());
      throw InvalidPriorParameters(__FILE__, __LINE__, "Malformed prior " + Definition);
    }
    if(Used != Token.size()) {
      NUMCMCLOG_ERROR("Trailing characters in parameter \"{}\" of prior \"{}\"", Token, Definition);
      throw InvalidPriorParameters(__FILE__, __LINE__, "Malformed prior " + Definition);
    }
    Spec.Parameters.push_back(Value);
  }
  return Spec;
}

// **************************************************
PriorSpec MakePriorSpecFromYAML(const std::string& Variable, const YAML::Node& Node) {
// **************************************************
  if(Node.IsScalar()) {
    return ParsePriorSpec(Variable, Node.as<std::string>());
  }
  if(!Node.IsMap()) {
    NUMCMCLOG_ERROR("Prior for {} has to be a string or a map, got:\n{}", Variable, YAMLtoSTRING(Node));
    throw InvalidPriorParameters(__FILE__, __LINE__);
  }
  PriorSpec Spec;
  Spec.Variable = Variable;
  Spec.Family = ParsePriorFamily(NMGet(std::string, Node["Family"]));
  Spec.Parameters = GetFromManager<std::vector<double>>(Node["Parameters"], {}, __FILE__, __LINE__);
  Spec.Transform = ParseTransform(GetFromManager<std::string>(Node["Transform"], "x", __FILE__, __LINE__));
  return Spec;
}

// **************************************************
PriorModel::PriorModel(PriorSpec spec) : Spec(std::move(spec)) {
// **************************************************
  UniformLow = std::numeric_limits<double>::lowest();
  UniformHigh = std::numeric_limits<double>::max();
  BiasFraction = 0.5;
  Boundary = 0.;

  Validate();
}

// **************************************************
void PriorModel::Validate() {
// **************************************************
  const auto& Pars = Spec.Parameters;
  const size_t nPars = Pars.size();

  auto Fail = [&](const std::string& Reason) {
    NUMCMCLOG_ERROR("Invalid prior {} on {}: {}", Spec.ToString(), Spec.Variable, Reason);
    throw InvalidPriorParameters(__FILE__, __LINE__, "Invalid prior " + Spec.ToString() + " on " + Spec.Variable + ": " + Reason);
  };

  for(const double Par : Pars) {
    if(!std::isfinite(Par)) Fail("parameters have to be finite");
  }

  switch(Spec.Family) {
    case kUniform:
      if(nPars == 2) {
        if(Pars[0] >= Pars[1]) Fail("uniform window needs low < high");
        const auto Range = TransformRange(Spec.Transform);
        if(Pars[1] < Range.first || Pars[0] > Range.second) {
          Fail(fmt::format("uniform window lies outside [{}, {}], the range of {}", Range.first, Range.second,
                           TransformType_ToString(Spec.Transform)));
        }
        UniformLow = Pars[0];
        UniformHigh = Pars[1];
      } else if(nPars != 0) {
        Fail("Uniform takes no parameters or a [low, high] window");
      }
      break;
    case kGaussian:
      if(nPars != 2) Fail("Gaussian needs mean and sigma");
      if(Pars[1] <= 0) Fail("sigma has to be positive");
      break;
    case kBimodalGaussian:
      if(nPars != 4 && nPars != 5) Fail("BimodalGaussian needs mean1, sigma1, mean2, sigma2 and optional bias");
      if(Pars[1] <= 0 || Pars[3] <= 0) Fail("sigma has to be positive");
      if(nPars == 5) {
        if(Pars[4] < 0 || Pars[4] > 100) Fail("bias has to be within [0, 100]");
        BiasFraction = Pars[4]/100.;
      }
      break;
    case kStep:
      if(nPars != 1 && nPars != 2) Fail("Step needs bias and optional boundary");
      if(Pars[0] < 0 || Pars[0] > 100) Fail("bias has to be within [0, 100]");
      BiasFraction = Pars[0]/100.;
      if(nPars == 2) Boundary = Pars[1];
      break;
    case kNPriorFamilies:
    default:
      Fail("unknown family");
  }
  NUMCMCLOG_DEBUG("Prepared prior {} on {}", Spec.ToString(), Spec.Variable);
}

// **************************************************
double PriorModel::FamilyDensity(const double y) const {
// **************************************************
  const auto& Pars = Spec.Parameters;
  switch(Spec.Family) {
    case kUniform:
      return (y < UniformLow || y > UniformHigh) ? 0. : 1.;
    case kGaussian:
    {
      const double Chi = (y - Pars[0])/Pars[1];
      return std::exp(-0.5 * Chi * Chi);
    }
    case kBimodalGaussian:
      return BiasFraction * TMath::Gaus(y, Pars[0], Pars[1], kTRUE)
      + (1. - BiasFraction) * TMath::Gaus(y, Pars[2], Pars[3], kTRUE);
    case kStep:
      return (y < Boundary) ? BiasFraction : 1. - BiasFraction;
    case kNPriorFamilies:
    default:
      break;
  }
  return 0.;
}

// **************************************************
double PriorModel::Density(const double x) const {
// **************************************************
  return FamilyDensity(TransformForward(Spec.Transform, x)) * TransformJacobian(Spec.Transform, x);
}
