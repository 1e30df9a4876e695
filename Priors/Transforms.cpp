#include "Priors/Transforms.h"

// C++ includes
#include <algorithm>
#include <cctype>
#include <complex>
#include <limits>

_NuMCMC_Safe_Include_Start_ //{
// ROOT includes
#include "TMath.h"
_NuMCMC_Safe_Include_End_ //}

// **************************************************
std::string TransformType_ToString(const TransformType Transform) {
// **************************************************
  std::string name = "";

  switch(Transform) {
    case kIdentity:
      name = "x";
      break;
    case kSin:
      name = "sin(x)";
      break;
    case kSinSq:
      name = "sin^2(x)";
      break;
    case kCos:
      name = "cos(x)";
      break;
    case kCosSq:
      name = "cos^2(x)";
      break;
    case kCos4:
      name = "cos^4(x)";
      break;
    case kDouble:
      name = "2x";
      break;
    case kSin2x:
      name = "sin(2x)";
      break;
    case kSinSq2x:
      name = "sin^2(2x)";
      break;
    case kCos2x:
      name = "cos(2x)";
      break;
    case kCosSq2x:
      name = "cos^2(2x)";
      break;
    case kCos4_2x:
      name = "cos^4(2x)";
      break;
    case kExpMinusIx:
      name = "exp(-ix)";
      break;
    case kExpIx:
      name = "exp(ix)";
      break;
    case kAbsIx:
      name = "abs(ix)";
      break;
    case kNTransforms:
      NUMCMCLOG_ERROR("kNTransforms is not a valid TransformType!");
      throw UnsupportedTransform(__FILE__, __LINE__);
    default:
      NUMCMCLOG_ERROR("UNKNOWN TRANSFORM SPECIFIED!");
      NUMCMCLOG_ERROR("You gave transform {}", static_cast<int>(Transform));
      throw UnsupportedTransform(__FILE__ , __LINE__ );
  }
  return name;
}

// **************************************************
std::vector<std::string> GetTransformNames() {
// **************************************************
  std::vector<std::string> Names;
  for(int i = 0; i < kNTransforms; ++i) {
    Names.push_back(TransformType_ToString(TransformType(i)));
  }
  return Names;
}

// **************************************************
TransformType ParseTransform(const std::string& Name) {
// **************************************************
  std::string Compact;
  for (const char c : Name) {
    if (!std::isspace(static_cast<unsigned char>(c))) Compact += c;
  }

  for(int i = 0; i < kNTransforms; ++i) {
    if(Compact == TransformType_ToString(TransformType(i))) return TransformType(i);
  }

  NUMCMCLOG_ERROR("Transform \"{}\" is not supported, available transforms are:", Name);
  for(const auto& Available : GetTransformNames()) {
    NUMCMCLOG_ERROR("  {}", Available);
  }
  throw UnsupportedTransform(__FILE__, __LINE__, "Unsupported transform " + Name);
}

// **************************************************
double TransformForward(const TransformType Transform, const double x) _noexcept_ {
// **************************************************
  switch(Transform) {
    case kIdentity:
      return x;
    case kSin:
      return std::sin(x);
    case kSinSq:
      return std::sin(x)*std::sin(x);
    case kCos:
      return std::cos(x);
    case kCosSq:
      return std::cos(x)*std::cos(x);
    case kCos4:
      return std::pow(std::cos(x), 4);
    case kDouble:
      return 2.*x;
    case kSin2x:
      return std::sin(2.*x);
    case kSinSq2x:
      return std::sin(2.*x)*std::sin(2.*x);
    case kCos2x:
      return std::cos(2.*x);
    case kCosSq2x:
      return std::cos(2.*x)*std::cos(2.*x);
    case kCos4_2x:
      return std::pow(std::cos(2.*x), 4);
    case kExpMinusIx:
      return std::arg(std::polar(1., -x));
    case kExpIx:
      return std::arg(std::polar(1., x));
    case kAbsIx:
      return std::abs(std::polar(1., x));
    case kNTransforms:
    default:
      break;
  }
  return std::numeric_limits<double>::quiet_NaN();
}

// **************************************************
double TransformJacobian(const TransformType Transform, const double x) _noexcept_ {
// **************************************************
  switch(Transform) {
    case kIdentity:
      return 1.;
    case kSin:
      return std::fabs(std::cos(x));
    // d/dx sin^2(x) = sin(2x)
    case kSinSq:
      return std::fabs(std::sin(2.*x));
    case kCos:
      return std::fabs(std::sin(x));
    case kCosSq:
      return std::fabs(std::sin(2.*x));
    case kCos4:
      return std::fabs(4.*std::pow(std::cos(x), 3)*std::sin(x));
    case kDouble:
      return 2.;
    case kSin2x:
      return std::fabs(2.*std::cos(2.*x));
    // d/dx sin^2(2x) = 2 sin(4x)
    case kSinSq2x:
      return std::fabs(2.*std::sin(4.*x));
    case kCos2x:
      return std::fabs(2.*std::sin(2.*x));
    case kCosSq2x:
      return std::fabs(2.*std::sin(4.*x));
    case kCos4_2x:
      return std::fabs(8.*std::pow(std::cos(2.*x), 3)*std::sin(2.*x));
    // |d/dx exp(-+ix)| = 1 everywhere on the unit circle
    case kExpMinusIx:
    case kExpIx:
      return 1.;
    // Modulus of the embedding is constant
    case kAbsIx:
      return 0.;
    case kNTransforms:
    default:
      break;
  }
  return std::numeric_limits<double>::quiet_NaN();
}

// **************************************************
std::pair<double, double> TransformRange(const TransformType Transform) {
// **************************************************
  switch(Transform) {
    case kIdentity:
    case kDouble:
      return {std::numeric_limits<double>::lowest(), std::numeric_limits<double>::max()};
    case kSin:
    case kCos:
    case kSin2x:
    case kCos2x:
      return {-1., 1.};
    case kSinSq:
    case kCosSq:
    case kCos4:
    case kSinSq2x:
    case kCosSq2x:
    case kCos4_2x:
      return {0., 1.};
    case kExpMinusIx:
    case kExpIx:
      return {-TMath::Pi(), TMath::Pi()};
    case kAbsIx:
      return {1., 1.};
    case kNTransforms:
    default:
      break;
  }
  NUMCMCLOG_ERROR("You gave transform {}", static_cast<int>(Transform));
  throw UnsupportedTransform(__FILE__, __LINE__);
}
