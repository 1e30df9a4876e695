#pragma once

// C++ includes
#include <string>
#include <vector>
#include <utility>

// NuMCMC includes
#include "Manager/NuMCMCException.h"

/// @file Transforms.h
/// @brief Closed catalog of coordinate transforms y = f(x) on which priors can be defined

/// @brief Transform of a physical variable x in which a prior family is stated
enum TransformType {
  kIdentity = 0,   //!< x
  kSin = 1,        //!< sin(x)
  kSinSq = 2,      //!< sin^2(x)
  kCos = 3,        //!< cos(x)
  kCosSq = 4,      //!< cos^2(x)
  kCos4 = 5,       //!< cos^4(x)
  kDouble = 6,     //!< 2x
  kSin2x = 7,      //!< sin(2x)
  kSinSq2x = 8,    //!< sin^2(2x)
  kCos2x = 9,      //!< cos(2x)
  kCosSq2x = 10,   //!< cos^2(2x)
  kCos4_2x = 11,   //!< cos^4(2x)
  kExpMinusIx = 12,//!< exp(-ix)
  kExpIx = 13,     //!< exp(ix)
  kAbsIx = 14,     //!< abs(ix), modulus of the unit circle embedding

  kNTransforms //!< This only enumerates
};

/// @brief Convert a transform to the string used in prior specifications, e.g. "sin^2(2x)"
std::string TransformType_ToString(const TransformType Transform);

/// @brief Parse a transform string, whitespace is ignored
/// @param Name String such as "sin^2(x)" or "exp(-ix)"
/// @throws UnsupportedTransform if the name is not in the catalog
TransformType ParseTransform(const std::string& Name);

/// @brief Transformed coordinate y = f(x)
/// @details For the complex embeddings exp(-ix) and exp(ix) the real coordinate is the phase
/// of the embedding wrapped to (-pi, pi]; abs(ix) is the constant modulus 1.
double TransformForward(const TransformType Transform, const double x) _noexcept_;

/// @brief Jacobian magnitude |dy/dx| of the transform at x
double TransformJacobian(const TransformType Transform, const double x) _noexcept_;

/// @brief Range the transformed coordinate can take, used as default domain of uniform priors
/// @return Pair of lower and upper bound of y
std::pair<double, double> TransformRange(const TransformType Transform);

/// @brief All catalog entries as strings, handy for error messages
std::vector<std::string> GetTransformNames();
