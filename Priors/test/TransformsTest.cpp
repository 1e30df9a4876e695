#include "Priors/Transforms.h"

#include "catch2/catch_test_macros.hpp"
#include "catch2/matchers/catch_matchers_floating_point.hpp"

#include "TMath.h"

using namespace Catch::Matchers;

TEST_CASE("ParseTransform", "[Transforms]") {
  REQUIRE(ParseTransform("x") == kIdentity);
  REQUIRE(ParseTransform("sin^2(x)") == kSinSq);
  REQUIRE(ParseTransform(" sin^2( 2x ) ") == kSinSq2x);
  REQUIRE(ParseTransform("exp(-ix)") == kExpMinusIx);
  REQUIRE(ParseTransform("abs(ix)") == kAbsIx);

  for(int i = 0; i < kNTransforms; ++i) {
    REQUIRE(ParseTransform(TransformType_ToString(TransformType(i))) == TransformType(i));
  }
  REQUIRE(GetTransformNames().size() == size_t(kNTransforms));

  REQUIRE_THROWS_AS(ParseTransform("tan(x)"), UnsupportedTransform);
  REQUIRE_THROWS_AS(ParseTransform("sin^3(x)"), UnsupportedTransform);
  REQUIRE_THROWS_AS(ParseTransform(""), UnsupportedTransform);
}

TEST_CASE("ForwardValues", "[Transforms]") {
  const double x = 0.7;
  REQUIRE_THAT(TransformForward(kIdentity, x), WithinAbs(x, 1E-12));
  REQUIRE_THAT(TransformForward(kSinSq, x), WithinAbs(std::sin(x)*std::sin(x), 1E-12));
  REQUIRE_THAT(TransformForward(kCos4, x), WithinAbs(std::pow(std::cos(x), 4), 1E-12));
  REQUIRE_THAT(TransformForward(kDouble, x), WithinAbs(2*x, 1E-12));
  REQUIRE_THAT(TransformForward(kSinSq2x, x), WithinAbs(std::pow(std::sin(2*x), 2), 1E-12));

  // Phase of the unit circle embedding is wrapped to (-pi, pi]
  REQUIRE_THAT(TransformForward(kExpIx, 4.), WithinAbs(4. - 2*TMath::Pi(), 1E-12));
  REQUIRE_THAT(TransformForward(kExpMinusIx, 1.), WithinAbs(-1., 1E-12));
  REQUIRE_THAT(TransformForward(kAbsIx, 2.3), WithinAbs(1., 1E-12));
}

TEST_CASE("JacobianMatchesNumericalDerivative", "[Transforms]") {
  const double h = 1E-6;
  const std::vector<TransformType> Smooth = {kIdentity, kSin, kSinSq, kCos, kCosSq, kCos4, kDouble,
                                             kSin2x, kSinSq2x, kCos2x, kCosSq2x, kCos4_2x};
  for(const auto Transform : Smooth) {
    for(const double x : {0.1, 0.45, 0.9, 1.3, 2.2}) {
      const double Numerical = std::fabs(TransformForward(Transform, x + h) - TransformForward(Transform, x - h))/(2*h);
      INFO("Transform " << TransformType_ToString(Transform) << " at x = " << x);
      REQUIRE_THAT(TransformJacobian(Transform, x), WithinAbs(Numerical, 1E-6));
    }
  }
  // sin^2(x) has derivative sin(2x)
  REQUIRE_THAT(TransformJacobian(kSinSq, 0.3), WithinAbs(std::sin(0.6), 1E-12));
  REQUIRE_THAT(TransformJacobian(kExpIx, 0.3), WithinAbs(1., 1E-12));
  REQUIRE_THAT(TransformJacobian(kAbsIx, 0.3), WithinAbs(0., 1E-12));
}

TEST_CASE("TransformRange", "[Transforms]") {
  REQUIRE(TransformRange(kSinSq).first == 0.);
  REQUIRE(TransformRange(kSinSq).second == 1.);
  REQUIRE(TransformRange(kCos2x).first == -1.);
  REQUIRE_THAT(TransformRange(kExpIx).second, WithinAbs(TMath::Pi(), 1E-12));
  REQUIRE_THROWS_AS(TransformRange(kNTransforms), UnsupportedTransform);
}
