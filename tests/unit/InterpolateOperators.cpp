//*****************************************************************//
//    Albany 3.0:  Copyright 2016 Sandia Corporation               //
//    This Software is released under the BSD license detailed     //
//    in the file "license.txt" in the top-level Albany directory  //
//*****************************************************************//

#include "EIM_InterpolateOperators.hpp"
#include "EIM_EmpiricalInterpolatedOperator.hpp"
#include "EIM_CacheRegion.hpp"
#include "EIM_Exceptions.hpp"

#include "EIM_UnitTestHelpers.hpp"

#include <Teuchos_UnitTestHarness.hpp>

#include <cmath>
#include <stdexcept>
#include <string>

namespace {

const int dim = 6;

struct ModelFixture {
  ModelFixture() :
    discretization(),
    sample()
  {
    EIM::OperatorMap operators;
    operators["square"] = Teuchos::rcp(new UnitTest::SquareOperator(dim));
    operators["scaling"] = Teuchos::rcp(new UnitTest::ParameterScalingOperator(dim));
    discretization = Teuchos::rcp(new UnitTest::CountingDiscretization(dim, operators, "model"));

    const double mus[] = { 0.0, 0.5, 1.0, 1.5, 2.0 };
    for (int i = 0; i < 5; ++i) {
      sample.push_back(UnitTest::muParameter(mus[i]));
    }
  }

  Teuchos::RCP<UnitTest::CountingDiscretization> discretization;
  Teuchos::Array<EIM::Parameter> sample;
};

Teuchos::ParameterList convergingParams()
{
  Teuchos::ParameterList result;
  result.set("Projection", "EI");
  result.set("Target Error", 1.0e-10);
  return result;
}

double interpolationError(const EIM::Discretization &original, const EIM::Discretization &interpolated,
                          const std::string &operatorName, double muValue)
{
  const EIM::Parameter mu = UnitTest::muParameter(muValue);
  const Teuchos::RCP<EIM::VectorArray> U = original.solve(mu);
  const Teuchos::RCP<EIM::VectorArray> difference = original.operators()[operatorName]->apply(*U, mu);
  difference->subtract(*interpolated.operators()[operatorName]->apply(*U, mu));
  return difference->l2Norm()[0];
}

} // namespace

namespace EIM
{

TEUCHOS_UNIT_TEST(InterpolateOperators, SingleOperator)
{
  const ModelFixture fixture;
  const std::string names[] = { "square" };

  const OperatorInterpolation result = interpolateOperators(
      fixture.discretization, Teuchos::ArrayView<const std::string>(names, 1), fixture.sample(), convergingParams());

  TEST_EQUALITY(result.data.status, CONVERGED);
  TEST_EQUALITY(result.data.dofs.size(), 3);
  TEST_EQUALITY(result.discretization->name(), "model_ei");

  const OperatorMap operators = result.discretization->operators();
  TEST_ASSERT(Teuchos::nonnull(Teuchos::rcp_dynamic_cast<const EmpiricalInterpolatedOperator>(operators.find("square")->second)));
  TEST_ASSERT(Teuchos::is_null(Teuchos::rcp_dynamic_cast<const EmpiricalInterpolatedOperator>(operators.find("scaling")->second)));

  TEST_ASSERT(interpolationError(*fixture.discretization, *result.discretization, "square", 0.75) < 1.0e-9);
}

TEUCHOS_UNIT_TEST(InterpolateOperators, SharedBasis)
{
  const ModelFixture fixture;
  const std::string names[] = { "square", "scaling" };

  const OperatorInterpolation result = interpolateOperators(
      fixture.discretization, Teuchos::ArrayView<const std::string>(names, 2), fixture.sample(), convergingParams());

  TEST_EQUALITY(result.data.dofs.size(), 3);

  const OperatorMap operators = result.discretization->operators();
  const Teuchos::RCP<const EmpiricalInterpolatedOperator> square =
    Teuchos::rcp_dynamic_cast<const EmpiricalInterpolatedOperator>(operators.find("square")->second);
  const Teuchos::RCP<const EmpiricalInterpolatedOperator> scaling =
    Teuchos::rcp_dynamic_cast<const EmpiricalInterpolatedOperator>(operators.find("scaling")->second);
  TEST_ASSERT(Teuchos::nonnull(square) && Teuchos::nonnull(scaling));
  TEST_EQUALITY(&square->basis(), &scaling->basis());

  TEST_ASSERT(interpolationError(*fixture.discretization, *result.discretization, "square", 1.25) < 1.0e-9);
  TEST_ASSERT(interpolationError(*fixture.discretization, *result.discretization, "scaling", 1.25) < 1.0e-9);
}

TEUCHOS_UNIT_TEST(InterpolateOperators, EachSolutionComputedOnce)
{
  const ModelFixture fixture;
  const std::string names[] = { "square" };

  interpolateOperators(
      fixture.discretization, Teuchos::ArrayView<const std::string>(names, 1), fixture.sample(), convergingParams());
  TEST_EQUALITY(fixture.discretization->solveCount(), 5);
}

TEUCHOS_UNIT_TEST(InterpolateOperators, DefaultCacheRegionDoesNotGrow)
{
  const ModelFixture fixture;
  const std::string names[] = { "square" };
  const Teuchos::RCP<MemoryCacheRegion> memory =
    Teuchos::rcp_dynamic_cast<MemoryCacheRegion>(defaultCacheRegions()->get("memory"), /*throw_on_fail =*/ true);
  const int initialSize = memory->size();

  for (int run = 0; run < 3; ++run) {
    interpolateOperators(
        fixture.discretization, Teuchos::ArrayView<const std::string>(names, 1), fixture.sample(), convergingParams());
    TEST_EQUALITY(memory->size(), initialSize);
  }
  TEST_EQUALITY(fixture.discretization->solveCount(), 15);
}

TEUCHOS_UNIT_TEST(InterpolateOperators, WithoutCache)
{
  const ModelFixture fixture;
  const std::string names[] = { "square" };
  Teuchos::ParameterList params = convergingParams();
  params.set("Cache Region", "none");

  const OperatorInterpolation result = interpolateOperators(
      fixture.discretization, Teuchos::ArrayView<const std::string>(names, 1), fixture.sample(), params);

  TEST_EQUALITY(result.data.dofs.size(), 3);
  TEST_ASSERT(fixture.discretization->solveCount() > 5);
}

TEUCHOS_UNIT_TEST(InterpolateOperators, InvalidArguments)
{
  const ModelFixture fixture;

  const std::string unknown[] = { "cube" };
  TEST_THROW(
      interpolateOperators(
        fixture.discretization, Teuchos::ArrayView<const std::string>(unknown, 1), fixture.sample(), convergingParams()),
      std::invalid_argument);

  const std::string names[] = { "square" };
  Teuchos::ParameterList params = convergingParams();
  params.set("Cache Region", "disk");
  TEST_THROW(
      interpolateOperators(
        fixture.discretization, Teuchos::ArrayView<const std::string>(names, 1), fixture.sample(), params),
      ConfigurationError);

  TEST_EQUALITY(fixture.discretization->solveCount(), 0);
}

} // namespace EIM
