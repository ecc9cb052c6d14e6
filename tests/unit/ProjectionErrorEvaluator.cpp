//*****************************************************************//
//    Albany 3.0:  Copyright 2016 Sandia Corporation               //
//    This Software is released under the BSD license detailed     //
//    in the file "license.txt" in the top-level Albany directory  //
//*****************************************************************//

#include "EIM_ProjectionErrorEvaluator.hpp"
#include "EIM_InterpolationState.hpp"
#include "EIM_EvaluationSet.hpp"
#include "EIM_InnerProduct.hpp"
#include "EIM_Exceptions.hpp"

#include "EIM_UnitTestHelpers.hpp"

#include <Teuchos_UnitTestHarness.hpp>

#include <cmath>

namespace {

const double evaluationValues[] = {
  4.0, 1.0, 0.0, 0.0,
  1.0, 3.0, 1.0, 0.0,
  0.0, 1.0, 2.0, 1.0
};

const double firstBasisVector[] = { 1.0, 0.25, 0.0, 0.0 };

Teuchos::RCP<const EIM::VectorArray> evaluations()
{
  return UnitTest::vectorArray(4, 3, evaluationValues);
}

// State after selecting dof 0 for the first evaluation
void extendWithFirstEvaluation(EIM::InterpolationState &state)
{
  const Teuchos::RCP<EIM::VectorArray> normalized = UnitTest::vectorArray(4, 1, firstBasisVector);
  state.extend(0, *normalized);
}

} // namespace

namespace EIM
{

TEUCHOS_UNIT_TEST(ProjectionErrorEvaluator, ProjectionTypeNames)
{
  TEST_EQUALITY(projectionTypeFromString("Orthogonal"), ORTHOGONAL_PROJECTION);
  TEST_EQUALITY(projectionTypeFromString("EI"), EI_PROJECTION);
  TEST_EQUALITY(toString(EI_PROJECTION), "EI");
  TEST_THROW(projectionTypeFromString("Oblique"), ConfigurationError);
}

TEUCHOS_UNIT_TEST(ProjectionErrorEvaluator, EmptyBasisSelectsLargestEvaluation)
{
  VectorArrayList evaluationSet(evaluations());
  const InterpolationState state(*evaluations());

  const ProjectionErrorEvaluator evaluator(EI_PROJECTION, Teuchos::null, Teuchos::null);
  const ProjectionErrorResult result = evaluator.evaluate(state, evaluationSet);

  TEST_FLOATING_EQUALITY(result.maxError, std::sqrt(17.0), 1.0e-14);
  TEST_EQUALITY(result.candidate->size(), 1);
  for (int i = 0; i < 4; ++i) {
    TEST_EQUALITY(UnitTest::entry(*result.candidate, 0, i), evaluationValues[i]);
  }
}

TEUCHOS_UNIT_TEST(ProjectionErrorEvaluator, EIResidual)
{
  VectorArrayList evaluationSet(evaluations());
  InterpolationState state(*evaluations());
  extendWithFirstEvaluation(state);

  const ProjectionErrorEvaluator evaluator(EI_PROJECTION, Teuchos::null, Teuchos::null);
  const ProjectionErrorResult result = evaluator.evaluate(state, evaluationSet);

  // Second evaluation minus its interpolant (1, 0.25, 0, 0)
  TEST_FLOATING_EQUALITY(result.maxError, std::sqrt(2.75 * 2.75 + 1.0), 1.0e-14);
  TEST_EQUALITY(UnitTest::entry(*result.candidate, 0, 0), 0.0);
  TEST_FLOATING_EQUALITY(UnitTest::entry(*result.candidate, 0, 1), 2.75, 1.0e-14);
  TEST_FLOATING_EQUALITY(UnitTest::entry(*result.candidate, 0, 2), 1.0, 1.0e-14);
  TEST_EQUALITY(UnitTest::entry(*result.candidate, 0, 3), 0.0);
}

TEUCHOS_UNIT_TEST(ProjectionErrorEvaluator, OrthogonalErrorWithInterpolationResidualCandidate)
{
  VectorArrayList evaluationSet(evaluations());
  InterpolationState state(*evaluations());
  extendWithFirstEvaluation(state);

  const ProjectionErrorEvaluator evaluator(ORTHOGONAL_PROJECTION, Teuchos::null, Teuchos::null);
  const ProjectionErrorResult result = evaluator.evaluate(state, evaluationSet);

  // |v|^2 - (b.v)^2 / |b|^2 for the second evaluation
  const double expectedError = std::sqrt(11.0 - 1.75 * 1.75 / 1.0625);
  TEST_FLOATING_EQUALITY(result.maxError, expectedError, 1.0e-12);

  // The candidate is the interpolation residual, not the projection residual
  TEST_EQUALITY(UnitTest::entry(*result.candidate, 0, 0), 0.0);
  TEST_FLOATING_EQUALITY(UnitTest::entry(*result.candidate, 0, 1), 2.75, 1.0e-14);
  TEST_FLOATING_EQUALITY(UnitTest::entry(*result.candidate, 0, 2), 1.0, 1.0e-14);
}

TEUCHOS_UNIT_TEST(ProjectionErrorEvaluator, RepeatedEvaluationIsIdentical)
{
  VectorArrayList evaluationSet(evaluations());
  InterpolationState state(*evaluations());
  extendWithFirstEvaluation(state);

  const ProjectionErrorEvaluator evaluator(ORTHOGONAL_PROJECTION, Teuchos::null, Teuchos::null);
  const ProjectionErrorResult first = evaluator.evaluate(state, evaluationSet);
  first.candidate->scale(-3.0);
  const ProjectionErrorResult second = evaluator.evaluate(state, evaluationSet);

  TEST_EQUALITY(first.maxError, second.maxError);
  TEST_EQUALITY(UnitTest::entry(*second.candidate, 0, 1), 2.75);
  TEST_EQUALITY(state.size(), 1);
}

TEUCHOS_UNIT_TEST(ProjectionErrorEvaluator, InterpolantMatchesAtDofs)
{
  InterpolationState state(*evaluations());
  extendWithFirstEvaluation(state);

  const Teuchos::RCP<VectorArray> interpolant = state.interpolate(*evaluations());
  const Epetra_SerialDenseMatrix expected = evaluations()->components(state.dofs());
  const Epetra_SerialDenseMatrix actual = interpolant->components(state.dofs());
  for (int i = 0; i < expected.M(); ++i) {
    TEST_FLOATING_EQUALITY(actual(i, 0), expected(i, 0), 1.0e-14);
  }
}

TEUCHOS_UNIT_TEST(ProjectionErrorEvaluator, BatchesAndFirstMaximum)
{
  // Two copies of the largest evaluation in different batches, plus an empty batch
  const int first[] = { 0 };
  const int others[] = { 1, 0, 2 };
  VectorArrayList evaluationSet;
  evaluationSet.push_back(evaluations()->emptyLike());
  evaluationSet.push_back(evaluations()->copy(Teuchos::ArrayView<const int>(others, 3)));
  evaluationSet.push_back(evaluations()->copy(Teuchos::ArrayView<const int>(first, 1)));

  const InterpolationState state(*evaluations());
  const ProjectionErrorEvaluator evaluator(EI_PROJECTION, Teuchos::null, Teuchos::null);
  const ProjectionErrorResult result = evaluator.evaluate(state, evaluationSet);

  TEST_FLOATING_EQUALITY(result.maxError, std::sqrt(17.0), 1.0e-14);
  TEST_EQUALITY(UnitTest::entry(*result.candidate, 0, 0), 4.0);
}

TEUCHOS_UNIT_TEST(ProjectionErrorEvaluator, WeightedErrorNorm)
{
  // Weight 100 on the last component makes the third evaluation the worst
  const double weights[] = { 1.0, 1.0, 1.0, 100.0 };
  const Teuchos::RCP<const InnerProduct> product(new EpetraOperatorProduct(UnitTest::diagonalMatrix(4, weights)));
  const Teuchos::RCP<const ErrorNorm> norm(new InducedNorm(product));

  VectorArrayList evaluationSet(evaluations());
  const InterpolationState state(*evaluations());
  const ProjectionErrorEvaluator evaluator(ORTHOGONAL_PROJECTION, norm, product);
  const ProjectionErrorResult result = evaluator.evaluate(state, evaluationSet);

  TEST_FLOATING_EQUALITY(result.maxError, std::sqrt(105.0), 1.0e-14);
  TEST_EQUALITY(UnitTest::entry(*result.candidate, 0, 3), 1.0);
}

TEUCHOS_UNIT_TEST(ProjectionErrorEvaluator, WeightedOrthogonalProjection)
{
  const double weights[] = { 1.0, 4.0, 1.0, 100.0 };
  const Teuchos::RCP<const InnerProduct> product(new EpetraOperatorProduct(UnitTest::diagonalMatrix(4, weights)));
  const Teuchos::RCP<const ErrorNorm> norm(new InducedNorm(product));

  VectorArrayList evaluationSet(evaluations());
  InterpolationState state(*evaluations());
  extendWithFirstEvaluation(state);

  const ProjectionErrorEvaluator evaluator(ORTHOGONAL_PROJECTION, norm, product);
  const ProjectionErrorResult result = evaluator.evaluate(state, evaluationSet);

  // (v, v) - (b, v)^2 / (b, b) under the metric, (b, b) = 1.25: 0, 25.2 and 107.2
  TEST_FLOATING_EQUALITY(result.maxError, std::sqrt(108.0 - 1.0 / 1.25), 1.0e-12);

  // The third evaluation vanishes at dof 0, so it is its own interpolation residual
  for (int i = 0; i < 4; ++i) {
    TEST_EQUALITY(UnitTest::entry(*result.candidate, 0, i), evaluationValues[8 + i]);
  }
}

TEUCHOS_UNIT_TEST(ProjectionErrorEvaluator, ProductRequiresOrthogonalProjection)
{
  const double weights[] = { 1.0, 1.0, 1.0, 1.0 };
  const Teuchos::RCP<const InnerProduct> product(new EpetraOperatorProduct(UnitTest::diagonalMatrix(4, weights)));
  TEST_THROW(const ProjectionErrorEvaluator evaluator(EI_PROJECTION, Teuchos::null, product), ConfigurationError);
}

} // namespace EIM
