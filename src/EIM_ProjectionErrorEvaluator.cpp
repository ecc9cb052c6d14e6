//*****************************************************************//
//    Albany 3.0:  Copyright 2016 Sandia Corporation               //
//    This Software is released under the BSD license detailed     //
//    in the file "license.txt" in the top-level Albany directory  //
//*****************************************************************//

#include "EIM_ProjectionErrorEvaluator.hpp"

#include "EIM_DenseLinearAlgebra.hpp"
#include "EIM_Exceptions.hpp"

#include "Teuchos_TestForException.hpp"

#include <algorithm>
#include <iterator>

namespace EIM {

ProjectionType projectionTypeFromString(const std::string &token)
{
  if (token == "Orthogonal") {
    return ORTHOGONAL_PROJECTION;
  } else if (token == "EI") {
    return EI_PROJECTION;
  }

  TEUCHOS_TEST_FOR_EXCEPTION(
      true,
      ConfigurationError,
      token << " is not a valid projection type (expected Orthogonal or EI).");
  return ORTHOGONAL_PROJECTION; // Should not be reached
}

std::string toString(ProjectionType type)
{
  return (type == EI_PROJECTION) ? "EI" : "Orthogonal";
}

ProjectionErrorEvaluator::ProjectionErrorEvaluator(
    ProjectionType type,
    const Teuchos::RCP<const ErrorNorm> &errorNorm,
    const Teuchos::RCP<const InnerProduct> &product) :
  type_(type),
  errorNorm_(errorNorm),
  product_(product)
{
  TEUCHOS_TEST_FOR_EXCEPTION(
      type_ == EI_PROJECTION && Teuchos::nonnull(product_),
      ConfigurationError,
      "An inner product is only used by orthogonal projection, not by EI projection.");
}

ProjectionErrorResult
ProjectionErrorEvaluator::evaluate(const InterpolationState &state, EvaluationSet &evaluations) const
{
  ProjectionErrorResult result;
  result.maxError = -1.0;

  const bool emptyBasis = (state.size() == 0);
  const bool orthogonal = !emptyBasis && (type_ == ORTHOGONAL_PROJECTION);

  // Factor the Gramian once for all batches
  Epetra_SerialDenseMatrix gramianFactor;
  if (orthogonal) {
    gramianFactor = choleskyFactor(innerProducts(product_, state.basis(), state.basis()));
  }

  const int batchCount = evaluations.size();
  for (int iBatch = 0; iBatch < batchCount; ++iBatch) {
    const Teuchos::RCP<const VectorArray> AU = evaluations.at(iBatch);
    if (AU->empty()) {
      continue;
    }

    // Residuals, the evaluations themselves for an empty basis
    Teuchos::RCP<const VectorArray> residuals = AU;
    if (!emptyBasis) {
      Teuchos::RCP<VectorArray> approximations;
      if (orthogonal) {
        Epetra_SerialDenseMatrix coefficients = innerProducts(product_, state.basis(), *AU);
        choleskySolve(gramianFactor, coefficients);
        approximations = state.basis().lincomb(coefficients);
      } else {
        approximations = state.interpolate(*AU);
      }
      const Teuchos::RCP<VectorArray> differences = AU->copy();
      differences->subtract(*approximations);
      residuals = differences;
    }

    const Teuchos::Array<double> errors = errorNorms(errorNorm_, *residuals);
    const int localMaxIndex = std::distance(errors.begin(), std::max_element(errors.begin(), errors.end()));
    const double localMaxError = errors[localMaxIndex];

    if (localMaxError > result.maxError) {
      result.maxError = localMaxError;
      const int index[] = { localMaxIndex };
      const Teuchos::ArrayView<const int> selection(index, 1);
      if (orthogonal) {
        result.candidate = AU->copy(selection);
        result.candidate->subtract(*state.interpolate(*result.candidate));
      } else {
        result.candidate = residuals->copy(selection);
      }
    }
  }

  TEUCHOS_TEST_FOR_EXCEPTION(
      Teuchos::is_null(result.candidate),
      NumericalError,
      "No finite approximation error could be computed for the " << batchCount << " evaluation batches");

  return result;
}

} // namespace EIM
