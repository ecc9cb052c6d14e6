//*****************************************************************//
//    Albany 3.0:  Copyright 2016 Sandia Corporation               //
//    This Software is released under the BSD license detailed     //
//    in the file "license.txt" in the top-level Albany directory  //
//*****************************************************************//

#include "EIM_GreedyInterpolation.hpp"

#include "EIM_InterpolationState.hpp"
#include "EIM_ProjectionErrorEvaluator.hpp"
#include "EIM_ParameterListUtils.hpp"
#include "EIM_Exceptions.hpp"

#include "Teuchos_VerboseObject.hpp"
#include "Teuchos_TestForException.hpp"

#include <string>

namespace EIM {

Teuchos::RCP<const Teuchos::ParameterList>
getValidEIGreedyParameters()
{
  const Teuchos::RCP<Teuchos::ParameterList> result = Teuchos::rcp(new Teuchos::ParameterList("Valid EI-Greedy Params"));
  result->set<std::string>("Projection", "Orthogonal", "Projection used to measure approximation errors: Orthogonal or EI");
  result->set<double>("Target Error", 0.0, "Stop once the maximum approximation error does not exceed this value");
  result->set<int>("Maximum Interpolation DOFs", 1, "Stop once this many interpolation dofs have been selected");
  return result;
}

InterpolationData eiGreedy(
    EvaluationSet &evaluations,
    const Teuchos::ParameterList &params,
    const Teuchos::RCP<const ErrorNorm> &errorNorm,
    const Teuchos::RCP<const InnerProduct> &product)
{
  validateParameters(params, *getValidEIGreedyParameters(), "EI-Greedy");

  const ProjectionType projection =
    projectionTypeFromString(getOptional<std::string>(params, "Projection", "Orthogonal"));
  TEUCHOS_TEST_FOR_EXCEPTION(
      projection == EI_PROJECTION && Teuchos::nonnull(product),
      ConfigurationError,
      "An inner product cannot be used with EI projection");

  const bool hasTargetError = params.isParameter("Target Error");
  const double targetError = hasTargetError ? params.get<double>("Target Error") : 0.0;

  const bool hasMaxDofs = params.isParameter("Maximum Interpolation DOFs");
  const int maxDofs = hasMaxDofs ? params.get<int>("Maximum Interpolation DOFs") : 0;
  TEUCHOS_TEST_FOR_EXCEPTION(
      hasMaxDofs && maxDofs < 1,
      ConfigurationError,
      "Maximum Interpolation DOFs must be positive, got " << maxDofs);

  const Teuchos::RCP<const VectorArray> prototype = checkedPrototype(evaluations);

  const ProjectionErrorEvaluator evaluator(projection, errorNorm, product);
  InterpolationState state(*prototype);

  const Teuchos::RCP<Teuchos::FancyOStream> out = Teuchos::VerboseObjectBase::getDefaultOStream();
  *out << "Generating interpolation data with " << toString(projection) << " projection\n";
  Teuchos::OSTab tab(out);

  InterpolationData result;
  while (true) {
    const ProjectionErrorResult evaluation = evaluator.evaluate(state, evaluations);
    result.finalError = evaluation.maxError;
    *out << "Maximum interpolation error with " << state.size() << " interpolation DOFs: " << evaluation.maxError << "\n";

    if (hasTargetError && evaluation.maxError <= targetError) {
      *out << "Target error reached, stopping\n";
      result.status = CONVERGED;
      break;
    }

    Teuchos::Array<int> amaxIndices;
    Teuchos::Array<double> amaxValues;
    evaluation.candidate->amax(amaxIndices, amaxValues);
    const int newDof = amaxIndices[0];
    const double newDofValue = amaxValues[0];

    if (state.isSelected(newDof)) {
      *out << "DOF " << newDof << " selected twice, stopping\n";
      result.status = DOF_COLLISION;
      break;
    }

    if (newDofValue == 0.0) {
      *out << "Worst approximated evaluation is reproduced exactly, stopping\n";
      result.status = CONVERGED;
      break;
    }

    *out << "Extending interpolation basis with DOF " << newDof << "\n";
    evaluation.candidate->scale(1.0 / newDofValue);
    state.extend(newDof, *evaluation.candidate);

    result.errors.push_back(evaluation.maxError);
    const double triangularityError = state.triangularityError();
    result.triangularityErrors.push_back(triangularityError);
    *out << "Interpolation matrix deviation from lower triangularity: " << triangularityError << "\n";

    if (hasMaxDofs && state.size() >= maxDofs) {
      result.finalError = evaluator.evaluate(state, evaluations).maxError;
      *out << "Maximum number of interpolation DOFs reached, final error: " << result.finalError << "\n";
      result.status = MAX_DOFS_REACHED;
      break;
    }
  }

  *out << "Interpolation data generation stopped: " << toString(result.status) << "\n";

  result.dofs = Teuchos::Array<int>(state.dofs());
  result.basis = state.nonConstBasis();
  return result;
}

InterpolationData eiGreedy(
    const Teuchos::RCP<const VectorArray> &evaluations,
    const Teuchos::ParameterList &params,
    const Teuchos::RCP<const ErrorNorm> &errorNorm,
    const Teuchos::RCP<const InnerProduct> &product)
{
  VectorArrayList evaluationList(evaluations);
  return eiGreedy(evaluationList, params, errorNorm, product);
}

} // namespace EIM
