//*****************************************************************//
//    Albany 3.0:  Copyright 2016 Sandia Corporation               //
//    This Software is released under the BSD license detailed     //
//    in the file "license.txt" in the top-level Albany directory  //
//*****************************************************************//

#include "EIM_InterpolateOperators.hpp"

#include "EIM_GreedyInterpolation.hpp"
#include "EIM_EvaluationProvider.hpp"
#include "EIM_EmpiricalInterpolatedOperator.hpp"
#include "EIM_ParameterListUtils.hpp"

#include "Teuchos_Array.hpp"
#include "Teuchos_TestForException.hpp"

#include <stdexcept>

namespace EIM {

Teuchos::RCP<const Teuchos::ParameterList>
getValidInterpolateOperatorsParameters()
{
  const Teuchos::RCP<Teuchos::ParameterList> result = Teuchos::rcp(new Teuchos::ParameterList("Valid Operator Interpolation Params"));
  result->setParameters(*getValidEIGreedyParameters());
  result->set<std::string>("Cache Region", "memory", "Cache region of the operator evaluations, none to disable caching");
  return result;
}

OperatorInterpolation interpolateOperators(
    const Teuchos::RCP<const Discretization> &discretization,
    const Teuchos::ArrayView<const std::string> &operatorNames,
    const Teuchos::ArrayView<const Parameter> &sample,
    const Teuchos::ParameterList &params,
    const Teuchos::RCP<const ErrorNorm> &errorNorm,
    const Teuchos::RCP<const InnerProduct> &product,
    const Teuchos::RCP<const CacheRegionRepository> &regions)
{
  TEUCHOS_TEST_FOR_EXCEPT(Teuchos::is_null(discretization));
  validateParameters(params, *getValidInterpolateOperatorsParameters(), "operator interpolation");

  const OperatorMap availableOperators = discretization->operators();
  Teuchos::Array<Teuchos::RCP<const Operator> > operators;
  for (int i = 0; i < operatorNames.size(); ++i) {
    const OperatorMap::const_iterator it = availableOperators.find(operatorNames[i]);
    TEUCHOS_TEST_FOR_EXCEPTION(
        it == availableOperators.end(),
        std::invalid_argument,
        operatorNames[i] << " is not an operator of discretization " << discretization->name());
    operators.push_back(it->second);
  }

  Teuchos::RCP<const CacheRegionRepository> cacheRegions = regions;
  if (Teuchos::is_null(cacheRegions)) {
    cacheRegions = defaultCacheRegions();
  }
  const Teuchos::RCP<CacheRegion> cacheRegion =
    cacheRegions->get(getOptional<std::string>(params, "Cache Region", "memory"));

  EvaluationProvider evaluations(discretization, operators(), sample, cacheRegion);

  Teuchos::ParameterList greedyParams(params);
  greedyParams.remove("Cache Region", /*throwIfNotExists =*/ false);

  OperatorInterpolation result;
  result.data = eiGreedy(evaluations, greedyParams, errorNorm, product);

  OperatorMap interpolatedOperators;
  for (int i = 0; i < operatorNames.size(); ++i) {
    interpolatedOperators[operatorNames[i]] =
      Teuchos::rcp(new EmpiricalInterpolatedOperator(operators[i], result.data.dofs(), result.data.basis));
  }
  result.discretization = discretization->withOperators(interpolatedOperators, discretization->name() + "_ei");

  return result;
}

} // namespace EIM
