//*****************************************************************//
//    Albany 3.0:  Copyright 2016 Sandia Corporation               //
//    This Software is released under the BSD license detailed     //
//    in the file "license.txt" in the top-level Albany directory  //
//*****************************************************************//
#ifndef EIM_INTERPOLATEOPERATORS_HPP
#define EIM_INTERPOLATEOPERATORS_HPP

#include "EIM_Discretization.hpp"
#include "EIM_InterpolationData.hpp"
#include "EIM_CacheRegion.hpp"
#include "EIM_ErrorNorm.hpp"
#include "EIM_InnerProduct.hpp"

#include "Teuchos_RCP.hpp"
#include "Teuchos_ArrayView.hpp"
#include "Teuchos_ParameterList.hpp"

#include <string>

namespace EIM {

struct OperatorInterpolation {
  Teuchos::RCP<Discretization> discretization;
  InterpolationData data;
};

// Options of interpolateOperators: those of eiGreedy, plus
//   "Cache Region" : name of the region storing the operator evaluations,
//                    "memory" (default) or "none"
Teuchos::RCP<const Teuchos::ParameterList> getValidInterpolateOperatorsParameters();

// Empirical interpolation of the named operators of discretization over a parameter sample.
// All operators share one collateral basis. The returned discretization, named after the
// original with an "_ei" suffix, holds EmpiricalInterpolatedOperators in their place.
// Cache region names are resolved in regions (the default repository when null).
OperatorInterpolation interpolateOperators(
    const Teuchos::RCP<const Discretization> &discretization,
    const Teuchos::ArrayView<const std::string> &operatorNames,
    const Teuchos::ArrayView<const Parameter> &sample,
    const Teuchos::ParameterList &params,
    const Teuchos::RCP<const ErrorNorm> &errorNorm = Teuchos::null,
    const Teuchos::RCP<const InnerProduct> &product = Teuchos::null,
    const Teuchos::RCP<const CacheRegionRepository> &regions = Teuchos::null);

} // namespace EIM

#endif /* EIM_INTERPOLATEOPERATORS_HPP */
