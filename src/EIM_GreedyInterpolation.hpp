//*****************************************************************//
//    Albany 3.0:  Copyright 2016 Sandia Corporation               //
//    This Software is released under the BSD license detailed     //
//    in the file "license.txt" in the top-level Albany directory  //
//*****************************************************************//
#ifndef EIM_GREEDYINTERPOLATION_HPP
#define EIM_GREEDYINTERPOLATION_HPP

#include "EIM_InterpolationData.hpp"
#include "EIM_EvaluationSet.hpp"
#include "EIM_VectorArray.hpp"
#include "EIM_ErrorNorm.hpp"
#include "EIM_InnerProduct.hpp"

#include "Teuchos_RCP.hpp"
#include "Teuchos_ParameterList.hpp"

namespace EIM {

// Options of eiGreedy:
//   "Projection"                 : "Orthogonal" (default) or "EI"
//   "Target Error"               : stop once the maximum error does not exceed this value
//   "Maximum Interpolation DOFs" : stop once this many dofs are selected
Teuchos::RCP<const Teuchos::ParameterList> getValidEIGreedyParameters();

// Greedy empirical interpolation of a set of operator evaluations.
//
// The basis is grown one vector at a time from the worst approximated evaluation;
// its interpolation dof is the location of the largest residual component.
// A product may only be given with orthogonal projection.
InterpolationData eiGreedy(
    EvaluationSet &evaluations,
    const Teuchos::ParameterList &params,
    const Teuchos::RCP<const ErrorNorm> &errorNorm = Teuchos::null,
    const Teuchos::RCP<const InnerProduct> &product = Teuchos::null);

InterpolationData eiGreedy(
    const Teuchos::RCP<const VectorArray> &evaluations,
    const Teuchos::ParameterList &params,
    const Teuchos::RCP<const ErrorNorm> &errorNorm = Teuchos::null,
    const Teuchos::RCP<const InnerProduct> &product = Teuchos::null);

} // namespace EIM

#endif /* EIM_GREEDYINTERPOLATION_HPP */
