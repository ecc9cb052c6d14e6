//*****************************************************************//
//    Albany 3.0:  Copyright 2016 Sandia Corporation               //
//    This Software is released under the BSD license detailed     //
//    in the file "license.txt" in the top-level Albany directory  //
//*****************************************************************//
#ifndef EIM_DEIM_HPP
#define EIM_DEIM_HPP

#include "EIM_InterpolationData.hpp"
#include "EIM_VectorArray.hpp"
#include "EIM_ErrorNorm.hpp"
#include "EIM_InnerProduct.hpp"

#include "Teuchos_RCP.hpp"
#include "Teuchos_ParameterList.hpp"

namespace EIM {

// Options of deim:
//   "Modes" : number of POD modes to interpolate, -1 (default) for all
//   "POD"   : sublist forwarded to pod, see getValidPODParameters
Teuchos::RCP<const Teuchos::ParameterList> getValidDEIMParameters();

// Discrete empirical interpolation: a POD basis of the snapshots receives one
// interpolation dof per mode, in order, from the largest component of the residual
// of each mode interpolated by its predecessors. A dof collision stops the
// assignment and the remaining modes are discarded.
InterpolationData deim(
    const VectorArray &snapshots,
    const Teuchos::ParameterList &params,
    const Teuchos::RCP<const ErrorNorm> &errorNorm = Teuchos::null,
    const Teuchos::RCP<const InnerProduct> &product = Teuchos::null);

// Dof assignment of deim on a given basis, which is truncated in place to the
// modes that received a dof. The requested basis size is the initial basis size.
InterpolationData deimFromBasis(
    const Teuchos::RCP<VectorArray> &basis,
    const Teuchos::RCP<const ErrorNorm> &errorNorm = Teuchos::null);

} // namespace EIM

#endif /* EIM_DEIM_HPP */
