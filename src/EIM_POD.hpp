//*****************************************************************//
//    Albany 3.0:  Copyright 2016 Sandia Corporation               //
//    This Software is released under the BSD license detailed     //
//    in the file "license.txt" in the top-level Albany directory  //
//*****************************************************************//
#ifndef EIM_POD_HPP
#define EIM_POD_HPP

#include "EIM_VectorArray.hpp"
#include "EIM_InnerProduct.hpp"

#include "Teuchos_RCP.hpp"
#include "Teuchos_Array.hpp"
#include "Teuchos_ArrayView.hpp"
#include "Teuchos_ParameterList.hpp"

namespace EIM {

struct PODResult {
  Teuchos::RCP<VectorArray> modes;
  Teuchos::Array<double> singularValues;
};

// Options of pod:
//   "Relative Tolerance" : modes with singular value below this fraction of the largest are dropped
//   "Absolute Tolerance" : modes with singular value below this value are dropped
//   "Orthonormalize"     : re-orthonormalize the modes by Gram-Schmidt
Teuchos::RCP<const Teuchos::ParameterList> getValidPODParameters();

// Proper orthogonal decomposition of snapshots by the method of snapshots.
// At most modeCount modes are returned, all modes above the tolerances when modeCount is -1.
// Orthonormality is with respect to product (Euclidean when null).
PODResult pod(
    const VectorArray &snapshots,
    int modeCount,
    const Teuchos::ParameterList &params,
    const Teuchos::RCP<const InnerProduct> &product = Teuchos::null);

// Orthonormalizes vectors in place by modified Gram-Schmidt with reiteration.
// Returns the indices of the input vectors that were kept, the others being
// numerically linearly dependent on their predecessors.
Teuchos::Array<int> gramSchmidt(VectorArray &vectors, const Teuchos::RCP<const InnerProduct> &product = Teuchos::null);

// sqrt(sum_{j > i} s_j^2 / sum_j s_j^2) for singular values s sorted in decreasing order
Teuchos::Array<double> discardedEnergyFractions(const Teuchos::ArrayView<const double> &singularValues);

} // namespace EIM

#endif /* EIM_POD_HPP */
