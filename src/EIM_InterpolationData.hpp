//*****************************************************************//
//    Albany 3.0:  Copyright 2016 Sandia Corporation               //
//    This Software is released under the BSD license detailed     //
//    in the file "license.txt" in the top-level Albany directory  //
//*****************************************************************//
#ifndef EIM_INTERPOLATIONDATA_HPP
#define EIM_INTERPOLATIONDATA_HPP

#include "EIM_VectorArray.hpp"

#include "Teuchos_RCP.hpp"
#include "Teuchos_Array.hpp"

#include <string>

namespace EIM {

// Terminal state of an interpolation run
enum InterpolationStatus {
  CONVERGED,         // target error reached
  MAX_DOFS_REACHED,  // interpolation dof budget exhausted
  DOF_COLLISION,     // candidate dof already selected
  BASIS_EXHAUSTED    // every POD mode received a dof (DEIM)
};

std::string toString(InterpolationStatus status);

struct InterpolationData {
  InterpolationData() :
    finalError(-1.0),
    status(CONVERGED),
    requestedBasisSize(0),
    truncated(false)
  {}

  Teuchos::Array<int> dofs;
  Teuchos::RCP<VectorArray> basis;

  // Maximum approximation error before each basis extension
  Teuchos::Array<double> errors;
  // Deviation of the interpolation matrix from lower-triangularity (EI-Greedy only)
  Teuchos::Array<double> triangularityErrors;
  // Last computed maximum error, -1 when none was computed
  double finalError;

  InterpolationStatus status;

  // DEIM only
  int requestedBasisSize;
  bool truncated;
  Teuchos::Array<double> singularValues;
};

} // namespace EIM

#endif /* EIM_INTERPOLATIONDATA_HPP */
