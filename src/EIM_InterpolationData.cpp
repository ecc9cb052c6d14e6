//*****************************************************************//
//    Albany 3.0:  Copyright 2016 Sandia Corporation               //
//    This Software is released under the BSD license detailed     //
//    in the file "license.txt" in the top-level Albany directory  //
//*****************************************************************//

#include "EIM_InterpolationData.hpp"

namespace EIM {

std::string toString(InterpolationStatus status)
{
  switch (status) {
    case CONVERGED: return "converged";
    case MAX_DOFS_REACHED: return "maximum number of interpolation dofs reached";
    case DOF_COLLISION: return "interpolation dof collision";
    case BASIS_EXHAUSTED: return "basis exhausted";
  }
  return "unknown";
}

} // namespace EIM
