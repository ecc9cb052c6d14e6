//*****************************************************************//
//    Albany 3.0:  Copyright 2016 Sandia Corporation               //
//    This Software is released under the BSD license detailed     //
//    in the file "license.txt" in the top-level Albany directory  //
//*****************************************************************//
#ifndef EIM_INTERPOLATIONSTATE_HPP
#define EIM_INTERPOLATIONSTATE_HPP

#include "EIM_VectorArray.hpp"

#include "Epetra_SerialDenseMatrix.h"

#include "Teuchos_RCP.hpp"
#include "Teuchos_Array.hpp"
#include "Teuchos_ArrayView.hpp"

#include <set>

namespace EIM {

// Collateral basis, interpolation dofs and interpolation matrix of a greedy run.
//
// The interpolation matrix has entries (i, j) = component dofs[i] of basis vector j.
// Every basis vector is scaled so that its own dof component is 1, which makes the
// matrix unit lower triangular up to roundoff.
class InterpolationState {
public:
  // Starts from the empty basis in the space of prototype
  explicit InterpolationState(const VectorArray &prototype);

  int size() const { return dofs_.size(); }

  const VectorArray &basis() const { return *basis_; }
  Teuchos::RCP<VectorArray> nonConstBasis() const { return basis_; }
  Teuchos::ArrayView<const int> dofs() const { return dofs_(); }
  const Epetra_SerialDenseMatrix &interpolationMatrix() const { return interpolationMatrix_; }

  bool isSelected(int dof) const { return selectedDofs_.count(dof) > 0; }

  // Interpolation coefficients of U, of size size() x U.size()
  Epetra_SerialDenseMatrix coefficients(const VectorArray &U) const;

  // Interpolant of U, agreeing with U at the selected dofs
  Teuchos::RCP<VectorArray> interpolate(const VectorArray &U) const;

  // Moves the single vector of normalizedVector into the basis and selects dof
  void extend(int dof, VectorArray &normalizedVector);

  // Largest entry above the diagonal of the interpolation matrix
  double triangularityError() const;

private:
  Teuchos::RCP<VectorArray> basis_;
  Teuchos::Array<int> dofs_;
  std::set<int> selectedDofs_;
  Epetra_SerialDenseMatrix interpolationMatrix_;

  // Disallow copy and assignment
  InterpolationState(const InterpolationState &);
  InterpolationState &operator=(const InterpolationState &);
};

} // namespace EIM

#endif /* EIM_INTERPOLATIONSTATE_HPP */
