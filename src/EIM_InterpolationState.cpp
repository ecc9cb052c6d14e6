//*****************************************************************//
//    Albany 3.0:  Copyright 2016 Sandia Corporation               //
//    This Software is released under the BSD license detailed     //
//    in the file "license.txt" in the top-level Albany directory  //
//*****************************************************************//

#include "EIM_InterpolationState.hpp"

#include "EIM_DenseLinearAlgebra.hpp"
#include "EIM_Exceptions.hpp"

#include "Teuchos_TestForException.hpp"

namespace EIM {

InterpolationState::InterpolationState(const VectorArray &prototype) :
  basis_(prototype.emptyLike()),
  dofs_(),
  selectedDofs_(),
  interpolationMatrix_(denseMatrix(0, 0))
{
  // Nothing to do
}

Epetra_SerialDenseMatrix
InterpolationState::coefficients(const VectorArray &U) const
{
  // interpolationMatrix * coefficients = U(dofs)^T
  Epetra_SerialDenseMatrix result = transpose(U.components(dofs_()));
  solveUnitLowerTriangular(interpolationMatrix_, result);
  return result;
}

Teuchos::RCP<VectorArray>
InterpolationState::interpolate(const VectorArray &U) const
{
  return basis_->lincomb(this->coefficients(U));
}

void
InterpolationState::extend(int dof, VectorArray &normalizedVector)
{
  TEUCHOS_TEST_FOR_EXCEPTION(
      normalizedVector.size() != 1,
      DimensionError,
      "Basis extension expects a single vector, got " << normalizedVector.size());
  TEUCHOS_TEST_FOR_EXCEPTION(
      this->isSelected(dof),
      std::invalid_argument,
      "Interpolation dof " << dof << " is already selected");

  basis_->absorb(normalizedVector);
  dofs_.push_back(dof);
  selectedDofs_.insert(dof);
  interpolationMatrix_ = transpose(basis_->components(dofs_()));
}

double
InterpolationState::triangularityError() const
{
  return strictUpperMaxAbs(interpolationMatrix_);
}

} // namespace EIM
