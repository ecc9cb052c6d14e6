//*****************************************************************//
//    Albany 3.0:  Copyright 2016 Sandia Corporation               //
//    This Software is released under the BSD license detailed     //
//    in the file "license.txt" in the top-level Albany directory  //
//*****************************************************************//

#include "EIM_EmpiricalInterpolatedOperator.hpp"

#include "EIM_DenseLinearAlgebra.hpp"
#include "EIM_Exceptions.hpp"

#include "Teuchos_TestForException.hpp"

namespace EIM {

EmpiricalInterpolatedOperator::EmpiricalInterpolatedOperator(
    const Teuchos::RCP<const Operator> &op,
    const Teuchos::ArrayView<const int> &dofs,
    const Teuchos::RCP<const VectorArray> &basis,
    bool triangular) :
  op_(op),
  dofs_(dofs),
  basis_(basis),
  triangular_(triangular),
  interpolationMatrix_()
{
  TEUCHOS_TEST_FOR_EXCEPT(Teuchos::is_null(op_) || Teuchos::is_null(basis_));
  TEUCHOS_TEST_FOR_EXCEPTION(
      basis_->size() != dofs_.size(),
      DimensionError,
      "Collateral basis of size " << basis_->size() << " does not match " << dofs_.size() << " interpolation dofs");
  TEUCHOS_TEST_FOR_EXCEPTION(
      basis_->dim() != op_->dimRange(),
      DimensionError,
      "Collateral basis of dimension " << basis_->dim() << " does not match operator range dimension " << op_->dimRange());

  interpolationMatrix_ = transpose(basis_->components(dofs_()));
}

int
EmpiricalInterpolatedOperator::dimSource() const
{
  return op_->dimSource();
}

int
EmpiricalInterpolatedOperator::dimRange() const
{
  return op_->dimRange();
}

Teuchos::RCP<VectorArray>
EmpiricalInterpolatedOperator::apply(const VectorArray &U, const Parameter &mu) const
{
  const Teuchos::RCP<const VectorArray> evaluations = op_->apply(U, mu);

  Epetra_SerialDenseMatrix coefficients = transpose(evaluations->components(dofs_()));
  if (triangular_) {
    solveUnitLowerTriangular(interpolationMatrix_, coefficients);
  } else {
    solve(interpolationMatrix_, coefficients);
  }

  return basis_->lincomb(coefficients);
}

} // namespace EIM
