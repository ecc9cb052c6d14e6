//*****************************************************************//
//    Albany 3.0:  Copyright 2016 Sandia Corporation               //
//    This Software is released under the BSD license detailed     //
//    in the file "license.txt" in the top-level Albany directory  //
//*****************************************************************//
#ifndef EIM_EMPIRICALINTERPOLATEDOPERATOR_HPP
#define EIM_EMPIRICALINTERPOLATEDOPERATOR_HPP

#include "EIM_Discretization.hpp"
#include "EIM_VectorArray.hpp"

#include "Epetra_SerialDenseMatrix.h"

#include "Teuchos_RCP.hpp"
#include "Teuchos_Array.hpp"
#include "Teuchos_ArrayView.hpp"

namespace EIM {

// Substitute of an operator by its interpolant in the collateral basis.
// The wrapped operator is evaluated in full, then only its components at the
// interpolation dofs are used.
class EmpiricalInterpolatedOperator : public Operator {
public:
  // triangular: the interpolation matrix is unit lower triangular (EI-Greedy),
  // otherwise it is factored by LU (DEIM)
  EmpiricalInterpolatedOperator(
      const Teuchos::RCP<const Operator> &op,
      const Teuchos::ArrayView<const int> &dofs,
      const Teuchos::RCP<const VectorArray> &basis,
      bool triangular = true);

  Teuchos::RCP<const Operator> wrappedOperator() const { return op_; }
  Teuchos::ArrayView<const int> dofs() const { return dofs_(); }
  const VectorArray &basis() const { return *basis_; }

  // Overridden functions
  virtual int dimSource() const;
  virtual int dimRange() const;
  virtual Teuchos::RCP<VectorArray> apply(const VectorArray &U, const Parameter &mu) const;

private:
  Teuchos::RCP<const Operator> op_;
  Teuchos::Array<int> dofs_;
  Teuchos::RCP<const VectorArray> basis_;
  bool triangular_;
  Epetra_SerialDenseMatrix interpolationMatrix_;
};

} // namespace EIM

#endif /* EIM_EMPIRICALINTERPOLATEDOPERATOR_HPP */
