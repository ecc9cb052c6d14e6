//*****************************************************************//
//    Albany 3.0:  Copyright 2016 Sandia Corporation               //
//    This Software is released under the BSD license detailed     //
//    in the file "license.txt" in the top-level Albany directory  //
//*****************************************************************//
#ifndef EIM_INNERPRODUCT_HPP
#define EIM_INNERPRODUCT_HPP

#include "EIM_VectorArray.hpp"

#include "Epetra_Operator.h"
#include "Epetra_SerialDenseMatrix.h"

#include "Teuchos_RCP.hpp"
#include "Teuchos_Array.hpp"

namespace EIM {

// Symmetric positive definite bilinear form on a vector space
class InnerProduct {
public:
  // Matrix of products (U_i, V_j), of size U.size() x V.size()
  virtual Epetra_SerialDenseMatrix apply2(const VectorArray &U, const VectorArray &V) const = 0;

  // Products (U_i, V_i) of arrays of equal length
  virtual Teuchos::Array<double> pairwiseApply2(const VectorArray &U, const VectorArray &V) const = 0;

  virtual ~InnerProduct() {}
};

// (u, v) = u^T * M * v for a symmetric positive definite Epetra operator M
class EpetraOperatorProduct : public InnerProduct {
public:
  explicit EpetraOperatorProduct(const Teuchos::RCP<const Epetra_Operator> &metric);

  virtual Epetra_SerialDenseMatrix apply2(const VectorArray &U, const VectorArray &V) const;
  virtual Teuchos::Array<double> pairwiseApply2(const VectorArray &U, const VectorArray &V) const;

private:
  Teuchos::RCP<const Epetra_Operator> metric_;

  Teuchos::RCP<VectorArray> applyMetric(const VectorArray &V) const;
};

// Product matrix under the given inner product, or the Euclidean one when product is null
Epetra_SerialDenseMatrix
innerProducts(const Teuchos::RCP<const InnerProduct> &product, const VectorArray &U, const VectorArray &V);

Teuchos::Array<double>
pairwiseInnerProducts(const Teuchos::RCP<const InnerProduct> &product, const VectorArray &U, const VectorArray &V);

} // namespace EIM

#endif /* EIM_INNERPRODUCT_HPP */
