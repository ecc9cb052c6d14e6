//*****************************************************************//
//    Albany 3.0:  Copyright 2016 Sandia Corporation               //
//    This Software is released under the BSD license detailed     //
//    in the file "license.txt" in the top-level Albany directory  //
//*****************************************************************//

#include "EIM_InnerProduct.hpp"

#include "EIM_EpetraVectorArray.hpp"
#include "EIM_Exceptions.hpp"

#include "Epetra_MultiVector.h"

#include "Teuchos_Assert.hpp"
#include "Teuchos_TestForException.hpp"

namespace EIM {

EpetraOperatorProduct::EpetraOperatorProduct(const Teuchos::RCP<const Epetra_Operator> &metric) :
  metric_(metric)
{
  TEUCHOS_TEST_FOR_EXCEPTION(
      Teuchos::is_null(metric_),
      ConfigurationError,
      "Inner product requires a metric operator");
}

Teuchos::RCP<VectorArray>
EpetraOperatorProduct::applyMetric(const VectorArray &V) const
{
  const EpetraVectorArray *source = dynamic_cast<const EpetraVectorArray *>(&V);
  TEUCHOS_TEST_FOR_EXCEPTION(
      source == NULL || !metric_->OperatorDomainMap().SameAs(source->map()),
      DimensionError,
      "Vector array does not belong to the domain of the metric operator");

  if (source->empty()) {
    return source->emptyLike();
  }

  const Teuchos::RCP<Epetra_MultiVector> result(
      new Epetra_MultiVector(metric_->OperatorRangeMap(), source->size(), /*zeroOut =*/ false));
  const int ierr = metric_->Apply(*source->multiVector(), *result);
  TEUCHOS_ASSERT(ierr == 0);
  return Teuchos::rcp(new EpetraVectorArray(result));
}

Epetra_SerialDenseMatrix
EpetraOperatorProduct::apply2(const VectorArray &U, const VectorArray &V) const
{
  // (U_i, V_j) = U_i^T * (M * V_j)
  return U.dot(*this->applyMetric(V));
}

Teuchos::Array<double>
EpetraOperatorProduct::pairwiseApply2(const VectorArray &U, const VectorArray &V) const
{
  return U.pairwiseDot(*this->applyMetric(V));
}

Epetra_SerialDenseMatrix
innerProducts(const Teuchos::RCP<const InnerProduct> &product, const VectorArray &U, const VectorArray &V)
{
  return Teuchos::nonnull(product) ? product->apply2(U, V) : U.dot(V);
}

Teuchos::Array<double>
pairwiseInnerProducts(const Teuchos::RCP<const InnerProduct> &product, const VectorArray &U, const VectorArray &V)
{
  return Teuchos::nonnull(product) ? product->pairwiseApply2(U, V) : U.pairwiseDot(V);
}

} // namespace EIM
