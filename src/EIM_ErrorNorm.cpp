//*****************************************************************//
//    Albany 3.0:  Copyright 2016 Sandia Corporation               //
//    This Software is released under the BSD license detailed     //
//    in the file "license.txt" in the top-level Albany directory  //
//*****************************************************************//

#include "EIM_ErrorNorm.hpp"

#include "EIM_Exceptions.hpp"

#include "Teuchos_TestForException.hpp"

#include <algorithm>
#include <cmath>

namespace EIM {

InducedNorm::InducedNorm(const Teuchos::RCP<const InnerProduct> &product) :
  product_(product)
{
  TEUCHOS_TEST_FOR_EXCEPTION(
      Teuchos::is_null(product_),
      ConfigurationError,
      "Induced norm requires an inner product");
}

Teuchos::Array<double>
InducedNorm::operator()(const VectorArray &errors) const
{
  Teuchos::Array<double> result = product_->pairwiseApply2(errors, errors);
  for (Teuchos::Array<double>::iterator it = result.begin(); it != result.end(); ++it) {
    // Roundoff may yield tiny negative squares
    *it = std::sqrt(std::max(*it, 0.0));
  }
  return result;
}

Teuchos::Array<double> errorNorms(const Teuchos::RCP<const ErrorNorm> &norm, const VectorArray &errors)
{
  if (Teuchos::is_null(norm)) {
    return errors.l2Norm();
  }

  const Teuchos::Array<double> result = (*norm)(errors);
  TEUCHOS_TEST_FOR_EXCEPTION(
      result.size() != errors.size(),
      DimensionError,
      "Error norm returned " << result.size() << " values for " << errors.size() << " vectors");
  return result;
}

} // namespace EIM
