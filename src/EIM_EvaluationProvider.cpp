//*****************************************************************//
//    Albany 3.0:  Copyright 2016 Sandia Corporation               //
//    This Software is released under the BSD license detailed     //
//    in the file "license.txt" in the top-level Albany directory  //
//*****************************************************************//

#include "EIM_EvaluationProvider.hpp"

#include "EIM_Exceptions.hpp"

#include "Teuchos_TestForException.hpp"

#include <sstream>
#include <stdexcept>

namespace EIM {

namespace Detail {

std::string newProviderIdentity()
{
  static int providerCount = 0;
  std::ostringstream result;
  result << "EvaluationProvider#" << providerCount++;
  return result.str();
}

} // namespace Detail

EvaluationProvider::EvaluationProvider(
    const Teuchos::RCP<const Discretization> &discretization,
    const Teuchos::ArrayView<const Teuchos::RCP<const Operator> > &operators,
    const Teuchos::ArrayView<const Parameter> &sample,
    const Teuchos::RCP<CacheRegion> &cacheRegion) :
  identity_(Detail::newProviderIdentity()),
  discretization_(discretization),
  operators_(operators),
  sample_(sample),
  cacheRegion_(cacheRegion)
{
  TEUCHOS_TEST_FOR_EXCEPT(Teuchos::is_null(discretization_));
  TEUCHOS_TEST_FOR_EXCEPTION(
      operators_.empty(),
      DimensionError,
      "No operator to evaluate");

  const int dimRange = operators_[0]->dimRange();
  for (int i = 1; i < operators_.size(); ++i) {
    TEUCHOS_TEST_FOR_EXCEPTION(
        operators_[i]->dimRange() != dimRange,
        DimensionError,
        "Operator " << i << " has range dimension " << operators_[i]->dimRange() <<
        ", operator 0 has " << dimRange);
  }
}

EvaluationProvider::~EvaluationProvider()
{
  if (Teuchos::nonnull(cacheRegion_)) {
    cacheRegion_->removeOwner(identity_);
  }
}

int
EvaluationProvider::size() const
{
  return sample_.size();
}

Teuchos::RCP<const VectorArray>
EvaluationProvider::at(int i)
{
  TEUCHOS_TEST_FOR_EXCEPTION(
      i < 0 || i >= this->size(),
      std::out_of_range,
      "Sample index " << i << " is out of range [0, " << this->size() << ")");

  if (Teuchos::is_null(cacheRegion_)) {
    return this->compute(i);
  }

  const CacheKey key(identity_, i);
  const Teuchos::RCP<const VectorArray> cached = cacheRegion_->get(key);
  if (Teuchos::nonnull(cached)) {
    return cached;
  }

  const Teuchos::RCP<const VectorArray> result = this->compute(i);
  cacheRegion_->set(key, result);
  return result;
}

Teuchos::RCP<const VectorArray>
EvaluationProvider::compute(int i) const
{
  const Parameter &mu = sample_[i];
  const Teuchos::RCP<const VectorArray> solution = discretization_->solve(mu);

  Teuchos::RCP<VectorArray> result;
  for (int j = 0; j < operators_.size(); ++j) {
    const Teuchos::RCP<VectorArray> evaluations = operators_[j]->apply(*solution, mu);
    if (Teuchos::is_null(result)) {
      result = evaluations;
    } else {
      result->absorb(*evaluations);
    }
  }
  return result;
}

} // namespace EIM
