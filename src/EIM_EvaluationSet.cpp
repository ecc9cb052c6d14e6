//*****************************************************************//
//    Albany 3.0:  Copyright 2016 Sandia Corporation               //
//    This Software is released under the BSD license detailed     //
//    in the file "license.txt" in the top-level Albany directory  //
//*****************************************************************//

#include "EIM_EvaluationSet.hpp"

#include "EIM_Exceptions.hpp"

#include "Teuchos_TestForException.hpp"

#include <stdexcept>

namespace EIM {

VectorArrayList::VectorArrayList() :
  batches_()
{
  // Nothing to do
}

VectorArrayList::VectorArrayList(const Teuchos::RCP<const VectorArray> &batch) :
  batches_(1, batch)
{
  TEUCHOS_TEST_FOR_EXCEPT(Teuchos::is_null(batch));
}

VectorArrayList::VectorArrayList(const Teuchos::ArrayView<const Teuchos::RCP<const VectorArray> > &batches) :
  batches_(batches)
{
  for (int i = 0; i < batches_.size(); ++i) {
    TEUCHOS_TEST_FOR_EXCEPT(Teuchos::is_null(batches_[i]));
  }
}

void
VectorArrayList::push_back(const Teuchos::RCP<const VectorArray> &batch)
{
  TEUCHOS_TEST_FOR_EXCEPT(Teuchos::is_null(batch));
  batches_.push_back(batch);
}

int
VectorArrayList::size() const
{
  return batches_.size();
}

Teuchos::RCP<const VectorArray>
VectorArrayList::at(int i)
{
  TEUCHOS_TEST_FOR_EXCEPTION(
      i < 0 || i >= this->size(),
      std::out_of_range,
      "Evaluation index " << i << " is out of range [0, " << this->size() << ")");
  return batches_[i];
}

Teuchos::RCP<const VectorArray>
checkedPrototype(EvaluationSet &evaluations)
{
  const int batchCount = evaluations.size();
  TEUCHOS_TEST_FOR_EXCEPTION(
      batchCount == 0,
      DimensionError,
      "The evaluation set is empty");

  const Teuchos::RCP<const VectorArray> first = evaluations.at(0);
  Teuchos::RCP<const VectorArray> result;
  for (int i = 0; i < batchCount; ++i) {
    const Teuchos::RCP<const VectorArray> batch = evaluations.at(i);
    TEUCHOS_TEST_FOR_EXCEPTION(
        !first->sameSpace(*batch),
        DimensionError,
        "Evaluation batch " << i << " (dim " << batch->dim() << ") does not belong to the space of batch 0 (dim " <<
        first->dim() << ")");
    if (Teuchos::is_null(result) && !batch->empty()) {
      result = batch;
    }
  }

  TEUCHOS_TEST_FOR_EXCEPTION(
      Teuchos::is_null(result),
      DimensionError,
      "The evaluation set contains no vector");
  return result;
}

} // namespace EIM
