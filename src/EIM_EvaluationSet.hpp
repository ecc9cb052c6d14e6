//*****************************************************************//
//    Albany 3.0:  Copyright 2016 Sandia Corporation               //
//    This Software is released under the BSD license detailed     //
//    in the file "license.txt" in the top-level Albany directory  //
//*****************************************************************//
#ifndef EIM_EVALUATIONSET_HPP
#define EIM_EVALUATIONSET_HPP

#include "EIM_VectorArray.hpp"

#include "Teuchos_RCP.hpp"
#include "Teuchos_Array.hpp"
#include "Teuchos_ArrayView.hpp"

namespace EIM {

// Finite indexable sequence of batches of operator evaluations.
// Access is non-const as implementations may compute batches lazily.
class EvaluationSet {
public:
  virtual int size() const = 0;

  // Throws std::out_of_range unless 0 <= i < size()
  virtual Teuchos::RCP<const VectorArray> at(int i) = 0;

  virtual ~EvaluationSet() {}
};

// Evaluation batches held in memory
class VectorArrayList : public EvaluationSet {
public:
  VectorArrayList();
  explicit VectorArrayList(const Teuchos::RCP<const VectorArray> &batch);
  explicit VectorArrayList(const Teuchos::ArrayView<const Teuchos::RCP<const VectorArray> > &batches);

  void push_back(const Teuchos::RCP<const VectorArray> &batch);

  virtual int size() const;
  virtual Teuchos::RCP<const VectorArray> at(int i);

private:
  Teuchos::Array<Teuchos::RCP<const VectorArray> > batches_;
};

// Throws DimensionError if evaluations is empty, holds no vector at all,
// or mixes batches of different spaces. Returns the first non-empty batch.
Teuchos::RCP<const VectorArray> checkedPrototype(EvaluationSet &evaluations);

} // namespace EIM

#endif /* EIM_EVALUATIONSET_HPP */
