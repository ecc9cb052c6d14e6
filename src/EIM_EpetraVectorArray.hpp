//*****************************************************************//
//    Albany 3.0:  Copyright 2016 Sandia Corporation               //
//    This Software is released under the BSD license detailed     //
//    in the file "license.txt" in the top-level Albany directory  //
//*****************************************************************//
#ifndef EIM_EPETRAVECTORARRAY_HPP
#define EIM_EPETRAVECTORARRAY_HPP

#include "EIM_VectorArray.hpp"

#include "Epetra_Map.h"
#include "Epetra_MultiVector.h"

#include "Teuchos_RCP.hpp"

namespace EIM {

// VectorArray stored in an Epetra_MultiVector.
// The map must be a point map whose global ids cover [0, dim).
// An empty array holds no multivector, as Epetra does not allow zero vectors.
class EpetraVectorArray : public VectorArray {
public:
  explicit EpetraVectorArray(const Epetra_Map &map);
  explicit EpetraVectorArray(const Teuchos::RCP<Epetra_MultiVector> &vectors);

  const Epetra_Map &map() const { return map_; }
  const Epetra_Comm &comm() const { return map_.Comm(); }

  // Null when the array is empty
  Teuchos::RCP<const Epetra_MultiVector> multiVector() const { return vectors_; }
  Teuchos::RCP<Epetra_MultiVector> nonConstMultiVector() { return vectors_; }

  // Overridden functions
  virtual int dim() const;
  virtual int size() const;
  virtual bool sameSpace(const VectorArray &other) const;

  virtual Teuchos::RCP<VectorArray> emptyLike() const;
  virtual Teuchos::RCP<VectorArray> copy() const;
  virtual Teuchos::RCP<VectorArray> copy(const Teuchos::ArrayView<const int> &indices) const;

  virtual void append(const VectorArray &other);
  virtual void remove(const Teuchos::ArrayView<const int> &indices);
  virtual void clear();

  virtual Epetra_SerialDenseMatrix components(const Teuchos::ArrayView<const int> &dofs) const;

  virtual Epetra_SerialDenseMatrix dot(const VectorArray &other) const;
  virtual Teuchos::Array<double> pairwiseDot(const VectorArray &other) const;

  virtual Teuchos::Array<double> l2Norm() const;
  virtual void amax(Teuchos::Array<int> &indices, Teuchos::Array<double> &values) const;

  virtual Teuchos::RCP<VectorArray> lincomb(const Epetra_SerialDenseMatrix &coefficients) const;

  virtual void scale(double alpha);
  virtual void axpy(double alpha, const VectorArray &x);

  // Throws DimensionError unless other is an EpetraVectorArray on the same map
  const EpetraVectorArray &sameSpaceCast(const VectorArray &other) const;

private:
  Epetra_Map map_;
  Teuchos::RCP<Epetra_MultiVector> vectors_;

  EpetraVectorArray(const Epetra_Map &map, const Teuchos::RCP<Epetra_MultiVector> &vectors);
};

} // namespace EIM

#endif /* EIM_EPETRAVECTORARRAY_HPP */
