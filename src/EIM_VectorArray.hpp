//*****************************************************************//
//    Albany 3.0:  Copyright 2016 Sandia Corporation               //
//    This Software is released under the BSD license detailed     //
//    in the file "license.txt" in the top-level Albany directory  //
//*****************************************************************//
#ifndef EIM_VECTORARRAY_HPP
#define EIM_VECTORARRAY_HPP

#include "Epetra_SerialDenseMatrix.h"

#include "Teuchos_RCP.hpp"
#include "Teuchos_Array.hpp"
#include "Teuchos_ArrayView.hpp"

namespace EIM {

// Ordered collection of vectors sharing the same space of dimension dim().
//
// Indices passed to components() and returned by amax() are global
// component indices in [0, dim()). Dense results are laid out as follows:
//   components(dofs)  : size() x dofs.size()
//   dot(other)        : size() x other.size()
//   lincomb(coeffs)   : coeffs is size() x count, column j gives the
//                       coefficients of the j-th resulting vector
class VectorArray {
public:
  virtual int dim() const = 0;
  virtual int size() const = 0;
  bool empty() const { return this->size() == 0; }

  // True if other lives in the same vector space (same type and layout)
  virtual bool sameSpace(const VectorArray &other) const = 0;

  virtual Teuchos::RCP<VectorArray> emptyLike() const = 0;
  virtual Teuchos::RCP<VectorArray> copy() const = 0;
  virtual Teuchos::RCP<VectorArray> copy(const Teuchos::ArrayView<const int> &indices) const = 0;

  virtual void append(const VectorArray &other) = 0;
  virtual void remove(const Teuchos::ArrayView<const int> &indices) = 0;
  virtual void clear() = 0;

  // Moves the vectors of other to the end of this array, other is left empty
  void absorb(VectorArray &other) {
    this->append(other);
    other.clear();
  }

  virtual Epetra_SerialDenseMatrix components(const Teuchos::ArrayView<const int> &dofs) const = 0;

  virtual Epetra_SerialDenseMatrix dot(const VectorArray &other) const = 0;
  virtual Teuchos::Array<double> pairwiseDot(const VectorArray &other) const = 0;
  Epetra_SerialDenseMatrix gramian() const { return this->dot(*this); }

  virtual Teuchos::Array<double> l2Norm() const = 0;

  // For each vector, index and value of the component of largest magnitude
  virtual void amax(Teuchos::Array<int> &indices, Teuchos::Array<double> &values) const = 0;

  virtual Teuchos::RCP<VectorArray> lincomb(const Epetra_SerialDenseMatrix &coefficients) const = 0;

  virtual void scale(double alpha) = 0;
  // this <- this + alpha * x, vector by vector
  virtual void axpy(double alpha, const VectorArray &x) = 0;
  void subtract(const VectorArray &x) { this->axpy(-1.0, x); }

  virtual ~VectorArray() {}

protected:
  VectorArray() {}

private:
  // Disallow copy and assignment
  VectorArray(const VectorArray &);
  VectorArray &operator=(const VectorArray &);
};

} // namespace EIM

#endif /* EIM_VECTORARRAY_HPP */
