//*****************************************************************//
//    Albany 3.0:  Copyright 2016 Sandia Corporation               //
//    This Software is released under the BSD license detailed     //
//    in the file "license.txt" in the top-level Albany directory  //
//*****************************************************************//

#include "EIM_EpetraVectorArray.hpp"

#include "EIM_DenseLinearAlgebra.hpp"
#include "EIM_Exceptions.hpp"

#include "Epetra_BlockMap.h"
#include "Epetra_LocalMap.h"
#include "Epetra_Comm.h"

#include "Teuchos_Assert.hpp"
#include "Teuchos_TestForException.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace EIM {

namespace Detail {

Epetra_Map pointMap(const Epetra_BlockMap &in)
{
  TEUCHOS_TEST_FOR_EXCEPTION(
      !(in.ConstantElementSize() && in.ElementSize() == 1),
      DimensionError,
      "Vector arrays require a point map");
  return static_cast<const Epetra_Map &>(in);
}

void checkGlobalIds(const Epetra_Map &map)
{
  TEUCHOS_TEST_FOR_EXCEPTION(
      map.NumGlobalElements() > 0 &&
      (map.MinAllGID() != 0 || map.MaxAllGID() != map.NumGlobalElements() - 1),
      DimensionError,
      "Vector arrays require global ids covering [0, " << map.NumGlobalElements() << ")");
}

void checkIndices(const Teuchos::ArrayView<const int> &indices, int size)
{
  for (Teuchos::ArrayView<const int>::const_iterator it = indices.begin(); it != indices.end(); ++it) {
    TEUCHOS_TEST_FOR_EXCEPTION(
        *it < 0 || *it >= size,
        std::out_of_range,
        "Vector index " << *it << " is out of range [0, " << size << ")");
  }
}

} // namespace Detail

EpetraVectorArray::EpetraVectorArray(const Epetra_Map &map) :
  map_(map),
  vectors_()
{
  Detail::checkGlobalIds(map_);
}

EpetraVectorArray::EpetraVectorArray(const Teuchos::RCP<Epetra_MultiVector> &vectors) :
  map_(Detail::pointMap(vectors->Map())),
  vectors_(vectors)
{
  Detail::checkGlobalIds(map_);
}

EpetraVectorArray::EpetraVectorArray(const Epetra_Map &map, const Teuchos::RCP<Epetra_MultiVector> &vectors) :
  map_(map),
  vectors_(vectors)
{
  // Nothing to do
}

int
EpetraVectorArray::dim() const
{
  return map_.NumGlobalElements();
}

int
EpetraVectorArray::size() const
{
  return Teuchos::nonnull(vectors_) ? vectors_->NumVectors() : 0;
}

bool
EpetraVectorArray::sameSpace(const VectorArray &other) const
{
  const EpetraVectorArray *otherArray = dynamic_cast<const EpetraVectorArray *>(&other);
  return (otherArray != NULL) && map_.SameAs(otherArray->map_);
}

const EpetraVectorArray &
EpetraVectorArray::sameSpaceCast(const VectorArray &other) const
{
  TEUCHOS_TEST_FOR_EXCEPTION(
      !this->sameSpace(other),
      DimensionError,
      "Vector arrays do not belong to the same space (dim " << this->dim() << " vs " << other.dim() << ")");
  return static_cast<const EpetraVectorArray &>(other);
}

Teuchos::RCP<VectorArray>
EpetraVectorArray::emptyLike() const
{
  return Teuchos::rcp(new EpetraVectorArray(map_, Teuchos::null));
}

Teuchos::RCP<VectorArray>
EpetraVectorArray::copy() const
{
  Teuchos::RCP<Epetra_MultiVector> duplicate;
  if (Teuchos::nonnull(vectors_)) {
    duplicate = Teuchos::rcp(new Epetra_MultiVector(*vectors_));
  }
  return Teuchos::rcp(new EpetraVectorArray(map_, duplicate));
}

Teuchos::RCP<VectorArray>
EpetraVectorArray::copy(const Teuchos::ArrayView<const int> &indices) const
{
  Detail::checkIndices(indices, this->size());

  Teuchos::RCP<Epetra_MultiVector> selection;
  if (!indices.empty()) {
    Teuchos::Array<int> selectedIndices(indices);
    selection = Teuchos::rcp(new Epetra_MultiVector(Copy, *vectors_, selectedIndices.getRawPtr(), selectedIndices.size()));
  }
  return Teuchos::rcp(new EpetraVectorArray(map_, selection));
}

void
EpetraVectorArray::append(const VectorArray &other)
{
  const EpetraVectorArray &source = this->sameSpaceCast(other);
  if (source.empty()) {
    return;
  }

  if (this->empty()) {
    vectors_ = Teuchos::rcp(new Epetra_MultiVector(*source.vectors_));
    return;
  }

  const int oldCount = this->size();
  const int addedCount = source.size();
  const Teuchos::RCP<Epetra_MultiVector> merged(
      new Epetra_MultiVector(map_, oldCount + addedCount, /*zeroOut =*/ false));
  {
    Epetra_MultiVector head(View, *merged, 0, oldCount);
    const int ierr = head.Update(1.0, *vectors_, 0.0);
    TEUCHOS_ASSERT(ierr == 0);
  }
  {
    Epetra_MultiVector tail(View, *merged, oldCount, addedCount);
    const int ierr = tail.Update(1.0, *source.vectors_, 0.0);
    TEUCHOS_ASSERT(ierr == 0);
  }
  vectors_ = merged;
}

void
EpetraVectorArray::remove(const Teuchos::ArrayView<const int> &indices)
{
  const int vectorCount = this->size();
  Detail::checkIndices(indices, vectorCount);

  Teuchos::Array<int> kept;
  for (int i = 0; i < vectorCount; ++i) {
    if (std::find(indices.begin(), indices.end(), i) == indices.end()) {
      kept.push_back(i);
    }
  }

  if (kept.empty()) {
    vectors_ = Teuchos::null;
  } else if (kept.size() < vectorCount) {
    vectors_ = Teuchos::rcp(new Epetra_MultiVector(Copy, *vectors_, kept.getRawPtr(), kept.size()));
  }
}

void
EpetraVectorArray::clear()
{
  vectors_ = Teuchos::null;
}

Epetra_SerialDenseMatrix
EpetraVectorArray::components(const Teuchos::ArrayView<const int> &dofs) const
{
  const int vectorCount = this->size();
  const int dofCount = dofs.size();
  Detail::checkIndices(dofs, this->dim());

  // Each dof is owned by exactly one process, the others contribute zeros
  Epetra_SerialDenseMatrix myValues = denseMatrix(vectorCount, dofCount);
  for (int j = 0; j < dofCount; ++j) {
    const int lid = map_.LID(dofs[j]);
    if (lid >= 0) {
      for (int i = 0; i < vectorCount; ++i) {
        myValues(i, j) = (*vectors_)[i][lid];
      }
    }
  }

  Epetra_SerialDenseMatrix result = denseMatrix(vectorCount, dofCount);
  if (vectorCount > 0 && dofCount > 0) {
    const int ierr = map_.Comm().SumAll(myValues.A(), result.A(), vectorCount * dofCount);
    TEUCHOS_ASSERT(ierr == 0);
  }
  return result;
}

Epetra_SerialDenseMatrix
EpetraVectorArray::dot(const VectorArray &other) const
{
  const EpetraVectorArray &right = this->sameSpaceCast(other);

  Epetra_SerialDenseMatrix result = denseMatrix(this->size(), right.size());
  if (this->empty() || right.empty()) {
    return result;
  }

  // products <- this^T * right, replicated on every process
  const Epetra_LocalMap productMap(this->size(), 0, map_.Comm());
  Epetra_MultiVector products(productMap, right.size(), /*zeroOut =*/ false);
  {
    const int ierr = products.Multiply('T', 'N', 1.0, *vectors_, *right.vectors_, 0.0);
    TEUCHOS_ASSERT(ierr == 0);
  }

  for (int j = 0; j < right.size(); ++j) {
    for (int i = 0; i < this->size(); ++i) {
      result(i, j) = products[j][i];
    }
  }
  return result;
}

Teuchos::Array<double>
EpetraVectorArray::pairwiseDot(const VectorArray &other) const
{
  const EpetraVectorArray &right = this->sameSpaceCast(other);
  TEUCHOS_TEST_FOR_EXCEPTION(
      this->size() != right.size(),
      DimensionError,
      "Pairwise products need arrays of equal length (" << this->size() << " vs " << right.size() << ")");

  Teuchos::Array<double> result(this->size(), 0.0);
  if (!this->empty()) {
    const int ierr = vectors_->Dot(*right.vectors_, result.getRawPtr());
    TEUCHOS_ASSERT(ierr == 0);
  }
  return result;
}

Teuchos::Array<double>
EpetraVectorArray::l2Norm() const
{
  Teuchos::Array<double> result(this->size(), 0.0);
  if (!this->empty()) {
    const int ierr = vectors_->Norm2(result.getRawPtr());
    TEUCHOS_ASSERT(ierr == 0);
  }
  return result;
}

void
EpetraVectorArray::amax(Teuchos::Array<int> &indices, Teuchos::Array<double> &values) const
{
  const int vectorCount = this->size();
  indices.assign(vectorCount, 0);
  values.assign(vectorCount, 0.0);
  if (vectorCount == 0) {
    return;
  }

  const int noIndex = std::numeric_limits<int>::max();
  const int myLength = vectors_->MyLength();

  // Local candidates: magnitude and global id of the first local maximum
  Teuchos::Array<double> myMagnitudes(vectorCount, -1.0);
  Teuchos::Array<int> myIndices(vectorCount, noIndex);
  for (int i = 0; i < vectorCount; ++i) {
    const double *entries = (*vectors_)[i];
    for (int lid = 0; lid < myLength; ++lid) {
      const double magnitude = std::abs(entries[lid]);
      const int gid = map_.GID(lid);
      if (magnitude > myMagnitudes[i] || (magnitude == myMagnitudes[i] && gid < myIndices[i])) {
        myMagnitudes[i] = magnitude;
        myIndices[i] = gid;
      }
    }
  }

  Teuchos::Array<double> magnitudes(vectorCount);
  {
    const int ierr = map_.Comm().MaxAll(myMagnitudes.getRawPtr(), magnitudes.getRawPtr(), vectorCount);
    TEUCHOS_ASSERT(ierr == 0);
  }

  // Ties between processes go to the smallest global id
  for (int i = 0; i < vectorCount; ++i) {
    if (myMagnitudes[i] != magnitudes[i]) {
      myIndices[i] = noIndex;
    }
  }
  {
    const int ierr = map_.Comm().MinAll(myIndices.getRawPtr(), indices.getRawPtr(), vectorCount);
    TEUCHOS_ASSERT(ierr == 0);
  }

  Teuchos::Array<double> myValues(vectorCount, 0.0);
  for (int i = 0; i < vectorCount; ++i) {
    const int lid = map_.LID(indices[i]);
    if (lid >= 0) {
      myValues[i] = (*vectors_)[i][lid];
    }
  }
  {
    const int ierr = map_.Comm().SumAll(myValues.getRawPtr(), values.getRawPtr(), vectorCount);
    TEUCHOS_ASSERT(ierr == 0);
  }
}

Teuchos::RCP<VectorArray>
EpetraVectorArray::lincomb(const Epetra_SerialDenseMatrix &coefficients) const
{
  TEUCHOS_TEST_FOR_EXCEPTION(
      coefficients.M() != this->size(),
      DimensionError,
      "Linear combination of " << this->size() << " vectors given " << coefficients.M() << " coefficients");

  const int resultCount = coefficients.N();
  Teuchos::RCP<Epetra_MultiVector> combination;
  if (resultCount > 0) {
    combination = Teuchos::rcp(new Epetra_MultiVector(map_, resultCount, /*zeroOut =*/ true));
    if (!this->empty()) {
      // combination <- vectors * coefficients
      const Epetra_LocalMap coefficientMap(this->size(), 0, map_.Comm());
      Epetra_SerialDenseMatrix buffer(coefficients);
      const Epetra_MultiVector coefficientVectors(Copy, coefficientMap, buffer.A(), buffer.LDA(), resultCount);
      const int ierr = combination->Multiply('N', 'N', 1.0, *vectors_, coefficientVectors, 0.0);
      TEUCHOS_ASSERT(ierr == 0);
    }
  }
  return Teuchos::rcp(new EpetraVectorArray(map_, combination));
}

void
EpetraVectorArray::scale(double alpha)
{
  if (Teuchos::nonnull(vectors_)) {
    const int ierr = vectors_->Scale(alpha);
    TEUCHOS_ASSERT(ierr == 0);
  }
}

void
EpetraVectorArray::axpy(double alpha, const VectorArray &x)
{
  const EpetraVectorArray &source = this->sameSpaceCast(x);
  TEUCHOS_TEST_FOR_EXCEPTION(
      this->size() != source.size(),
      DimensionError,
      "Cannot update " << this->size() << " vectors with " << source.size() << " vectors");

  if (!this->empty()) {
    const int ierr = vectors_->Update(alpha, *source.vectors_, 1.0);
    TEUCHOS_ASSERT(ierr == 0);
  }
}

} // namespace EIM
