//*****************************************************************//
//    Albany 3.0:  Copyright 2016 Sandia Corporation               //
//    This Software is released under the BSD license detailed     //
//    in the file "license.txt" in the top-level Albany directory  //
//*****************************************************************//

#include "EIM_POD.hpp"

#include "EIM_DenseLinearAlgebra.hpp"
#include "EIM_ParameterListUtils.hpp"
#include "EIM_Exceptions.hpp"

#include "Teuchos_VerboseObject.hpp"
#include "Teuchos_TestForException.hpp"

#include <algorithm>
#include <numeric>
#include <cmath>

namespace EIM {

Teuchos::RCP<const Teuchos::ParameterList>
getValidPODParameters()
{
  const Teuchos::RCP<Teuchos::ParameterList> result = Teuchos::rcp(new Teuchos::ParameterList("Valid POD Params"));
  result->set("Relative Tolerance", 4.0e-8, "Relative singular value threshold");
  result->set("Absolute Tolerance", 0.0, "Absolute singular value threshold");
  result->set("Orthonormalize", true, "Re-orthonormalize the modes by Gram-Schmidt");
  return result;
}

namespace Detail {

const double gramSchmidtAbsoluteTolerance = 1.0e-13;
const double gramSchmidtRelativeTolerance = 1.0e-13;
const double gramSchmidtReiterationThreshold = 1.0e-1;

double norm(const Teuchos::RCP<const InnerProduct> &product, const VectorArray &v)
{
  return std::sqrt(std::max(pairwiseInnerProducts(product, v, v)[0], 0.0));
}

} // namespace Detail

Teuchos::Array<int> gramSchmidt(VectorArray &vectors, const Teuchos::RCP<const InnerProduct> &product)
{
  const Teuchos::RCP<VectorArray> orthonormalized = vectors.emptyLike();
  Teuchos::Array<int> result;

  for (int i = 0; i < vectors.size(); ++i) {
    const int index[] = { i };
    const Teuchos::RCP<VectorArray> v = vectors.copy(Teuchos::ArrayView<const int>(index, 1));

    const double initialNorm = Detail::norm(product, *v);
    if (initialNorm < Detail::gramSchmidtAbsoluteTolerance) {
      continue;
    }
    v->scale(1.0 / initialNorm);

    double currentNorm = 1.0;
    bool reiterate = true;
    while (reiterate) {
      for (int j = 0; j < orthonormalized->size(); ++j) {
        const int otherIndex[] = { j };
        const Teuchos::RCP<VectorArray> u = orthonormalized->copy(Teuchos::ArrayView<const int>(otherIndex, 1));
        const double projection = pairwiseInnerProducts(product, *u, *v)[0];
        v->axpy(-projection, *u);
      }

      const double oldNorm = currentNorm;
      currentNorm = Detail::norm(product, *v);
      reiterate = (currentNorm < Detail::gramSchmidtReiterationThreshold * oldNorm) &&
                  (currentNorm >= Detail::gramSchmidtRelativeTolerance);
      if (currentNorm < Detail::gramSchmidtRelativeTolerance) {
        break;
      }
      v->scale(1.0 / currentNorm);
      currentNorm = 1.0;
    }

    if (currentNorm < Detail::gramSchmidtRelativeTolerance) {
      continue;
    }

    orthonormalized->absorb(*v);
    result.push_back(i);
  }

  vectors.clear();
  vectors.absorb(*orthonormalized);
  return result;
}

Teuchos::Array<double> discardedEnergyFractions(const Teuchos::ArrayView<const double> &singularValues)
{
  const int count = singularValues.size();
  Teuchos::Array<double> result(count, 0.0);
  if (count == 0) {
    return result;
  }

  // Tail sums of squares
  Teuchos::Array<double> remaining(count + 1, 0.0);
  for (int i = count - 1; i >= 0; --i) {
    remaining[i] = remaining[i + 1] + singularValues[i] * singularValues[i];
  }

  const double total = remaining[0];
  if (total > 0.0) {
    for (int i = 0; i < count; ++i) {
      result[i] = std::sqrt(remaining[i + 1] / total);
    }
  }
  return result;
}

PODResult pod(
    const VectorArray &snapshots,
    int modeCount,
    const Teuchos::ParameterList &params,
    const Teuchos::RCP<const InnerProduct> &product)
{
  validateParameters(params, *getValidPODParameters(), "POD");
  TEUCHOS_TEST_FOR_EXCEPTION(
      modeCount == 0 || modeCount < -1,
      ConfigurationError,
      "Invalid number of POD modes " << modeCount << " (expected a positive value or -1 for all)");
  TEUCHOS_TEST_FOR_EXCEPTION(
      snapshots.empty(),
      DimensionError,
      "Cannot compute the POD of an empty set of snapshots");

  const double relativeTolerance = getOptional(params, "Relative Tolerance", 4.0e-8);
  const double absoluteTolerance = getOptional(params, "Absolute Tolerance", 0.0);
  const bool orthonormalize = getOptional(params, "Orthonormalize", true);

  // Method of snapshots: eigenvectors of the snapshot Gramian
  Epetra_SerialDenseMatrix eigenvectors = innerProducts(product, snapshots, snapshots);
  Teuchos::Array<double> eigenvalues;
  symmetricEigen(eigenvectors, eigenvalues);

  const int snapshotCount = snapshots.size();
  const double largestEigenvalue = eigenvalues.back();
  const double threshold = std::max(
      relativeTolerance * relativeTolerance * largestEigenvalue,
      absoluteTolerance * absoluteTolerance);

  // Eigenvalues come in ascending order
  Teuchos::Array<int> selected;
  for (int i = snapshotCount - 1; i >= 0; --i) {
    if (modeCount != -1 && selected.size() >= modeCount) {
      break;
    }
    if (eigenvalues[i] <= threshold) {
      break;
    }
    selected.push_back(i);
  }

  PODResult result;
  const int selectedCount = selected.size();
  Epetra_SerialDenseMatrix coefficients = denseMatrix(snapshotCount, selectedCount);
  for (int j = 0; j < selectedCount; ++j) {
    const double singularValue = std::sqrt(eigenvalues[selected[j]]);
    result.singularValues.push_back(singularValue);
    for (int i = 0; i < snapshotCount; ++i) {
      coefficients(i, j) = eigenvectors(i, selected[j]) / singularValue;
    }
  }
  result.modes = (selectedCount > 0) ? snapshots.lincomb(coefficients) : snapshots.emptyLike();

  if (orthonormalize && selectedCount > 0) {
    const Teuchos::Array<int> kept = gramSchmidt(*result.modes, product);
    Teuchos::Array<double> keptSingularValues;
    for (int i = 0; i < kept.size(); ++i) {
      keptSingularValues.push_back(result.singularValues[kept[i]]);
    }
    result.singularValues = keptSingularValues;
  }

  const Teuchos::RCP<Teuchos::FancyOStream> out = Teuchos::VerboseObjectBase::getDefaultOStream();
  *out << "Computed " << result.modes->size() << " POD modes from " << snapshotCount << " snapshots\n";
  {
    Teuchos::OSTab tab(out);
    *out << "Singular values: " << result.singularValues << "\n";
    *out << "Discarded energy fractions: " << discardedEnergyFractions(result.singularValues()) << "\n";
  }

  return result;
}

} // namespace EIM
