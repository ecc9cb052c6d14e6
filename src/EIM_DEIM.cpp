//*****************************************************************//
//    Albany 3.0:  Copyright 2016 Sandia Corporation               //
//    This Software is released under the BSD license detailed     //
//    in the file "license.txt" in the top-level Albany directory  //
//*****************************************************************//

#include "EIM_DEIM.hpp"

#include "EIM_POD.hpp"
#include "EIM_DenseLinearAlgebra.hpp"
#include "EIM_ParameterListUtils.hpp"
#include "EIM_Exceptions.hpp"

#include "Teuchos_VerboseObject.hpp"
#include "Teuchos_TestForException.hpp"

#include <set>
#include <algorithm>

namespace EIM {

Teuchos::RCP<const Teuchos::ParameterList>
getValidDEIMParameters()
{
  const Teuchos::RCP<Teuchos::ParameterList> result = Teuchos::rcp(new Teuchos::ParameterList("Valid DEIM Params"));
  result->set("Modes", -1, "Number of POD modes to interpolate, -1 for all");
  result->sublist("POD", false, "Parameters of the proper orthogonal decomposition").setParameters(*getValidPODParameters());
  return result;
}

namespace Detail {

Teuchos::Array<int> range(int n)
{
  Teuchos::Array<int> result(n);
  for (int i = 0; i < n; ++i) {
    result[i] = i;
  }
  return result;
}

} // namespace Detail

InterpolationData deimFromBasis(
    const Teuchos::RCP<VectorArray> &basis,
    const Teuchos::RCP<const ErrorNorm> &errorNorm)
{
  TEUCHOS_TEST_FOR_EXCEPT(Teuchos::is_null(basis));

  const Teuchos::RCP<Teuchos::FancyOStream> out = Teuchos::VerboseObjectBase::getDefaultOStream();
  const int basisSize = basis->size();

  InterpolationData result;
  result.requestedBasisSize = basisSize;

  std::set<int> selectedDofs;
  result.status = BASIS_EXHAUSTED;
  for (int i = 0; i < basisSize; ++i) {
    const int index[] = { i };
    const Teuchos::RCP<VectorArray> residual = basis->copy(Teuchos::ArrayView<const int>(index, 1));

    if (i > 0) {
      const Teuchos::RCP<VectorArray> accepted = basis->copy(Detail::range(i)());
      const Epetra_SerialDenseMatrix interpolationMatrix = transpose(accepted->components(result.dofs()));
      Epetra_SerialDenseMatrix coefficients = transpose(residual->components(result.dofs()));
      solve(interpolationMatrix, coefficients);
      residual->subtract(*accepted->lincomb(coefficients));
    }

    const double error = errorNorms(errorNorm, *residual)[0];
    result.finalError = error;
    *out << "Interpolation error of mode " << i << ": " << error << "\n";

    Teuchos::Array<int> amaxIndices;
    Teuchos::Array<double> amaxValues;
    residual->amax(amaxIndices, amaxValues);
    const int newDof = amaxIndices[0];

    if (selectedDofs.count(newDof) > 0) {
      *out << "DOF " << newDof << " selected twice, discarding the remaining " << basisSize - i << " modes\n";
      result.status = DOF_COLLISION;
      break;
    }

    result.errors.push_back(error);
    selectedDofs.insert(newDof);
    result.dofs.push_back(newDof);
  }

  const int dofCount = result.dofs.size();
  if (dofCount < basisSize) {
    const Teuchos::Array<int> discarded = Detail::range(basisSize);
    basis->remove(discarded(dofCount, basisSize - dofCount));
  }
  result.basis = basis;
  result.truncated = (dofCount < result.requestedBasisSize);

  return result;
}

InterpolationData deim(
    const VectorArray &snapshots,
    const Teuchos::ParameterList &params,
    const Teuchos::RCP<const ErrorNorm> &errorNorm,
    const Teuchos::RCP<const InnerProduct> &product)
{
  validateParameters(params, *getValidDEIMParameters(), "DEIM");

  const int modeCount = getOptional(params, "Modes", -1);
  TEUCHOS_TEST_FOR_EXCEPTION(
      modeCount == 0 || modeCount < -1,
      ConfigurationError,
      "Invalid number of DEIM modes " << modeCount << " (expected a positive value or -1 for all)");

  const Teuchos::ParameterList podParams =
    params.isSublist("POD") ? params.sublist("POD") : Teuchos::ParameterList();

  const Teuchos::RCP<Teuchos::FancyOStream> out = Teuchos::VerboseObjectBase::getDefaultOStream();
  *out << "Generating interpolation data by DEIM\n";
  Teuchos::OSTab tab(out);

  const PODResult podResult = pod(snapshots, modeCount, podParams, product);

  InterpolationData result = deimFromBasis(podResult.modes, errorNorm);
  result.singularValues = podResult.singularValues;
  // All modes: at most one per snapshot and one per component
  result.requestedBasisSize = (modeCount == -1) ? std::min(snapshots.size(), snapshots.dim()) : modeCount;
  const int dofCount = result.dofs.size();
  result.truncated = (dofCount < result.requestedBasisSize);

  *out << "Selected " << dofCount << " interpolation DOFs out of " << result.requestedBasisSize <<
    " requested: " << toString(result.status) << "\n";

  return result;
}

} // namespace EIM
