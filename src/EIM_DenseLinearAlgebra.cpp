//*****************************************************************//
//    Albany 3.0:  Copyright 2016 Sandia Corporation               //
//    This Software is released under the BSD license detailed     //
//    in the file "license.txt" in the top-level Albany directory  //
//*****************************************************************//

#include "EIM_DenseLinearAlgebra.hpp"

#include "EIM_Exceptions.hpp"

#include "Epetra_BLAS.h"
#include "Epetra_LAPACK.h"
#include "Epetra_SerialDenseSolver.h"

#include "Teuchos_Assert.hpp"
#include "Teuchos_TestForException.hpp"

#include <algorithm>
#include <cmath>

namespace EIM {

Epetra_SerialDenseMatrix denseMatrix(int rows, int cols)
{
  Epetra_SerialDenseMatrix result;
  const int ierr = result.Shape(rows, cols);
  TEUCHOS_ASSERT(ierr == 0);
  return result;
}

Epetra_SerialDenseMatrix transpose(const Epetra_SerialDenseMatrix &a)
{
  Epetra_SerialDenseMatrix result = denseMatrix(a.N(), a.M());
  for (int j = 0; j < a.N(); ++j) {
    for (int i = 0; i < a.M(); ++i) {
      result(j, i) = a(i, j);
    }
  }
  return result;
}

void solveUnitLowerTriangular(const Epetra_SerialDenseMatrix &lower, Epetra_SerialDenseMatrix &rhs)
{
  TEUCHOS_TEST_FOR_EXCEPTION(
      lower.M() != lower.N() || lower.N() != rhs.M(),
      DimensionError,
      "Triangular system of order " << lower.M() << "x" << lower.N() <<
      " does not match right-hand side with " << rhs.M() << " rows");

  if (lower.N() == 0 || rhs.N() == 0) {
    return;
  }

  const Epetra_BLAS blas;
  blas.TRSM('L', 'L', 'N', 'U', rhs.M(), rhs.N(), 1.0, lower.A(), lower.LDA(), rhs.A(), rhs.LDA());
}

Epetra_SerialDenseMatrix choleskyFactor(const Epetra_SerialDenseMatrix &spd)
{
  TEUCHOS_TEST_FOR_EXCEPTION(
      spd.M() != spd.N(),
      DimensionError,
      "Cannot factor non-square matrix of order " << spd.M() << "x" << spd.N());

  Epetra_SerialDenseMatrix result(spd);
  const int n = result.N();
  if (n == 0) {
    return result;
  }

  const Epetra_LAPACK lapack;
  int info = 0;
  lapack.POTRF('L', n, result.A(), result.LDA(), &info);
  TEUCHOS_ASSERT(info >= 0);
  TEUCHOS_TEST_FOR_EXCEPTION(
      info > 0,
      NumericalError,
      "Cholesky factorization failed: the leading minor of order " << info <<
      " of the " << n << "x" << n << " Gramian is not positive definite");

  // Clear the untouched upper part
  for (int j = 1; j < n; ++j) {
    for (int i = 0; i < j; ++i) {
      result(i, j) = 0.0;
    }
  }
  return result;
}

void choleskySolve(const Epetra_SerialDenseMatrix &factor, Epetra_SerialDenseMatrix &rhs)
{
  TEUCHOS_TEST_FOR_EXCEPTION(
      factor.N() != rhs.M(),
      DimensionError,
      "Cholesky factor of order " << factor.N() <<
      " does not match right-hand side with " << rhs.M() << " rows");

  if (factor.N() == 0 || rhs.N() == 0) {
    return;
  }

  const Epetra_LAPACK lapack;
  int info = 0;
  lapack.POTRS('L', factor.N(), rhs.N(), factor.A(), factor.LDA(), rhs.A(), rhs.LDA(), &info);
  TEUCHOS_ASSERT(info == 0);
}

void solve(const Epetra_SerialDenseMatrix &matrix, Epetra_SerialDenseMatrix &rhs)
{
  TEUCHOS_TEST_FOR_EXCEPTION(
      matrix.M() != matrix.N() || matrix.N() != rhs.M(),
      DimensionError,
      "Linear system of order " << matrix.M() << "x" << matrix.N() <<
      " does not match right-hand side with " << rhs.M() << " rows");

  if (matrix.N() == 0 || rhs.N() == 0) {
    return;
  }

  // The solver factors in place
  Epetra_SerialDenseMatrix lu(matrix);
  Epetra_SerialDenseMatrix solution = denseMatrix(rhs.M(), rhs.N());

  Epetra_SerialDenseSolver solver;
  {
    const int ierr = solver.SetMatrix(lu);
    TEUCHOS_ASSERT(ierr == 0);
  }
  {
    const int ierr = solver.SetVectors(solution, rhs);
    TEUCHOS_ASSERT(ierr == 0);
  }
  {
    const int ierr = solver.Solve();
    TEUCHOS_TEST_FOR_EXCEPTION(
        ierr != 0,
        NumericalError,
        "LU solve of the " << matrix.N() << "x" << matrix.N() <<
        " interpolation matrix failed with error code " << ierr);
  }

  rhs = solution;
}

void symmetricEigen(Epetra_SerialDenseMatrix &a, Teuchos::Array<double> &eigenvalues)
{
  TEUCHOS_TEST_FOR_EXCEPTION(
      a.M() != a.N(),
      DimensionError,
      "Cannot diagonalize non-square matrix of order " << a.M() << "x" << a.N());

  const int n = a.N();
  eigenvalues.assign(n, 0.0);
  if (n == 0) {
    return;
  }

  const int lwork = std::max(1, 3 * n);
  Teuchos::Array<double> work(lwork);

  const Epetra_LAPACK lapack;
  int info = 0;
  lapack.SYEV('V', 'U', n, a.A(), a.LDA(), eigenvalues.getRawPtr(), work.getRawPtr(), lwork, &info);
  TEUCHOS_ASSERT(info >= 0);
  TEUCHOS_TEST_FOR_EXCEPTION(
      info > 0,
      NumericalError,
      "Symmetric eigensolver did not converge (" << info << " off-diagonal elements remaining)");
}

double strictUpperMaxAbs(const Epetra_SerialDenseMatrix &a)
{
  double result = 0.0;
  for (int j = 1; j < a.N(); ++j) {
    for (int i = 0; i < std::min(j, a.M()); ++i) {
      result = std::max(result, std::abs(a(i, j)));
    }
  }
  return result;
}

} // namespace EIM
