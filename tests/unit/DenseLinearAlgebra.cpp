//*****************************************************************//
//    Albany 3.0:  Copyright 2016 Sandia Corporation               //
//    This Software is released under the BSD license detailed     //
//    in the file "license.txt" in the top-level Albany directory  //
//*****************************************************************//

#include "EIM_DenseLinearAlgebra.hpp"
#include "EIM_Exceptions.hpp"

#include <Teuchos_UnitTestHarness.hpp>

#include <cmath>

namespace EIM
{

TEUCHOS_UNIT_TEST(DenseLinearAlgebra, Transpose)
{
  Epetra_SerialDenseMatrix a = denseMatrix(2, 3);
  a(0, 2) = 5.0;
  a(1, 0) = -1.0;

  const Epetra_SerialDenseMatrix t = transpose(a);
  TEST_EQUALITY(t.M(), 3);
  TEST_EQUALITY(t.N(), 2);
  TEST_EQUALITY(t(2, 0), 5.0);
  TEST_EQUALITY(t(0, 1), -1.0);
}

TEUCHOS_UNIT_TEST(DenseLinearAlgebra, UnitLowerTriangularSolve)
{
  Epetra_SerialDenseMatrix lower = denseMatrix(2, 2);
  lower(0, 0) = 7.0; // Not read
  lower(1, 0) = 2.0;
  lower(1, 1) = 7.0; // Not read
  lower(0, 1) = 9.0; // Not read

  Epetra_SerialDenseMatrix rhs = denseMatrix(2, 1);
  rhs(0, 0) = 1.0;
  rhs(1, 0) = 4.0;

  solveUnitLowerTriangular(lower, rhs);
  TEST_EQUALITY(rhs(0, 0), 1.0);
  TEST_EQUALITY(rhs(1, 0), 2.0);

  Epetra_SerialDenseMatrix wrongSize = denseMatrix(3, 1);
  TEST_THROW(solveUnitLowerTriangular(lower, wrongSize), DimensionError);
}

TEUCHOS_UNIT_TEST(DenseLinearAlgebra, Cholesky)
{
  Epetra_SerialDenseMatrix spd = denseMatrix(2, 2);
  spd(0, 0) = 4.0;
  spd(0, 1) = 2.0;
  spd(1, 0) = 2.0;
  spd(1, 1) = 3.0;

  const Epetra_SerialDenseMatrix factor = choleskyFactor(spd);
  TEST_FLOATING_EQUALITY(factor(0, 0), 2.0, 1.0e-14);
  TEST_FLOATING_EQUALITY(factor(1, 0), 1.0, 1.0e-14);
  TEST_FLOATING_EQUALITY(factor(1, 1), std::sqrt(2.0), 1.0e-14);
  TEST_EQUALITY(factor(0, 1), 0.0);

  Epetra_SerialDenseMatrix rhs = denseMatrix(2, 1);
  rhs(0, 0) = 6.0;
  rhs(1, 0) = 5.0;
  choleskySolve(factor, rhs);
  TEST_FLOATING_EQUALITY(rhs(0, 0), 1.0, 1.0e-14);
  TEST_FLOATING_EQUALITY(rhs(1, 0), 1.0, 1.0e-14);
}

TEUCHOS_UNIT_TEST(DenseLinearAlgebra, CholeskyRequiresPositiveDefinite)
{
  Epetra_SerialDenseMatrix indefinite = denseMatrix(2, 2);
  indefinite(0, 0) = 1.0;
  indefinite(0, 1) = 2.0;
  indefinite(1, 0) = 2.0;
  indefinite(1, 1) = 1.0;

  TEST_THROW(choleskyFactor(indefinite), NumericalError);
}

TEUCHOS_UNIT_TEST(DenseLinearAlgebra, GeneralSolve)
{
  Epetra_SerialDenseMatrix permutation = denseMatrix(2, 2);
  permutation(0, 1) = 1.0;
  permutation(1, 0) = 1.0;

  Epetra_SerialDenseMatrix rhs = denseMatrix(2, 1);
  rhs(0, 0) = 2.0;
  rhs(1, 0) = 3.0;
  solve(permutation, rhs);
  TEST_FLOATING_EQUALITY(rhs(0, 0), 3.0, 1.0e-14);
  TEST_FLOATING_EQUALITY(rhs(1, 0), 2.0, 1.0e-14);
  TEST_EQUALITY(permutation(0, 1), 1.0);

  Epetra_SerialDenseMatrix singular = denseMatrix(2, 2);
  singular(0, 0) = 1.0;
  singular(0, 1) = 1.0;
  singular(1, 0) = 1.0;
  singular(1, 1) = 1.0;
  TEST_THROW(solve(singular, rhs), NumericalError);
}

TEUCHOS_UNIT_TEST(DenseLinearAlgebra, SymmetricEigen)
{
  Epetra_SerialDenseMatrix a = denseMatrix(2, 2);
  a(0, 0) = 2.0;
  a(0, 1) = 1.0;
  a(1, 0) = 1.0;
  a(1, 1) = 2.0;

  Teuchos::Array<double> eigenvalues;
  symmetricEigen(a, eigenvalues);
  TEST_EQUALITY(eigenvalues.size(), 2);
  TEST_FLOATING_EQUALITY(eigenvalues[0], 1.0, 1.0e-14);
  TEST_FLOATING_EQUALITY(eigenvalues[1], 3.0, 1.0e-14);

  // Eigenvector of 3 is (1, 1) / sqrt(2), up to sign
  TEST_FLOATING_EQUALITY(std::abs(a(0, 1)), 1.0 / std::sqrt(2.0), 1.0e-14);
  TEST_FLOATING_EQUALITY(a(0, 1), a(1, 1), 1.0e-14);
}

TEUCHOS_UNIT_TEST(DenseLinearAlgebra, Triangularity)
{
  Epetra_SerialDenseMatrix a = denseMatrix(2, 2);
  a(0, 0) = 1.0;
  a(1, 0) = 8.0;
  a(1, 1) = 1.0;
  TEST_EQUALITY(strictUpperMaxAbs(a), 0.0);

  a(0, 1) = -5.0;
  TEST_EQUALITY(strictUpperMaxAbs(a), 5.0);
}

} // namespace EIM
