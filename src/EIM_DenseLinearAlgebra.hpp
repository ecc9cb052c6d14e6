//*****************************************************************//
//    Albany 3.0:  Copyright 2016 Sandia Corporation               //
//    This Software is released under the BSD license detailed     //
//    in the file "license.txt" in the top-level Albany directory  //
//*****************************************************************//
#ifndef EIM_DENSELINEARALGEBRA_HPP
#define EIM_DENSELINEARALGEBRA_HPP

#include "Epetra_SerialDenseMatrix.h"

#include "Teuchos_Array.hpp"

namespace EIM {

// Convenience functions for the small dense systems of the interpolation loops.
// Right-hand sides are overwritten by the solutions.

// Zero-initialized rows x cols matrix (either dimension may be zero)
Epetra_SerialDenseMatrix denseMatrix(int rows, int cols);

Epetra_SerialDenseMatrix transpose(const Epetra_SerialDenseMatrix &a);

// rhs <- lower^{-1} * rhs, assuming a unit diagonal (diagonal entries are not read)
void solveUnitLowerTriangular(const Epetra_SerialDenseMatrix &lower, Epetra_SerialDenseMatrix &rhs);

// Lower Cholesky factor of a symmetric positive definite matrix.
// Throws NumericalError when the matrix is not positive definite.
Epetra_SerialDenseMatrix choleskyFactor(const Epetra_SerialDenseMatrix &spd);

// rhs <- (factor * factor^T)^{-1} * rhs
void choleskySolve(const Epetra_SerialDenseMatrix &factor, Epetra_SerialDenseMatrix &rhs);

// rhs <- matrix^{-1} * rhs, by LU factorization with partial pivoting
void solve(const Epetra_SerialDenseMatrix &matrix, Epetra_SerialDenseMatrix &rhs);

// Eigenvalues in ascending order, a is overwritten by the orthonormal eigenvectors
void symmetricEigen(Epetra_SerialDenseMatrix &a, Teuchos::Array<double> &eigenvalues);

// max |a(i,j)| over i < j, i.e. the distance of a to its lower-triangular part
double strictUpperMaxAbs(const Epetra_SerialDenseMatrix &a);

} // namespace EIM

#endif /* EIM_DENSELINEARALGEBRA_HPP */
