//*****************************************************************//
//    Albany 3.0:  Copyright 2016 Sandia Corporation               //
//    This Software is released under the BSD license detailed     //
//    in the file "license.txt" in the top-level Albany directory  //
//*****************************************************************//
#ifndef EIM_ERRORNORM_HPP
#define EIM_ERRORNORM_HPP

#include "EIM_VectorArray.hpp"
#include "EIM_InnerProduct.hpp"

#include "Teuchos_RCP.hpp"
#include "Teuchos_Array.hpp"

namespace EIM {

// Norm in which interpolation errors are measured, one value per vector
class ErrorNorm {
public:
  virtual Teuchos::Array<double> operator()(const VectorArray &errors) const = 0;
  virtual ~ErrorNorm() {}
};

// Norm sqrt((v, v)) induced by an inner product
class InducedNorm : public ErrorNorm {
public:
  explicit InducedNorm(const Teuchos::RCP<const InnerProduct> &product);

  virtual Teuchos::Array<double> operator()(const VectorArray &errors) const;

private:
  Teuchos::RCP<const InnerProduct> product_;
};

// Applies norm, or the Euclidean norm when norm is null
Teuchos::Array<double> errorNorms(const Teuchos::RCP<const ErrorNorm> &norm, const VectorArray &errors);

} // namespace EIM

#endif /* EIM_ERRORNORM_HPP */
