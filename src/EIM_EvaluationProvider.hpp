//*****************************************************************//
//    Albany 3.0:  Copyright 2016 Sandia Corporation               //
//    This Software is released under the BSD license detailed     //
//    in the file "license.txt" in the top-level Albany directory  //
//*****************************************************************//
#ifndef EIM_EVALUATIONPROVIDER_HPP
#define EIM_EVALUATIONPROVIDER_HPP

#include "EIM_EvaluationSet.hpp"
#include "EIM_Discretization.hpp"
#include "EIM_CacheRegion.hpp"

#include "Teuchos_RCP.hpp"
#include "Teuchos_Array.hpp"
#include "Teuchos_ArrayView.hpp"

#include <string>

namespace EIM {

// Lazy evaluation set over a parameter sample: batch i holds the evaluations of
// every operator at the solution for the i-th parameter, concatenated in order.
// Batches are computed on first access and stored in the cache region, if any.
// The entries of a provider leave the cache region with the provider.
class EvaluationProvider : public EvaluationSet {
public:
  EvaluationProvider(
      const Teuchos::RCP<const Discretization> &discretization,
      const Teuchos::ArrayView<const Teuchos::RCP<const Operator> > &operators,
      const Teuchos::ArrayView<const Parameter> &sample,
      const Teuchos::RCP<CacheRegion> &cacheRegion);

  virtual ~EvaluationProvider();

  // Unique among all providers of the process
  const std::string &identity() const { return identity_; }

  virtual int size() const;
  virtual Teuchos::RCP<const VectorArray> at(int i);

private:
  std::string identity_;
  Teuchos::RCP<const Discretization> discretization_;
  Teuchos::Array<Teuchos::RCP<const Operator> > operators_;
  Teuchos::Array<Parameter> sample_;
  Teuchos::RCP<CacheRegion> cacheRegion_;

  Teuchos::RCP<const VectorArray> compute(int i) const;

  // Disallow copy and assignment
  EvaluationProvider(const EvaluationProvider &);
  EvaluationProvider &operator=(const EvaluationProvider &);
};

} // namespace EIM

#endif /* EIM_EVALUATIONPROVIDER_HPP */
