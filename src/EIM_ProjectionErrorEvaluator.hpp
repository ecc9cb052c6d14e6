//*****************************************************************//
//    Albany 3.0:  Copyright 2016 Sandia Corporation               //
//    This Software is released under the BSD license detailed     //
//    in the file "license.txt" in the top-level Albany directory  //
//*****************************************************************//
#ifndef EIM_PROJECTIONERROREVALUATOR_HPP
#define EIM_PROJECTIONERROREVALUATOR_HPP

#include "EIM_VectorArray.hpp"
#include "EIM_EvaluationSet.hpp"
#include "EIM_InterpolationState.hpp"
#include "EIM_ErrorNorm.hpp"
#include "EIM_InnerProduct.hpp"

#include "Teuchos_RCP.hpp"

#include <string>

namespace EIM {

enum ProjectionType {
  ORTHOGONAL_PROJECTION,
  EI_PROJECTION
};

// "Orthogonal" or "EI", throws ConfigurationError otherwise
ProjectionType projectionTypeFromString(const std::string &token);
std::string toString(ProjectionType type);

struct ProjectionErrorResult {
  double maxError;
  // Proposed basis extension, a single vector owned by the caller
  Teuchos::RCP<VectorArray> candidate;
};

// Worst-case approximation error of a set of evaluations by the current
// interpolation data.
//
// With EI projection, or with an empty basis, the candidate is the residual of
// the worst approximated evaluation. With orthogonal projection the error is
// measured against the orthogonal projection onto the basis, while the
// candidate is the evaluation minus its interpolant.
class ProjectionErrorEvaluator {
public:
  ProjectionErrorEvaluator(
      ProjectionType type,
      const Teuchos::RCP<const ErrorNorm> &errorNorm,
      const Teuchos::RCP<const InnerProduct> &product);

  ProjectionType type() const { return type_; }

  ProjectionErrorResult evaluate(const InterpolationState &state, EvaluationSet &evaluations) const;

private:
  ProjectionType type_;
  Teuchos::RCP<const ErrorNorm> errorNorm_;
  Teuchos::RCP<const InnerProduct> product_;
};

} // namespace EIM

#endif /* EIM_PROJECTIONERROREVALUATOR_HPP */
