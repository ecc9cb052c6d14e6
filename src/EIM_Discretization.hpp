//*****************************************************************//
//    Albany 3.0:  Copyright 2016 Sandia Corporation               //
//    This Software is released under the BSD license detailed     //
//    in the file "license.txt" in the top-level Albany directory  //
//*****************************************************************//
#ifndef EIM_DISCRETIZATION_HPP
#define EIM_DISCRETIZATION_HPP

#include "EIM_VectorArray.hpp"

#include "Teuchos_RCP.hpp"
#include "Teuchos_ParameterList.hpp"

#include <string>
#include <map>

namespace EIM {

// Named parameter values
typedef Teuchos::ParameterList Parameter;

class Operator {
public:
  virtual int dimSource() const = 0;
  virtual int dimRange() const = 0;

  // One result vector per vector of U
  virtual Teuchos::RCP<VectorArray> apply(const VectorArray &U, const Parameter &mu) const = 0;

  virtual ~Operator() {}
};

typedef std::map<std::string, Teuchos::RCP<const Operator> > OperatorMap;

// Full-order model providing solutions and the operators evaluated on them
class Discretization {
public:
  virtual std::string name() const = 0;

  virtual Teuchos::RCP<VectorArray> solve(const Parameter &mu) const = 0;

  virtual OperatorMap operators() const = 0;

  // Copy of this discretization where the given operators replace those of the same name
  virtual Teuchos::RCP<Discretization> withOperators(const OperatorMap &replacements, const std::string &name) const = 0;

  virtual ~Discretization() {}
};

} // namespace EIM

#endif /* EIM_DISCRETIZATION_HPP */
