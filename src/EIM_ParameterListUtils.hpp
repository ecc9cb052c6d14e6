//*****************************************************************//
//    Albany 3.0:  Copyright 2016 Sandia Corporation               //
//    This Software is released under the BSD license detailed     //
//    in the file "license.txt" in the top-level Albany directory  //
//*****************************************************************//
#ifndef EIM_PARAMETERLISTUTILS_HPP
#define EIM_PARAMETERLISTUTILS_HPP

#include "Teuchos_ParameterList.hpp"

#include <string>

namespace EIM {

// Checks names and types of the top-level entries of params against validParams.
// Teuchos validation failures are reported as ConfigurationError.
void validateParameters(
    const Teuchos::ParameterList &params,
    const Teuchos::ParameterList &validParams,
    const std::string &context);

// Value of an optional entry, or defaultValue when absent (params is left untouched)
template <typename T>
T getOptional(const Teuchos::ParameterList &params, const std::string &name, const T &defaultValue)
{
  return params.isParameter(name) ? params.get<T>(name) : defaultValue;
}

} // namespace EIM

#endif /* EIM_PARAMETERLISTUTILS_HPP */
