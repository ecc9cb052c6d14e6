//*****************************************************************//
//    Albany 3.0:  Copyright 2016 Sandia Corporation               //
//    This Software is released under the BSD license detailed     //
//    in the file "license.txt" in the top-level Albany directory  //
//*****************************************************************//

#include "EIM_ParameterListUtils.hpp"

#include "EIM_Exceptions.hpp"

#include "Teuchos_ParameterListExceptions.hpp"
#include "Teuchos_TestForException.hpp"

namespace EIM {

void validateParameters(
    const Teuchos::ParameterList &params,
    const Teuchos::ParameterList &validParams,
    const std::string &context)
{
  try {
    params.validateParameters(validParams, 0);
  } catch (const Teuchos::Exceptions::InvalidParameter &e) {
    TEUCHOS_TEST_FOR_EXCEPTION(
        true,
        ConfigurationError,
        "Invalid " << context << " parameters:\n" << e.what());
  }
}

} // namespace EIM
