//*****************************************************************//
//    Albany 3.0:  Copyright 2016 Sandia Corporation               //
//    This Software is released under the BSD license detailed     //
//    in the file "license.txt" in the top-level Albany directory  //
//*****************************************************************//
#ifndef EIM_EXCEPTIONS_HPP
#define EIM_EXCEPTIONS_HPP

#include <stdexcept>
#include <string>

namespace EIM {

// Invalid option or meaningless combination of options
class ConfigurationError : public std::invalid_argument
{
public:
  explicit ConfigurationError(const std::string &what_arg) :
    std::invalid_argument(what_arg) {}
};

// Empty input or vectors of inconsistent type or dimension
class DimensionError : public std::invalid_argument
{
public:
  explicit DimensionError(const std::string &what_arg) :
    std::invalid_argument(what_arg) {}
};

// Failed factorization or non-finite quantity
class NumericalError : public std::runtime_error
{
public:
  explicit NumericalError(const std::string &what_arg) :
    std::runtime_error(what_arg) {}
};

} // namespace EIM

#endif /* EIM_EXCEPTIONS_HPP */
