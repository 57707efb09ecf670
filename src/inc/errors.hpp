#pragma once

#include <stdexcept>

namespace gopt {

class error : public std::logic_error {
public:
  using std::logic_error::logic_error;
};

// invalid combination of optimizer settings, alphabet or genome data
class configuration_error : public error {
public:
  using error::error;
};

// negative or NaN fitness reported for a genotype
class invalid_fitness : public error {
public:
  using error::error;
};

// genotype cannot be interpreted by the generic decoder
class unsupported_encoding : public error {
public:
  using error::error;
};

} // namespace gopt
