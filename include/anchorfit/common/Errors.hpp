#pragma once

#include <stdexcept>
#include <string>

namespace anchorfit::common {

class Error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// The data cannot support the requested computation (no usable boxes,
// degenerate clustering). Recoverable: callers may keep their current anchors.
class DataError : public Error {
public:
  using Error::Error;
};

// A setup mistake: bad dataset reference, malformed YAML, mismatched shapes.
class ConfigurationError : public Error {
public:
  using Error::Error;
};

}  // namespace anchorfit::common
