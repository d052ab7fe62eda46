#ifndef PACKAGES_VSFIELD_CPP_INCLUDE_VSFIELD_CORE_ERRORS_HPP_
#define PACKAGES_VSFIELD_CPP_INCLUDE_VSFIELD_CORE_ERRORS_HPP_

#include <stdexcept>
#include <string>

#include "core/types.hpp"

namespace vsfield {

class FieldError : public std::runtime_error {
public:
  explicit FieldError(const std::string& message) : std::runtime_error(message) {}
};

// A timed request arrived before the attention clock was free. Resubmit at or after clock_time().
class AttentionBusyError : public FieldError {
public:
  AttentionBusyError(Tick requested_time, Tick clock_time)
      : FieldError("Attention is busy until " + std::to_string(clock_time) + ", request made at " +
                   std::to_string(requested_time)),
        _requested_time(requested_time),
        _clock_time(clock_time) {}

  Tick requested_time() const {
    return _requested_time;
  }

  Tick clock_time() const {
    return _clock_time;
  }

private:
  Tick _requested_time;
  Tick _clock_time;
};

class DuplicateObjectError : public FieldError {
public:
  explicit DuplicateObjectError(const std::string& identifier)
      : FieldError("Object identifier '" + identifier + "' occupies more than one square"), _identifier(identifier) {}

  const std::string& identifier() const {
    return _identifier;
  }

private:
  std::string _identifier;
};

class IllegalMoveError : public FieldError {
public:
  explicit IllegalMoveError(const std::string& message) : FieldError(message) {}
};

class ConstructionError : public FieldError {
public:
  explicit ConstructionError(const std::string& message) : FieldError(message) {}
};

}  // namespace vsfield

#endif  // PACKAGES_VSFIELD_CPP_INCLUDE_VSFIELD_CORE_ERRORS_HPP_
