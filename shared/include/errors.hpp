#pragma once

#include <stdexcept>
#include <string>

namespace sewerflow {

// Raised when a value violates an entity invariant (event ordering, history
// shape, sample grid spacing). The entity is left unmodified.
class ValidationError : public std::invalid_argument {
  public:
    explicit ValidationError(const std::string &what) : std::invalid_argument(what) {}
};

// Raised when an operation's precondition does not hold: closing a closed
// event, reading history before it was loaded, and so on.
class InvalidStateError : public std::logic_error {
  public:
    explicit InvalidStateError(const std::string &what) : std::logic_error(what) {}
};

}  // namespace sewerflow
