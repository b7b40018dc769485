#pragma once
#include <ostream>
#include <stdexcept>
#include <string>
#include <utility>

namespace f1uc {

// Base of every error the engine reports to its caller.
class Error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// A request field is malformed or out of range. Never retried.
class ValidationError : public Error {
public:
  ValidationError(std::string field, const std::string& reason)
    : Error("invalid field '" + field + "': " + reason), field_(std::move(field)) {}

  const std::string& field() const noexcept { return field_; }

private:
  std::string field_;
};

// Querying historical data or live race state failed.
class UpstreamDataError : public Error {
public:
  using Error::Error;
};

// Process exit codes of the command-line front end.
inline constexpr int kExitFailure = 1;
inline constexpr int kExitValidation = 2;
inline constexpr int kExitUpstream = 3;

// Call from inside a catch block: writes the message of the exception in flight
// to `err` and returns the exit code for its type (kExitFailure for anything
// that is not a ValidationError or UpstreamDataError).
int report_current_exception(std::ostream& err);

} // namespace f1uc
