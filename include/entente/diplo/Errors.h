#pragma once

#include "entente/core/Types.h"

#include <string>
#include <utility>

namespace entente::diplo {

// Failure taxonomy of every exposed operation. No exceptions cross the
// library boundary; callers branch on Result::error.
enum class DiploError : core::u8 {
  None                     = 0,
  NotFound                 = 1, // unknown faction / session / pair
  InsufficientParticipants = 2,
  TooManyParticipants      = 3,
  NotAParticipant          = 4,
  SessionClosed            = 5, // terminal (or just expired) negotiation
  ValidationError          = 6, // malformed overrides, out-of-range scalars
};

// Coarse classes for a wrapping transport layer (404 / 400 equivalents).
enum class DiploErrorClass : core::u8 {
  Ok         = 0,
  NotFound   = 1,
  BadRequest = 2,
};

const char* diploErrorName(DiploError e);
const char* diploErrorClassName(DiploErrorClass c);
DiploErrorClass diploErrorClass(DiploError e);

// Too few or too many negotiation participants.
inline bool isInvalidParticipants(DiploError e) {
  return e == DiploError::InsufficientParticipants || e == DiploError::TooManyParticipants;
}

template <class T>
struct Result {
  DiploError error{DiploError::None};
  std::string message;
  T value{};

  bool ok() const { return error == DiploError::None; }

  static Result success(T v) {
    Result r;
    r.value = std::move(v);
    return r;
  }

  static Result failure(DiploError e, std::string msg) {
    Result r;
    r.error = e;
    r.message = std::move(msg);
    return r;
  }
};

} // namespace entente::diplo
