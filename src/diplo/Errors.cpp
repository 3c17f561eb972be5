#include "entente/diplo/Errors.h"

namespace entente::diplo {

const char* diploErrorName(DiploError e) {
  switch (e) {
    case DiploError::None: return "None";
    case DiploError::NotFound: return "NotFound";
    case DiploError::InsufficientParticipants: return "InsufficientParticipants";
    case DiploError::TooManyParticipants: return "TooManyParticipants";
    case DiploError::NotAParticipant: return "NotAParticipant";
    case DiploError::SessionClosed: return "SessionClosed";
    case DiploError::ValidationError: return "ValidationError";
  }
  return "Unknown";
}

const char* diploErrorClassName(DiploErrorClass c) {
  switch (c) {
    case DiploErrorClass::Ok: return "Ok";
    case DiploErrorClass::NotFound: return "NotFound";
    case DiploErrorClass::BadRequest: return "BadRequest";
  }
  return "Unknown";
}

DiploErrorClass diploErrorClass(DiploError e) {
  switch (e) {
    case DiploError::None:
      return DiploErrorClass::Ok;
    case DiploError::NotFound:
      return DiploErrorClass::NotFound;
    case DiploError::InsufficientParticipants:
    case DiploError::TooManyParticipants:
    case DiploError::NotAParticipant:
    case DiploError::SessionClosed:
    case DiploError::ValidationError:
      return DiploErrorClass::BadRequest;
  }
  return DiploErrorClass::BadRequest;
}

} // namespace entente::diplo
