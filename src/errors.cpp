// ============================================================================
// errors.cpp : implementation for errors.hpp
// ============================================================================

#include "orbcomm/errors.hpp"

namespace orbcomm {

const char* to_token(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::NONE:              return "none";
    case ErrorKind::UNKNOWN_ACTION:    return "unknown_action";
    case ErrorKind::NO_RESPONSE:       return "no_response";
    case ErrorKind::EXECUTION_ERROR:   return "execution_error";
    case ErrorKind::AMBIGUOUS_OUTCOME: return "ambiguous_outcome";
    case ErrorKind::TRANSPORT_ERROR:   return "transport_error";
  }
  return "transport_error";
}

std::optional<ErrorKind> error_from_token(std::string_view token) {
  if (token == "none")              return ErrorKind::NONE;
  if (token == "unknown_action")    return ErrorKind::UNKNOWN_ACTION;
  if (token == "no_response")       return ErrorKind::NO_RESPONSE;
  if (token == "execution_error")   return ErrorKind::EXECUTION_ERROR;
  if (token == "ambiguous_outcome") return ErrorKind::AMBIGUOUS_OUTCOME;
  if (token == "transport_error")   return ErrorKind::TRANSPORT_ERROR;
  return std::nullopt;
}

int exit_code_for(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::NONE:              return 0;
    case ErrorKind::UNKNOWN_ACTION:    return 2;   // same as a usage error
    case ErrorKind::NO_RESPONSE:       return 3;
    case ErrorKind::AMBIGUOUS_OUTCOME: return 4;
    case ErrorKind::EXECUTION_ERROR:   return 5;
    case ErrorKind::TRANSPORT_ERROR:   return 1;
  }
  return 1;
}

} // namespace orbcomm
