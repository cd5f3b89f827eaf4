#include "sqlfrag/errors.h"

namespace sqlfrag {

Error::Error(ErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

SyntaxError::SyntaxError(const std::string& message, size_t position)
    : Error(ErrorKind::Syntax, message), position_(position) {}

ArityError::ArityError(const std::string& message) : Error(ErrorKind::Arity, message) {}

UnfilledSlotError::UnfilledSlotError(const std::string& slot_name)
    : Error(ErrorKind::UnfilledSlot, "Unfilled slot: '" + slot_name + "'"),
      slot_name_(slot_name) {}

TypeError::TypeError(const std::string& message, const std::string& type_name)
    : TypeError(ErrorKind::Type, message, type_name) {}

TypeError::TypeError(ErrorKind kind, const std::string& message, const std::string& type_name)
    : Error(kind, message), type_name_(type_name) {}

CompositionError::CompositionError(const std::string& slot_name)
    : TypeError(ErrorKind::Composition,
                "Cannot splice a fragment into prepared slot '" + slot_name +
                    "': marker positions are already fixed",
                "fragment"),
      slot_name_(slot_name) {}

ValueError::ValueError(const std::string& message) : Error(ErrorKind::Value, message) {}

const char* error_kind_name(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::Syntax:
      return "syntax";
    case ErrorKind::Arity:
      return "arity";
    case ErrorKind::UnfilledSlot:
      return "unfilled_slot";
    case ErrorKind::Type:
      return "type";
    case ErrorKind::Composition:
      return "composition";
    case ErrorKind::Value:
      return "value";
  }
  return "unknown";
}

}  // namespace sqlfrag
