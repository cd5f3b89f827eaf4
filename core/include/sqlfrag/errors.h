#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace sqlfrag {

/// Classifies every failure the engine can raise.
/// MUST remain stable because diagnostics map kinds to codes.
enum class ErrorKind {
  Syntax,
  Arity,
  UnfilledSlot,
  Type,
  Composition,
  Value,
};

/// Base of all engine exceptions; raised synchronously at the offending call.
class Error : public std::runtime_error {
 public:
  Error(ErrorKind kind, const std::string& message);
  ErrorKind kind() const { return kind_; }

 private:
  ErrorKind kind_;
};

/// Malformed template: unmatched brace or invalid marker name.
/// position() is the 0-based byte offset of the offending brace.
class SyntaxError : public Error {
 public:
  SyntaxError(const std::string& message, size_t position);
  size_t position() const { return position_; }

 private:
  size_t position_;
};

/// Positional argument count mismatch, or unnest row/column mismatch.
class ArityError : public Error {
 public:
  explicit ArityError(const std::string& message);
};

/// A named slot was still open when values had to be produced.
class UnfilledSlotError : public Error {
 public:
  explicit UnfilledSlotError(const std::string& slot_name);
  const std::string& slot_name() const { return slot_name_; }

 private:
  std::string slot_name_;
};

/// A value of an unsupported type reached escape(), or a fragment reached a
/// prepared query.
class TypeError : public Error {
 public:
  TypeError(const std::string& message, const std::string& type_name);
  const std::string& type_name() const { return type_name_; }

 protected:
  TypeError(ErrorKind kind, const std::string& message, const std::string& type_name);

 private:
  std::string type_name_;
};

/// A fragment was supplied for a slot whose marker positions are already fixed.
class CompositionError : public TypeError {
 public:
  explicit CompositionError(const std::string& slot_name);
  const std::string& slot_name() const { return slot_name_; }

 private:
  std::string slot_name_;
};

/// A value of a supported type that has no SQL literal form (NaN, infinity).
class ValueError : public Error {
 public:
  explicit ValueError(const std::string& message);
};

/// Returns the stable lowercase name of an error kind ("syntax", "arity", ...).
const char* error_kind_name(ErrorKind kind);

}  // namespace sqlfrag
