#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#include "sqlfrag/value.h"

namespace sqlfrag {

class Arg;
class CompiledFragment;
class FragmentBuilder;
class PreparedQuery;

/// Maps slot/marker names to arguments. Keys are unique by construction.
using NamedArgs = std::unordered_map<std::string, Arg>;

/// A bound value shared by every Placeholder that refers to it.
/// MUST be immutable once published; identity decides marker sharing at render time.
struct Binding {
  std::string name;
  Value value;
};

/// Raw SQL text, emitted verbatim.
struct LiteralText {
  std::string text;
};

/// A bound value awaiting its `$n` marker.
struct Placeholder {
  std::shared_ptr<const Binding> binding;
};

/// An unresolved named reference.
struct Slot {
  std::string name;
};

using Part = std::variant<LiteralText, Placeholder, Slot>;

/// Final output of rendering: query text plus its ordered bind values.
struct Query {
  std::string text;
  std::vector<Value> values;

  /// Returns text followed by every value, for drivers taking one flat argument list.
  std::vector<Value> args() const;
};

/// Immutable ordered sequence of Parts.
/// MUST never hold a nested Fragment: sub-fragments are spliced in on construction.
/// Copies share the underlying Part sequence.
class Fragment {
 public:
  Fragment();
  /// Builds a fragment from parts, merging adjacent literals and dropping empty ones.
  explicit Fragment(std::vector<Part> parts);

  const std::vector<Part>& parts() const { return *parts_; }
  bool empty() const { return parts_->empty(); }
  /// Returns distinct open slot names in first-occurrence order.
  std::vector<std::string> slot_names() const;

  /// Resolves the slots named in args; other slots stay open and unknown keys are ignored.
  /// Every occurrence of one name binds to a single shared value.
  Fragment fill(const NamedArgs& args) const;
  /// Interleaves this fragment between consecutive parts.
  Fragment join(const std::vector<Fragment>& parts) const;
  /// Renders and returns text followed by every value.
  std::vector<Value> args() const;

 private:
  friend class FragmentBuilder;

  /// Adopts parts that are already normalized.
  explicit Fragment(std::shared_ptr<const std::vector<Part>> parts);

  std::shared_ptr<const std::vector<Part>> parts_;
};

/// A template argument: either a plain value (bound as a placeholder) or a
/// fragment (spliced in place). Resolved once, when the Arg is constructed.
class Arg {
 public:
  Arg(Fragment fragment) : data_(std::move(fragment)) {}
  Arg(Value value) : data_(std::move(value)) {}
  template <typename T,
            typename = std::enable_if_t<!std::is_same<std::decay_t<T>, Arg>::value &&
                                        !std::is_same<std::decay_t<T>, Value>::value &&
                                        !std::is_same<std::decay_t<T>, Fragment>::value &&
                                        std::is_constructible<Value, T&&>::value>>
  Arg(T&& v) : data_(Value(std::forward<T>(v))) {}

  bool is_fragment() const { return std::holds_alternative<Fragment>(data_); }
  const Fragment& fragment() const { return std::get<Fragment>(data_); }
  const Value& value() const { return std::get<Value>(data_); }

 private:
  std::variant<Value, Fragment> data_;
};

/// Builds a fragment from a template with `{}` positional and `{name}` named markers.
/// Named markers absent from `named` become open slots. `{{`/`}}` are literal braces.
/// Throws SyntaxError on malformed templates and ArityError when the positional
/// argument count differs from the number of `{}` markers.
Fragment sql(const std::string& tmpl,
             const std::vector<Arg>& positional = {},
             const NamedArgs& named = {});

/// Renders `$1`, `$2`, ... markers in first-emission order.
/// Throws UnfilledSlotError naming the first open slot.
Query render(const Fragment& fragment);

/// Output of render_named: text with `(:key)` parameters for name-binding drivers.
struct NamedQuery {
  std::string text;
  std::vector<std::pair<std::string, Value>> bindings;
  std::vector<std::string> slots;
};

/// Renders bound values as `(:_arg_<name>_<k>)` and open slots as `(:<name>)`.
/// Open slots are not an error here; they are listed in `slots` for the driver.
NamedQuery render_named(const Fragment& fragment);

/// Precomputes the fragment's shape for repeated slot substitution.
CompiledFragment compile(const Fragment& fragment);
/// Freezes marker positions for every bound value and open slot.
PreparedQuery prepare(const Fragment& fragment);

}  // namespace sqlfrag
