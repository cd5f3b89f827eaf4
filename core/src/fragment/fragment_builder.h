#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "sqlfrag/fragment.h"

namespace sqlfrag {

/// Accumulates parts for a new fragment, splicing sub-fragments flat.
/// MUST merge adjacent literal runs so the result is already normalized.
class FragmentBuilder {
 public:
  void append_literal(const std::string& text);
  void append_placeholder(std::shared_ptr<const Binding> binding);
  void append_slot(const std::string& name);
  void append_part(Part part);
  void append_parts(std::vector<Part>::const_iterator first, std::vector<Part>::const_iterator last);
  void append_fragment(const Fragment& fragment);
  void reserve(size_t count) { parts_.reserve(count); }
  /// Publishes the accumulated parts without a second normalization pass.
  Fragment build();

 private:
  std::vector<Part> parts_;
};

std::shared_ptr<const Binding> make_binding(const std::string& name, Value value);

/// Shares one binding per slot name within a single sql/fill/compile call.
/// MUST resolve fragment arguments by splicing and plain values by placeholder.
/// When built over a fill mapping, slots inside a spliced fragment are resolved
/// from the same mapping, one level deep: fragments found there splice as-is.
class SlotResolver {
 public:
  SlotResolver() = default;
  explicit SlotResolver(const NamedArgs& fill_args) : fill_args_(&fill_args) {}

  void resolve_into(FragmentBuilder& out, const std::string& name, const Arg& arg);

 private:
  void bind_value(FragmentBuilder& out, const std::string& name, const Value& value);
  void append_filled(FragmentBuilder& out, const Fragment& fragment);

  const NamedArgs* fill_args_ = nullptr;
  std::unordered_map<std::string, std::shared_ptr<const Binding>> bindings_;
};

}  // namespace sqlfrag
