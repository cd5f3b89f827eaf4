#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "sqlfrag/fragment.h"

namespace sqlfrag {

/// Reusable substitution plan for a fragment's open slots.
/// MUST produce the same fragment as fill() for the same arguments.
/// Fixed parts are copied in runs; each distinct slot name is looked up once per call.
class CompiledFragment {
 public:
  /// Substitutes the named values; names not supplied stay open slots.
  Fragment operator()(const NamedArgs& args) const;

  /// Distinct slot names in first-occurrence order.
  const std::vector<std::string>& slot_names() const;

 private:
  friend CompiledFragment compile(const Fragment& fragment);

  struct Occurrence {
    size_t fixed_end = 0;
    size_t name_index = 0;
  };
  struct Plan {
    std::vector<Part> fixed;
    std::vector<Occurrence> occurrences;
    std::vector<std::string> names;
  };

  explicit CompiledFragment(std::shared_ptr<const Plan> plan);

  std::shared_ptr<const Plan> plan_;
};

/// Fully rendered query text with reserved marker positions for its open slots.
/// MUST keep text() and every slot's marker index fixed across calls.
class PreparedQuery {
 public:
  /// Query text with every marker already numbered.
  const std::string& text() const;
  /// Distinct slot names in marker order.
  std::vector<std::string> slot_names() const;
  /// 1-based marker index reserved for a slot, or 0 if the name is not a slot.
  size_t marker_for(const std::string& slot_name) const;

  /// Produces the full ordered value list for one execution.
  /// Throws UnfilledSlotError naming the first missing slot and CompositionError
  /// when a slot is given a fragment. Keys that name no slot are ignored.
  std::vector<Value> operator()(const NamedArgs& args) const;

 private:
  friend PreparedQuery prepare(const Fragment& fragment);

  struct SlotMarker {
    std::string name;
    size_t index = 0;
  };
  struct Shape {
    std::string text;
    std::vector<Value> baked;
    std::vector<SlotMarker> slots;
  };

  explicit PreparedQuery(std::shared_ptr<const Shape> shape);

  std::shared_ptr<const Shape> shape_;
};

}  // namespace sqlfrag
