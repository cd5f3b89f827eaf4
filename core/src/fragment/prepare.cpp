#include "sqlfrag/compile.h"

#include <unordered_map>

#include "sqlfrag/errors.h"

namespace sqlfrag {

PreparedQuery::PreparedQuery(std::shared_ptr<const Shape> shape) : shape_(std::move(shape)) {}

const std::string& PreparedQuery::text() const {
  return shape_->text;
}

std::vector<std::string> PreparedQuery::slot_names() const {
  std::vector<std::string> out;
  out.reserve(shape_->slots.size());
  for (const auto& slot : shape_->slots) {
    out.push_back(slot.name);
  }
  return out;
}

size_t PreparedQuery::marker_for(const std::string& slot_name) const {
  for (const auto& slot : shape_->slots) {
    if (slot.name == slot_name) return slot.index;
  }
  return 0;
}

std::vector<Value> PreparedQuery::operator()(const NamedArgs& args) const {
  std::vector<Value> out = shape_->baked;
  for (const auto& slot : shape_->slots) {
    auto it = args.find(slot.name);
    if (it == args.end()) {
      throw UnfilledSlotError(slot.name);
    }
    if (it->second.is_fragment()) {
      throw CompositionError(slot.name);
    }
    out[slot.index - 1] = it->second.value();
  }
  return out;
}

PreparedQuery prepare(const Fragment& fragment) {
  auto shape = std::make_shared<PreparedQuery::Shape>();
  std::unordered_map<const Binding*, size_t> binding_markers;
  std::unordered_map<std::string, size_t> slot_markers;
  for (const auto& part : fragment.parts()) {
    if (std::holds_alternative<LiteralText>(part)) {
      shape->text += std::get<LiteralText>(part).text;
      continue;
    }
    size_t marker = 0;
    if (std::holds_alternative<Slot>(part)) {
      const auto& name = std::get<Slot>(part).name;
      auto it = slot_markers.find(name);
      if (it == slot_markers.end()) {
        // Reserved position; overwritten with the call-time value.
        shape->baked.emplace_back();
        it = slot_markers.emplace(name, shape->baked.size()).first;
        shape->slots.push_back({name, it->second});
      }
      marker = it->second;
    } else {
      const Binding* binding = std::get<Placeholder>(part).binding.get();
      auto it = binding_markers.find(binding);
      if (it == binding_markers.end()) {
        shape->baked.push_back(binding->value);
        it = binding_markers.emplace(binding, shape->baked.size()).first;
      }
      marker = it->second;
    }
    shape->text += "$" + std::to_string(marker);
  }
  return PreparedQuery(std::move(shape));
}

}  // namespace sqlfrag
