#include "sqlfrag/fragment.h"

#include <unordered_map>
#include <unordered_set>

#include "sqlfrag/errors.h"
#include "util/string_util.h"

namespace sqlfrag {

Query render(const Fragment& fragment) {
  Query out;
  std::unordered_map<const Binding*, size_t> markers;
  for (const auto& part : fragment.parts()) {
    if (std::holds_alternative<LiteralText>(part)) {
      out.text += std::get<LiteralText>(part).text;
      continue;
    }
    if (std::holds_alternative<Slot>(part)) {
      throw UnfilledSlotError(std::get<Slot>(part).name);
    }
    const Binding* binding = std::get<Placeholder>(part).binding.get();
    auto it = markers.find(binding);
    if (it == markers.end()) {
      out.values.push_back(binding->value);
      it = markers.emplace(binding, out.values.size()).first;
    }
    out.text += "$" + std::to_string(it->second);
  }
  return out;
}

NamedQuery render_named(const Fragment& fragment) {
  NamedQuery out;
  std::unordered_map<const Binding*, std::string> keys;
  std::unordered_set<std::string> seen_slots;
  std::string text;
  for (const auto& part : fragment.parts()) {
    if (std::holds_alternative<LiteralText>(part)) {
      text += std::get<LiteralText>(part).text;
      continue;
    }
    if (std::holds_alternative<Slot>(part)) {
      const auto& name = std::get<Slot>(part).name;
      if (seen_slots.insert(name).second) out.slots.push_back(name);
      text += "(:" + name + ")";
      continue;
    }
    const Binding* binding = std::get<Placeholder>(part).binding.get();
    auto it = keys.find(binding);
    if (it == keys.end()) {
      std::string key = "_arg_" + binding->name + "_" + std::to_string(out.bindings.size());
      out.bindings.emplace_back(key, binding->value);
      it = keys.emplace(binding, std::move(key)).first;
    }
    text += "(:" + it->second + ")";
  }
  out.text = util::trim_ws(text);
  return out;
}

}  // namespace sqlfrag
