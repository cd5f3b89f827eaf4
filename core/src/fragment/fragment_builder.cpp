#include "fragment_builder.h"

#include <utility>

namespace sqlfrag {

void FragmentBuilder::append_literal(const std::string& text) {
  if (text.empty()) return;
  if (!parts_.empty() && std::holds_alternative<LiteralText>(parts_.back())) {
    std::get<LiteralText>(parts_.back()).text += text;
    return;
  }
  parts_.push_back(LiteralText{text});
}

void FragmentBuilder::append_placeholder(std::shared_ptr<const Binding> binding) {
  parts_.push_back(Placeholder{std::move(binding)});
}

void FragmentBuilder::append_slot(const std::string& name) {
  parts_.push_back(Slot{name});
}

void FragmentBuilder::append_part(Part part) {
  if (std::holds_alternative<LiteralText>(part)) {
    append_literal(std::get<LiteralText>(part).text);
    return;
  }
  parts_.push_back(std::move(part));
}

void FragmentBuilder::append_parts(std::vector<Part>::const_iterator first,
                                   std::vector<Part>::const_iterator last) {
  if (first == last) return;
  append_part(*first);
  parts_.insert(parts_.end(), first + 1, last);
}

void FragmentBuilder::append_fragment(const Fragment& fragment) {
  const auto& parts = fragment.parts();
  append_parts(parts.begin(), parts.end());
}

Fragment FragmentBuilder::build() {
  return Fragment(std::make_shared<const std::vector<Part>>(std::move(parts_)));
}

std::shared_ptr<const Binding> make_binding(const std::string& name, Value value) {
  return std::make_shared<const Binding>(Binding{name, std::move(value)});
}

void SlotResolver::resolve_into(FragmentBuilder& out, const std::string& name, const Arg& arg) {
  if (!arg.is_fragment()) {
    bind_value(out, name, arg.value());
  } else if (fill_args_ != nullptr) {
    append_filled(out, arg.fragment());
  } else {
    out.append_fragment(arg.fragment());
  }
}

void SlotResolver::bind_value(FragmentBuilder& out, const std::string& name, const Value& value) {
  auto it = bindings_.find(name);
  if (it == bindings_.end()) {
    it = bindings_.emplace(name, make_binding(name, value)).first;
  }
  out.append_placeholder(it->second);
}

void SlotResolver::append_filled(FragmentBuilder& out, const Fragment& fragment) {
  for (const auto& part : fragment.parts()) {
    if (std::holds_alternative<Slot>(part)) {
      const auto& name = std::get<Slot>(part).name;
      auto it = fill_args_->find(name);
      if (it != fill_args_->end()) {
        if (it->second.is_fragment()) {
          out.append_fragment(it->second.fragment());
        } else {
          bind_value(out, name, it->second.value());
        }
        continue;
      }
    }
    out.append_part(part);
  }
}

}  // namespace sqlfrag
