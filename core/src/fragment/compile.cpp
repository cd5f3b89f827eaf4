#include "sqlfrag/compile.h"

#include <unordered_map>

#include "fragment_builder.h"

namespace sqlfrag {

CompiledFragment::CompiledFragment(std::shared_ptr<const Plan> plan) : plan_(std::move(plan)) {}

const std::vector<std::string>& CompiledFragment::slot_names() const {
  return plan_->names;
}

Fragment CompiledFragment::operator()(const NamedArgs& args) const {
  const Plan& plan = *plan_;
  std::vector<const Arg*> supplied(plan.names.size(), nullptr);
  for (size_t i = 0; i < plan.names.size(); ++i) {
    auto it = args.find(plan.names[i]);
    if (it != args.end()) supplied[i] = &it->second;
  }

  FragmentBuilder out;
  out.reserve(plan.fixed.size() + plan.occurrences.size());
  SlotResolver resolver(args);
  size_t cursor = 0;
  for (const auto& occurrence : plan.occurrences) {
    out.append_parts(plan.fixed.begin() + cursor, plan.fixed.begin() + occurrence.fixed_end);
    cursor = occurrence.fixed_end;
    const std::string& name = plan.names[occurrence.name_index];
    const Arg* arg = supplied[occurrence.name_index];
    if (arg == nullptr) {
      out.append_slot(name);
    } else {
      resolver.resolve_into(out, name, *arg);
    }
  }
  out.append_parts(plan.fixed.begin() + cursor, plan.fixed.end());
  return out.build();
}

CompiledFragment compile(const Fragment& fragment) {
  auto plan = std::make_shared<CompiledFragment::Plan>();
  std::unordered_map<std::string, size_t> name_index;
  for (const auto& part : fragment.parts()) {
    if (!std::holds_alternative<Slot>(part)) {
      plan->fixed.push_back(part);
      continue;
    }
    const auto& name = std::get<Slot>(part).name;
    auto it = name_index.find(name);
    if (it == name_index.end()) {
      it = name_index.emplace(name, plan->names.size()).first;
      plan->names.push_back(name);
    }
    plan->occurrences.push_back({plan->fixed.size(), it->second});
  }
  return CompiledFragment(std::move(plan));
}

}  // namespace sqlfrag
