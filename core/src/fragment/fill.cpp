#include "sqlfrag/fragment.h"

#include "fragment_builder.h"

namespace sqlfrag {

Fragment Fragment::fill(const NamedArgs& args) const {
  if (args.empty()) return *this;
  FragmentBuilder out;
  out.reserve(parts_->size());
  SlotResolver resolver(args);
  for (const auto& part : *parts_) {
    if (std::holds_alternative<Slot>(part)) {
      const auto& name = std::get<Slot>(part).name;
      auto it = args.find(name);
      if (it != args.end()) {
        resolver.resolve_into(out, name, it->second);
        continue;
      }
    }
    out.append_part(part);
  }
  return out.build();
}

}  // namespace sqlfrag
