#include "sqlfrag/fragment.h"

#include <unordered_set>

#include "fragment_builder.h"

namespace sqlfrag {

std::vector<Value> Query::args() const {
  std::vector<Value> out;
  out.reserve(values.size() + 1);
  out.emplace_back(text);
  out.insert(out.end(), values.begin(), values.end());
  return out;
}

Fragment::Fragment() : parts_(std::make_shared<const std::vector<Part>>()) {}

Fragment::Fragment(std::vector<Part> parts) {
  FragmentBuilder out;
  out.reserve(parts.size());
  for (auto& part : parts) {
    out.append_part(std::move(part));
  }
  parts_ = out.build().parts_;
}

Fragment::Fragment(std::shared_ptr<const std::vector<Part>> parts) : parts_(std::move(parts)) {}

std::vector<std::string> Fragment::slot_names() const {
  std::vector<std::string> out;
  std::unordered_set<std::string> seen;
  for (const auto& part : *parts_) {
    if (!std::holds_alternative<Slot>(part)) continue;
    const auto& name = std::get<Slot>(part).name;
    if (seen.insert(name).second) out.push_back(name);
  }
  return out;
}

Fragment Fragment::join(const std::vector<Fragment>& parts) const {
  FragmentBuilder out;
  for (size_t i = 0; i < parts.size(); ++i) {
    if (i != 0) out.append_fragment(*this);
    out.append_fragment(parts[i]);
  }
  return out.build();
}

std::vector<Value> Fragment::args() const {
  return render(*this).args();
}

}  // namespace sqlfrag
