#include <rxml/errors.hpp>
#include <rxml/rule.hpp>

#include <algorithm>

namespace rxml {

  void
  rule_set::add(rule r) {
    if (find(r.name) != nullptr) {
      throw duplicate_rule_error("rule '" + r.name +
                                 "' is defined multiple times");
    }
    rules_.push_back(std::move(r));
  }

  void
  rule_set::add(std::string name, rule_metadata metadata,
                rule_fn implementation) {
    add(rule{std::move(name), std::move(metadata), std::move(implementation)});
  }

  const rule*
  rule_set::find(const std::string& name) const {
    auto it = std::find_if(rules_.begin(), rules_.end(),
                           [&name](const rule& r) { return r.name == name; });
    return it == rules_.end() ? nullptr : &*it;
  }

} // namespace rxml
