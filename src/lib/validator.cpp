#include <rxml/errors.hpp>
#include <rxml/path.hpp>
#include <rxml/validator.hpp>

#include <string>

namespace rxml {

  void
  validate_rule(const rule& r) {
    if (!r.metadata) {
      throw missing_destination_error(
          "function " + r.name +
          " is considered to be a rule, but it requires at least a "
          "destination declaration");
    }

    if (!r.implementation) {
      throw definition_error("rule " + r.name + " has no implementation");
    }

    const auto& meta = *r.metadata;
    if (meta.destinations.size() != 1) {
      throw destination_count_error(
          "a rule must have exactly 1 destination. " + r.name + " has " +
          std::to_string(meta.destinations.size()));
    }

    if (!meta.foreach) { return; }

    const auto& pairs = *meta.foreach;
    if (pairs.empty()) {
      throw foreach_arity_error("a foreach rule requires at least one "
                                "(source base, destination base) pair. " +
                                r.name + " has 0");
    }

    for (const auto& pair : pairs) {
      if (pair.size() != 2) {
        throw foreach_arity_error(
            "foreach must have exactly two arguments. " + r.name + " has " +
            std::to_string(pair.size()));
      }
    }

    // Each outer source base must be a proper prefix of the next inner one.
    for (std::size_t i = 1; i < pairs.size(); ++i) {
      auto outer = parse_path(pairs[i - 1][0]);
      auto inner = parse_path(pairs[i][0]);
      if (!outer.is_strict_prefix_of(inner)) {
        throw foreach_nesting_error("outer foreach source base '" +
                                    pairs[i - 1][0] +
                                    "' must be prefix of inner foreach "
                                    "source base '" +
                                    pairs[i][0] + "' in rule " + r.name);
      }
    }
  }

  void
  validate_rules(const rule_set& rules) {
    for (const auto& r : rules.rules()) {
      validate_rule(r);
    }
  }

} // namespace rxml
