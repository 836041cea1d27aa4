#pragma once

#include <rxml/rule.hpp>

namespace rxml {

  // Checks the declared shape of one rule. Throws the matching
  // definition_error subclass, or path_syntax_error for unparsable bases.
  void
  validate_rule(const rule& r);

  // Validates every rule before anything runs; the first violation aborts.
  void
  validate_rules(const rule_set& rules);

} // namespace rxml
