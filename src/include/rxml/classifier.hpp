#pragma once

#include <rxml/path.hpp>
#include <rxml/rule.hpp>

#include <compare>
#include <cstddef>
#include <string>
#include <variant>
#include <vector>

namespace rxml {

  struct foreach_pair {
    std::string source_base;
    std::string destination_base;

    auto
    operator<=>(const foreach_pair&) const = default;

    bool
    operator==(const foreach_pair&) const = default;
  };

  // Execution position: explicit or assigned order first, declaration
  // sequence second.
  struct order_key {
    int order = 0;
    std::size_t sequence = 0;

    auto
    operator<=>(const order_key&) const = default;

    bool
    operator==(const order_key&) const = default;
  };

  struct basic_rule {
    const rule* definition = nullptr;
    order_key key;
  };

  struct foreach_rule_leaf {
    const rule* definition = nullptr;
    order_key key;
  };

  struct iteration_node;

  using program_node = std::variant<basic_rule, iteration_node, foreach_rule_leaf>;

  // One repetition level. Children are nested iteration levels and the
  // rules declared at this level.
  struct iteration_node {
    foreach_pair base;
    path_expression source_path;
    std::vector<program_node> children;
    order_key key;
  };

  struct classified_program {
    std::vector<program_node> nodes;
  };

  const order_key&
  key_of(const program_node& node);

  // Forest of iteration levels, one node per distinct pair. A pair nests
  // under the first node (in source-base order) whose source base is a
  // proper prefix of its own. Prefixes compare whole steps: `/a` contains
  // `/a/b` but not `/ab`.
  std::vector<program_node>
  build_iteration_forest(std::vector<foreach_pair> bases);

  // Splits validated rules into basic rules and the iteration forest and
  // sorts every sibling list by order key.
  classified_program
  classify(const rule_set& rules);

  // Recursively sorts `nodes` by order key. Iteration nodes take the
  // smallest key found in their subtree.
  void
  sort_program(std::vector<program_node>& nodes);

  // Rule names in the order they first execute.
  std::vector<std::string>
  execution_sequence(const classified_program& program);

} // namespace rxml
