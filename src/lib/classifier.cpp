#include <rxml/classifier.hpp>

#include <algorithm>
#include <limits>
#include <set>
#include <stdexcept>
#include <type_traits>

namespace rxml {

  namespace {

    // Bases are compared in canonical form, so `r/a` and `/r/a/` name the
    // same level.
    foreach_pair
    to_pair(const std::vector<std::string>& declared) {
      return foreach_pair{parse_path(declared.at(0)).str(),
                          parse_path(declared.at(1)).str()};
    }

    iteration_node*
    find_iteration(std::vector<program_node>& nodes, const foreach_pair& base) {
      for (auto& node : nodes) {
        auto* iteration = std::get_if<iteration_node>(&node);
        if (iteration == nullptr) { continue; }
        if (iteration->base == base) { return iteration; }
        if (auto* found = find_iteration(iteration->children, base)) {
          return found;
        }
      }
      return nullptr;
    }

    // Smallest key below an iteration level; levels without rules sort last.
    order_key
    subtree_key(const iteration_node& node) {
      order_key best{std::numeric_limits<int>::max(),
                     std::numeric_limits<std::size_t>::max()};
      for (const auto& child : node.children) {
        best = std::min(best, key_of(child));
      }
      return best;
    }

    void
    collect_names(const std::vector<program_node>& nodes,
                  std::vector<std::string>& out) {
      for (const auto& node : nodes) {
        std::visit(
            [&out](const auto& n) {
              using T = std::decay_t<decltype(n)>;
              if constexpr (std::is_same_v<T, iteration_node>) {
                collect_names(n.children, out);
              } else {
                if (std::find(out.begin(), out.end(), n.definition->name) ==
                    out.end()) {
                  out.push_back(n.definition->name);
                }
              }
            },
            node);
      }
    }

  } // namespace

  const order_key&
  key_of(const program_node& node) {
    return std::visit([](const auto& n) -> const order_key& { return n.key; },
                      node);
  }

  std::vector<program_node>
  build_iteration_forest(std::vector<foreach_pair> bases) {
    for (auto& base : bases) {
      base = to_pair({base.source_base, base.destination_base});
    }
    std::sort(bases.begin(), bases.end());
    bases.erase(std::unique(bases.begin(), bases.end()), bases.end());

    std::vector<program_node> forest;

    for (auto& base : bases) {
      auto source_path = parse_path(base.source_base);
      std::vector<program_node>* level = &forest;

      bool added = false;
      while (!added) {
        iteration_node* parent = nullptr;
        for (auto& node : *level) {
          auto* iteration = std::get_if<iteration_node>(&node);
          if (iteration != nullptr &&
              iteration->source_path.is_strict_prefix_of(source_path)) {
            parent = iteration;
            break;
          }
        }

        if (parent != nullptr) {
          level = &parent->children;
          continue;
        }

        iteration_node created;
        created.base = std::move(base);
        created.source_path = std::move(source_path);
        level->emplace_back(std::move(created));
        added = true;
      }
    }

    return forest;
  }

  classified_program
  classify(const rule_set& rules) {
    // Explicit orders win; the rest follow the highest explicit order in
    // declaration order.
    int max_order = 0;
    for (const auto& r : rules.rules()) {
      if (r.metadata && r.metadata->order) {
        max_order = std::max(max_order, *r.metadata->order);
      }
    }

    std::vector<order_key> keys;
    keys.reserve(rules.size());
    for (std::size_t i = 0; i < rules.size(); ++i) {
      const auto& meta = rules.rules()[i].metadata;
      int order = meta && meta->order ? *meta->order : ++max_order;
      keys.push_back(order_key{order, i});
    }

    classified_program program;
    std::vector<foreach_pair> bases;

    for (std::size_t i = 0; i < rules.size(); ++i) {
      const auto& r = rules.rules()[i];
      if (!r.metadata) {
        throw std::invalid_argument("classify: rule " + r.name +
                                    " has not been validated");
      }
      if (!r.metadata->foreach) {
        program.nodes.emplace_back(basic_rule{&r, keys[i]});
        continue;
      }
      for (const auto& declared : *r.metadata->foreach) {
        bases.push_back(to_pair(declared));
      }
    }

    auto forest = build_iteration_forest(std::move(bases));

    for (std::size_t i = 0; i < rules.size(); ++i) {
      const auto& r = rules.rules()[i];
      if (!r.metadata->foreach) { continue; }

      auto innermost = to_pair(r.metadata->foreach->back());
      auto* level = find_iteration(forest, innermost);
      if (level == nullptr) {
        throw std::logic_error("classify: no iteration level for '" +
                               innermost.source_base + "'");
      }
      level->children.emplace_back(foreach_rule_leaf{&r, keys[i]});
    }

    for (auto& root : forest) {
      program.nodes.push_back(std::move(root));
    }

    sort_program(program.nodes);
    return program;
  }

  void
  sort_program(std::vector<program_node>& nodes) {
    for (auto& node : nodes) {
      if (auto* iteration = std::get_if<iteration_node>(&node)) {
        sort_program(iteration->children);
        iteration->key = subtree_key(*iteration);
      }
    }
    std::stable_sort(nodes.begin(), nodes.end(),
                     [](const program_node& a, const program_node& b) {
                       return key_of(a) < key_of(b);
                     });
  }

  std::vector<std::string>
  execution_sequence(const classified_program& program) {
    std::vector<std::string> out;
    collect_names(program.nodes, out);
    return out;
  }

} // namespace rxml
