#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace rxml {

  // Positional source values in, optional destination value out. An empty
  // result means "write nothing".
  using rule_fn =
      std::function<std::optional<std::string>(const std::vector<std::string>&)>;

  struct rule_metadata {
    // Source paths, in the order the implementation expects its arguments.
    std::vector<std::string> sources;
    std::vector<std::string> destinations;
    // (source base, destination base) pairs, outermost first. Unset for
    // rules that do not repeat.
    std::optional<std::vector<std::vector<std::string>>> foreach;
    std::optional<int> order;
  };

  struct rule {
    std::string name;
    std::optional<rule_metadata> metadata;
    rule_fn implementation;
  };

  // Rules of one mapping, kept in registration order.
  class rule_set {
    std::vector<rule> rules_;

  public:
    rule_set() = default;

    // Throws duplicate_rule_error if a rule with the same name exists.
    void
    add(rule r);

    // Shorthand for a rule with metadata.
    void
    add(std::string name, rule_metadata metadata, rule_fn implementation);

    const rule*
    find(const std::string& name) const;

    const std::vector<rule>&
    rules() const {
      return rules_;
    }

    std::size_t
    size() const {
      return rules_.size();
    }

    bool
    empty() const {
      return rules_.empty();
    }
  };

} // namespace rxml
