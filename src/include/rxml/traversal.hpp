#pragma once

#include <rxml/namespaces.hpp>
#include <rxml/qname.hpp>

#include <optional>
#include <vector>

namespace rxml {

  // Decisions taken while walking a resolved path through a document.
  // `Node` is `const element` for readers and `element` for writers;
  // `Result` is what on_finish produces for the node the path ends at.
  template <typename Node, typename Result>
  class traversal_policy {
  public:
    virtual ~traversal_policy() = default;

    // The document has no root yet. Return the new root, or nullptr to
    // abort the walk.
    virtual Node*
    on_missing_root(const qname& name) = 0;

    // More than one child matches the next step. Must return one of them.
    virtual Node*
    on_ambiguous(const std::vector<Node*>& candidates) = 0;

    // No child of `current` matches `name`. Return the node to continue
    // with, or nullptr to abort the walk.
    virtual Node*
    on_missing_child(const qname& name, Node& current) = 0;

    // The walk consumed every element step and stopped at `node`.
    // `attribute` is the trailing attribute step, if the path has one.
    virtual Result
    on_finish(Node& node, const std::optional<qname>& attribute) = 0;
  };

  // Walks `path` from `root` (which may be null) step by step. Returns the
  // finish result, or nullopt when a policy aborted the walk or the root
  // element does not match the first step.
  template <typename Node, typename Result>
  std::optional<Result>
  traverse(Node* root, const resolved_path& path,
           traversal_policy<Node, Result>& policy) {
    const auto& steps = path.elements;

    Node* current = root;
    std::size_t first = 0;

    if (!steps.empty()) {
      if (current == nullptr) {
        current = policy.on_missing_root(steps.front());
        if (current == nullptr) { return std::nullopt; }
      } else if (current->name() != steps.front()) {
        return std::nullopt;
      }
      first = 1;
    } else if (current == nullptr) {
      return std::nullopt;
    }

    for (std::size_t i = first; i < steps.size(); ++i) {
      auto candidates = current->children_named(steps[i]);
      if (candidates.empty()) {
        current = policy.on_missing_child(steps[i], *current);
        if (current == nullptr) { return std::nullopt; }
      } else if (candidates.size() == 1) {
        current = candidates.front();
      } else {
        current = policy.on_ambiguous(candidates);
      }
    }

    return policy.on_finish(*current, path.attribute);
  }

} // namespace rxml
