#include <rxml/accessors.hpp>
#include <rxml/errors.hpp>
#include <rxml/traversal.hpp>

#include <algorithm>

namespace rxml {

  namespace {

    // Picks the first candidate that belongs to the active chain, else the
    // first candidate. Without a chain this is plain first-match access.
    template <typename Node, typename Result>
    class scoped_policy : public traversal_policy<Node, Result> {
      const std::vector<Node*>* chain_;

    public:
      explicit scoped_policy(const std::vector<Node*>* chain) : chain_(chain) {}

      Node*
      on_ambiguous(const std::vector<Node*>& candidates) override {
        if (chain_ != nullptr) {
          for (Node* candidate : candidates) {
            if (std::find(chain_->begin(), chain_->end(), candidate) !=
                chain_->end()) {
              return candidate;
            }
          }
        }
        return candidates.front();
      }
    };

    template <typename Result>
    class reading_policy : public scoped_policy<const element, Result> {
    public:
      using scoped_policy<const element, Result>::scoped_policy;

      const element*
      on_missing_root(const qname&) override {
        return nullptr;
      }

      const element*
      on_missing_child(const qname&, const element&) override {
        return nullptr;
      }
    };

    class text_reader final : public reading_policy<std::string> {
    public:
      using reading_policy::reading_policy;

      std::string
      on_finish(const element& node,
                const std::optional<qname>& attribute) override {
        if (!attribute) { return node.text(); }
        const auto* value = node.find_attribute(*attribute);
        return value != nullptr ? *value : std::string{};
      }
    };

    class element_finder final : public reading_policy<const element*> {
    public:
      using reading_policy::reading_policy;

      const element*
      on_finish(const element& node,
                const std::optional<qname>& attribute) override {
        if (attribute) {
          throw path_kind_error("expected reference to element, but "
                                "attribute '" +
                                attribute->str() + "' given");
        }
        return &node;
      }
    };

    // True when any element reached from `node` by the remaining steps
    // matches; repeated siblings are all searched.
    bool
    exists_below(const element& node, const resolved_path& path,
                 std::size_t step) {
      if (step == path.elements.size()) {
        return !path.attribute ||
               node.find_attribute(*path.attribute) != nullptr;
      }
      for (const element* child : node.children_named(path.elements[step])) {
        if (exists_below(*child, path, step + 1)) { return true; }
      }
      return false;
    }

    // Creates what is missing. New elements carry the namespace bindings
    // of the path that created them.
    template <typename Result>
    class writing_policy : public scoped_policy<element, Result> {
      document& doc_;
      const prefix_map& namespaces_;

    protected:
      element&
      declare(element& created) const {
        for (const auto& [prefix, uri] : namespaces_) {
          created.declare_namespace(prefix, uri);
        }
        return created;
      }

    public:
      writing_policy(document& doc, const prefix_map& namespaces,
                     const destination_context* chain)
          : scoped_policy<element, Result>(chain), doc_(doc),
            namespaces_(namespaces) {}

      element*
      on_missing_root(const qname& name) override {
        return &declare(doc_.create_root(name));
      }

      element*
      on_missing_child(const qname& name, element& current) override {
        return &declare(current.append_child(name));
      }
    };

    class text_writer final : public writing_policy<bool> {
      const std::string& value_;

    public:
      text_writer(document& doc, const prefix_map& namespaces,
                  const destination_context* chain, const std::string& value)
          : writing_policy(doc, namespaces, chain), value_(value) {}

      bool
      on_finish(element& node, const std::optional<qname>& attribute) override {
        if (attribute) {
          node.set_attribute(*attribute, value_);
        } else {
          node.set_text(value_);
        }
        return true;
      }
    };

    class element_builder final : public writing_policy<element*> {
    public:
      using writing_policy::writing_policy;

      element*
      on_finish(element& node, const std::optional<qname>& attribute) override {
        if (attribute) {
          throw path_kind_error("expected reference to element, but "
                                "attribute '" +
                                attribute->str() + "' given");
        }
        return &node;
      }
    };

    [[noreturn]] void
    throw_root_mismatch(const document& doc, const resolved_path& path) {
      throw path_error("path '" + path.text +
                       "' does not start at root element '" +
                       doc.root()->name().str() + "'");
    }

    void
    require_element_path(const resolved_path& path) {
      if (path.attribute) {
        throw path_kind_error("expected reference to element, but path '" +
                              path.text + "' names attribute '" +
                              path.attribute->str() + "'");
      }
      if (path.elements.empty()) {
        throw path_syntax_error("path '" + path.text +
                                "' does not specify an element");
      }
    }

    void
    write_text(document& doc, const resolved_path& path,
               const std::string& value, const destination_context* bases) {
      if (path.elements.empty()) {
        throw path_syntax_error("path '" + path.text +
                                "' does not specify an element to write");
      }
      text_writer writer(doc, path.namespaces, bases, value);
      if (!traverse(doc.root(), path, writer)) { throw_root_mismatch(doc, path); }
    }

  } // namespace

  std::string
  read_source(const element* root, const resolved_path& path) {
    text_reader reader(nullptr);
    return traverse(root, path, reader).value_or(std::string{});
  }

  std::string
  read_base_source(const element* root, const resolved_path& path,
                   const source_context& bases) {
    text_reader reader(&bases);
    return traverse(root, path, reader).value_or(std::string{});
  }

  void
  write_destination(document& doc, const resolved_path& path,
                    const std::string& value) {
    write_text(doc, path, value, nullptr);
  }

  void
  write_base_destination(document& doc, const resolved_path& path,
                         const std::string& value,
                         const destination_context& bases) {
    write_text(doc, path, value, &bases);
  }

  std::vector<const element*>
  read_ambiguous_elements(const element* root, const resolved_path& path,
                          const source_context& bases) {
    require_element_path(path);

    if (path.elements.size() == 1) {
      if (root != nullptr && root->name() == path.elements.front()) {
        return {root};
      }
      return {};
    }

    element_finder finder(&bases);
    auto parent = traverse(root, path.parent(), finder);
    if (!parent) { return {}; }
    return (*parent)->children_named(path.elements.back());
  }

  element&
  write_new_ambiguous_element(document& doc, const resolved_path& path,
                              const destination_context& bases) {
    require_element_path(path);

    element_builder builder(doc, path.namespaces, &bases);

    if (path.elements.size() == 1) {
      auto root = traverse(doc.root(), path, builder);
      if (!root) { throw_root_mismatch(doc, path); }
      return **root;
    }

    auto parent = traverse(doc.root(), path.parent(), builder);
    if (!parent) { throw_root_mismatch(doc, path); }

    element& created = (*parent)->append_child(path.elements.back());
    for (const auto& [prefix, uri] : path.namespaces) {
      created.declare_namespace(prefix, uri);
    }
    return created;
  }

  bool
  path_exists(const element* root, const resolved_path& path) {
    if (root == nullptr) { return false; }
    if (path.elements.empty()) { return exists_below(*root, path, 0); }
    if (root->name() != path.elements.front()) { return false; }
    return exists_below(*root, path, 1);
  }

} // namespace rxml
