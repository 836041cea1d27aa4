#pragma once

#include <rxml/path.hpp>
#include <rxml/qname.hpp>

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rxml {

  inline const std::string xml_namespace_uri =
      "http://www.w3.org/XML/1998/namespace";

  // Binds `prefix` to `uri` for every path that starts with `scope`. A
  // scope of "/" is global; an empty prefix is the default namespace.
  struct namespace_binding {
    std::string scope = "/";
    std::string prefix;
    std::string uri;

    bool
    operator==(const namespace_binding&) const = default;
  };

  // Prefix -> URI in effect for one path.
  using prefix_map = std::map<std::string, std::string>;

  enum class name_kind {
    element,
    attribute,
  };

  // Normalized binding table for one side (source or destination) of a
  // run. `xml` bindings are forced to the XML namespace, `xmlns` bindings
  // are dropped and a global `xml` binding is always present.
  class namespace_table {
    struct entry {
      path_expression scope;
      namespace_binding binding;
    };

    std::vector<entry> entries_;

  public:
    namespace_table();

    explicit namespace_table(const std::vector<namespace_binding>& bindings);

    // Bindings whose scope is a prefix of `segments`, later bindings
    // overriding earlier ones for the same prefix.
    prefix_map
    resolve(const std::vector<path_segment>& segments) const;

    std::vector<namespace_binding>
    bindings() const;
  };

  // "{uri}local" when `prefix` resolves; unqualified when it is empty and
  // no default namespace applies (attributes never take the default).
  // Throws unknown_namespace_error otherwise.
  qname
  qualify(const std::string& prefix, const std::string& local,
          const prefix_map& namespaces, name_kind kind = name_kind::element);

  // A path with every step qualified against a namespace table.
  struct resolved_path {
    std::vector<qname> elements;
    std::optional<qname> attribute;
    prefix_map namespaces;
    std::string text;

    // Same path without its last element step.
    resolved_path
    parent() const;
  };

  resolved_path
  resolve_path(const path_expression& path, const namespace_table& table);

  resolved_path
  resolve_path(std::string_view path, const namespace_table& table);

} // namespace rxml
