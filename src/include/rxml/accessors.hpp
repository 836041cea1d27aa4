#pragma once

#include <rxml/element.hpp>
#include <rxml/namespaces.hpp>

#include <string>
#include <vector>

namespace rxml {

  // Chains of the iteration anchors currently active, outermost first.
  // They only steer the choice between repeated siblings.
  using source_context = std::vector<const element*>;
  using destination_context = std::vector<element*>;

  // Text of the element, or value of the attribute, at `path`; the first
  // candidate wins where siblings repeat. A missing path reads as "".
  std::string
  read_source(const element* root, const resolved_path& path);

  // Like read_source, preferring candidates that are in `bases`.
  std::string
  read_base_source(const element* root, const resolved_path& path,
                   const source_context& bases);

  // Stores `value` as text or attribute value at `path`, creating the root
  // and any missing element on the way. Throws path_error if the document
  // root does not match the path.
  void
  write_destination(document& doc, const resolved_path& path,
                    const std::string& value);

  // Like write_destination, preferring candidates that are in `bases`.
  void
  write_base_destination(document& doc, const resolved_path& path,
                         const std::string& value,
                         const destination_context& bases);

  // Every element at `path` below the parent selected through `bases`, in
  // document order. Throws path_kind_error if `path` names an attribute.
  std::vector<const element*>
  read_ambiguous_elements(const element* root, const resolved_path& path,
                          const source_context& bases);

  // Appends a new element for the last step of `path` below the parent
  // selected through `bases`, creating missing ancestors. A single-step
  // path denotes the root, which is created once and reused afterwards.
  element&
  write_new_ambiguous_element(document& doc, const resolved_path& path,
                              const destination_context& bases);

  // Whether the element (and attribute, if named) at `path` exists.
  bool
  path_exists(const element* root, const resolved_path& path);

} // namespace rxml
