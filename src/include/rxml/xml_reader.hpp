#pragma once

#include <rxml/qname.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace rxml {

  enum class xml_node_type {
    start_element,
    end_element,
    characters,
  };

  // Pull interface over a parsed event stream. Names are delivered with
  // their namespace URIs already resolved.
  class xml_reader {
  public:
    virtual ~xml_reader() = default;

    virtual bool
    read() = 0;

    virtual xml_node_type
    node_type() const = 0;

    virtual const qname&
    name() const = 0;

    virtual std::size_t
    attribute_count() const = 0;

    virtual const qname&
    attribute_name(std::size_t index) const = 0;

    virtual std::string_view
    attribute_value(std::size_t index) const = 0;

    virtual std::string_view
    attribute_value(const qname& name) const = 0;

    virtual std::string_view
    text() const = 0;

    virtual std::size_t
    depth() const = 0;

    virtual std::size_t
    line() const = 0;

    // (prefix, uri) pairs declared on the current start tag; the default
    // namespace has an empty prefix.
    virtual const std::vector<std::pair<std::string, std::string>>&
    namespace_declarations() const = 0;
  };

} // namespace rxml
