#pragma once

#include <rxml/qname.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace rxml {

  class xml_writer {
  public:
    virtual ~xml_writer() = default;

    virtual void
    start_element(const qname& name) = 0;

    virtual void
    end_element() = 0;

    virtual void
    attribute(const qname& name, std::string_view value) = 0;

    virtual void
    characters(std::string_view text) = 0;

    virtual void
    namespace_declaration(std::string_view prefix, std::string_view uri) = 0;

    // Whether `prefix` is currently bound to `uri`. The unbound default
    // prefix counts as bound to the empty URI.
    virtual bool
    in_scope(std::string_view prefix, std::string_view uri) const = 0;

    // A prefix in scope for `uri`, if any. Attributes cannot use the
    // default namespace.
    virtual std::optional<std::string>
    prefix_for(std::string_view uri, bool for_attribute) const = 0;
  };

} // namespace rxml
