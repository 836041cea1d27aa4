#pragma once

#include <rxml/ostream_writer.hpp>
#include <rxml/qname.hpp>

#include <memory>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace rxml {

  class xml_reader;
  class xml_writer;

  struct element_attribute {
    qname name;
    std::string value;

    bool
    operator==(const element_attribute&) const = default;
  };

  // Mutable document node. Child elements are owned through unique_ptr so
  // their addresses stay valid while siblings are appended.
  class element {
    qname name_;
    std::vector<element_attribute> attributes_;
    std::string text_;
    std::vector<std::unique_ptr<element>> children_;
    std::vector<std::pair<std::string, std::string>> namespaces_;

  public:
    explicit element(qname name) : name_(std::move(name)) {}

    // Builds the subtree of the start_element the reader is positioned on.
    // Only character data before the first child element is kept as text.
    explicit element(xml_reader& reader);

    element(const element&) = delete;
    element&
    operator=(const element&) = delete;

    const qname&
    name() const {
      return name_;
    }

    const std::string&
    text() const {
      return text_;
    }

    void
    set_text(std::string text) {
      text_ = std::move(text);
    }

    const std::vector<element_attribute>&
    attributes() const {
      return attributes_;
    }

    // nullptr when the attribute is absent.
    const std::string*
    find_attribute(const qname& name) const;

    void
    set_attribute(const qname& name, std::string value);

    const std::vector<std::unique_ptr<element>>&
    children() const {
      return children_;
    }

    // Direct children called `name`, in document order.
    std::vector<element*>
    children_named(const qname& name);

    std::vector<const element*>
    children_named(const qname& name) const;

    element&
    append_child(qname name);

    // Namespace declarations to emit on this element when written.
    const std::vector<std::pair<std::string, std::string>>&
    namespaces() const {
      return namespaces_;
    }

    void
    declare_namespace(std::string prefix, std::string uri);

    void
    write(xml_writer& writer) const;
  };

  class document {
    std::unique_ptr<element> root_;

  public:
    document() = default;

    explicit document(std::unique_ptr<element> root) : root_(std::move(root)) {}

    bool
    empty() const {
      return root_ == nullptr;
    }

    element*
    root() {
      return root_.get();
    }

    const element*
    root() const {
      return root_.get();
    }

    // Throws std::logic_error if the document already has a root.
    element&
    create_root(qname name);
  };

  document
  read_document(xml_reader& reader);

  // Parses `xml` with expat. Throws std::runtime_error on malformed input.
  document
  parse_document(std::string_view xml);

  // Throws std::runtime_error for a document without root element.
  void
  write_document(const document& doc, std::ostream& os,
                 const writer_options& options = {});

  std::string
  to_string(const document& doc, const writer_options& options = {});

} // namespace rxml
