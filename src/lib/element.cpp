#include <rxml/element.hpp>
#include <rxml/expat_reader.hpp>
#include <rxml/namespaces.hpp>
#include <rxml/xml_reader.hpp>
#include <rxml/xml_writer.hpp>

#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace rxml {

  element::element(xml_reader& reader) : name_(reader.name()) {
    for (std::size_t i = 0; i < reader.attribute_count(); ++i) {
      attributes_.push_back(
          {reader.attribute_name(i), std::string(reader.attribute_value(i))});
    }
    for (const auto& [prefix, uri] : reader.namespace_declarations()) {
      declare_namespace(prefix, uri);
    }

    std::size_t start_depth = reader.depth();
    while (reader.read()) {
      switch (reader.node_type()) {
        case xml_node_type::start_element:
          children_.push_back(std::make_unique<element>(reader));
          break;
        case xml_node_type::characters:
          if (children_.empty()) { text_ += reader.text(); }
          break;
        case xml_node_type::end_element:
          if (reader.depth() == start_depth) { return; }
          break;
      }
    }
    throw std::runtime_error("unexpected end of input while parsing element '" +
                             name_.str() + "'");
  }

  const std::string*
  element::find_attribute(const qname& name) const {
    auto it = std::find_if(
        attributes_.begin(), attributes_.end(),
        [&name](const element_attribute& a) { return a.name == name; });
    return it == attributes_.end() ? nullptr : &it->value;
  }

  void
  element::set_attribute(const qname& name, std::string value) {
    for (auto& attr : attributes_) {
      if (attr.name == name) {
        attr.value = std::move(value);
        return;
      }
    }
    attributes_.push_back({name, std::move(value)});
  }

  std::vector<element*>
  element::children_named(const qname& name) {
    std::vector<element*> out;
    for (auto& child : children_) {
      if (child->name() == name) { out.push_back(child.get()); }
    }
    return out;
  }

  std::vector<const element*>
  element::children_named(const qname& name) const {
    std::vector<const element*> out;
    for (const auto& child : children_) {
      if (child->name() == name) { out.push_back(child.get()); }
    }
    return out;
  }

  element&
  element::append_child(qname name) {
    children_.push_back(std::make_unique<element>(std::move(name)));
    return *children_.back();
  }

  void
  element::declare_namespace(std::string prefix, std::string uri) {
    if (prefix == "xml" || prefix == "xmlns") { return; }
    for (auto& ns : namespaces_) {
      if (ns.first == prefix) {
        ns.second = std::move(uri);
        return;
      }
    }
    namespaces_.emplace_back(std::move(prefix), std::move(uri));
  }

  namespace {

    void
    write_element(const element& elem, xml_writer& writer, int& counter) {
      writer.start_element(elem.name());

      for (const auto& [prefix, uri] : elem.namespaces()) {
        if (!writer.in_scope(prefix, uri)) {
          writer.namespace_declaration(prefix, uri);
        }
      }

      // Declare generated prefixes for URIs nothing has bound yet.
      auto ensure = [&](const qname& name, bool for_attribute) {
        const auto& uri = name.namespace_uri();
        if (uri.empty()) {
          if (!for_attribute && !writer.in_scope("", "")) {
            writer.namespace_declaration("", "");
          }
          return;
        }
        if (writer.prefix_for(uri, for_attribute)) { return; }
        std::string pfx;
        do {
          pfx = "ns" + std::to_string(counter++);
        } while (std::any_of(
            elem.namespaces().begin(), elem.namespaces().end(),
            [&pfx](const auto& ns) { return ns.first == pfx; }));
        writer.namespace_declaration(pfx, uri);
      };

      ensure(elem.name(), false);
      for (const auto& attr : elem.attributes()) {
        ensure(attr.name, true);
      }

      for (const auto& attr : elem.attributes()) {
        writer.attribute(attr.name, attr.value);
      }

      writer.characters(elem.text());

      for (const auto& child : elem.children()) {
        write_element(*child, writer, counter);
      }

      writer.end_element();
    }

  } // namespace

  void
  element::write(xml_writer& writer) const {
    int counter = 0;
    write_element(*this, writer, counter);
  }

  element&
  document::create_root(qname name) {
    if (root_) {
      throw std::logic_error("document already has root element '" +
                             root_->name().str() + "'");
    }
    root_ = std::make_unique<element>(std::move(name));
    return *root_;
  }

  document
  read_document(xml_reader& reader) {
    while (reader.read()) {
      if (reader.node_type() == xml_node_type::start_element) {
        return document{std::make_unique<element>(reader)};
      }
    }
    throw std::runtime_error("XML document has no root element");
  }

  document
  parse_document(std::string_view xml) {
    expat_reader reader(xml);
    return read_document(reader);
  }

  void
  write_document(const document& doc, std::ostream& os,
                 const writer_options& options) {
    if (doc.empty()) {
      throw std::runtime_error("cannot write a document without root element");
    }
    ostream_writer writer(os, options);
    doc.root()->write(writer);
  }

  std::string
  to_string(const document& doc, const writer_options& options) {
    std::ostringstream os;
    write_document(doc, os, options);
    return os.str();
  }

} // namespace rxml
