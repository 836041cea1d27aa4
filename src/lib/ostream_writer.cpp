#include <rxml/namespaces.hpp>
#include <rxml/ostream_writer.hpp>

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace rxml {

  struct ostream_writer::impl {
    std::ostream& os;
    writer_options options;
    bool declaration_written = false;

    // Prefix -> namespace URI for the bindings currently in scope.
    std::unordered_map<std::string, std::string> bindings;

    // start_element() buffers the tag; namespace_declaration() and
    // attribute() accumulate onto it until content or end_element() flushes.
    bool tag_pending = false;
    qname pending_name;

    struct pending_attr {
      qname name;
      std::string value;
    };

    std::vector<pending_attr> pending_attrs;

    struct pending_ns {
      std::string prefix;
      std::string uri;
    };

    std::vector<pending_ns> pending_ns_decls;

    struct element_frame {
      qname name;
      bool has_text = false;
      bool has_elements = false;
      // Each entry: (prefix, previous URI or nullopt if it was unbound).
      std::vector<std::pair<std::string, std::optional<std::string>>> ns_undo;
    };

    std::vector<element_frame> stack;

    impl(std::ostream& os, writer_options options)
        : os(os), options(options) {}

    std::optional<std::string>
    prefix_for(std::string_view uri, bool for_attribute) const {
      if (uri == xml_namespace_uri) { return std::string("xml"); }
      for (const auto& [prefix, bound] : bindings) {
        if (bound != uri) { continue; }
        if (for_attribute && prefix.empty()) { continue; }
        return prefix;
      }
      return std::nullopt;
    }

    void
    write_name(const qname& name, bool for_attribute) {
      if (name.qualified()) {
        auto prefix = prefix_for(name.namespace_uri(), for_attribute);
        if (!prefix) {
          throw std::runtime_error("ostream_writer: no prefix declared for "
                                   "namespace '" +
                                   name.namespace_uri() + "'");
        }
        if (!prefix->empty()) { os << *prefix << ':'; }
      }
      os << name.local_name();
    }

    void
    newline_indent(std::size_t depth) {
      os << '\n';
      for (std::size_t i = 0; i < depth; ++i) {
        os << "  ";
      }
    }

    void
    flush_pending_tag() {
      if (!tag_pending) { return; }
      tag_pending = false;

      os << '<';
      write_name(pending_name, false);

      for (const auto& ns : pending_ns_decls) {
        if (ns.prefix.empty()) {
          os << " xmlns=\"";
        } else {
          os << " xmlns:" << ns.prefix << "=\"";
        }
        escape_attribute(os, ns.uri, options.charset);
        os << '"';
      }

      for (const auto& attr : pending_attrs) {
        os << ' ';
        write_name(attr.name, true);
        os << "=\"";
        escape_attribute(os, attr.value, options.charset);
        os << '"';
      }

      pending_ns_decls.clear();
      pending_attrs.clear();
    }

    void
    flush_and_close_tag() {
      if (tag_pending) {
        flush_pending_tag();
        os << '>';
      }
    }
  };

  ostream_writer::ostream_writer(std::ostream& os, writer_options options)
      : impl_(std::make_unique<impl>(os, options)) {}

  ostream_writer::~ostream_writer() = default;
  ostream_writer::ostream_writer(ostream_writer&&) noexcept = default;
  ostream_writer&
  ostream_writer::operator=(ostream_writer&&) noexcept = default;

  void
  ostream_writer::start_element(const qname& name) {
    if (!impl_->declaration_written) {
      impl_->declaration_written = true;
      if (impl_->options.declaration) {
        impl_->os << "<?xml version='1.0' encoding='"
                  << charset_name(impl_->options.charset) << "'?>\n";
      }
    }

    impl_->flush_and_close_tag();

    if (!impl_->stack.empty()) {
      auto& parent = impl_->stack.back();
      parent.has_elements = true;
      if (impl_->options.pretty && !parent.has_text) {
        impl_->newline_indent(impl_->stack.size());
      }
    }

    impl_->stack.push_back({name, false, false, {}});
    impl_->tag_pending = true;
    impl_->pending_name = name;
  }

  void
  ostream_writer::end_element() {
    if (impl_->stack.empty()) {
      throw std::logic_error("ostream_writer: end_element without open element");
    }

    if (impl_->tag_pending) {
      impl_->flush_pending_tag();
      impl_->os << "/>";
    } else {
      const auto& frame = impl_->stack.back();
      if (impl_->options.pretty && frame.has_elements && !frame.has_text) {
        impl_->newline_indent(impl_->stack.size() - 1);
      }
      impl_->os << "</";
      impl_->write_name(frame.name, false);
      impl_->os << '>';
    }

    auto frame = std::move(impl_->stack.back());
    impl_->stack.pop_back();

    // Restore bindings shadowed by this element's declarations, newest first.
    for (auto it = frame.ns_undo.rbegin(); it != frame.ns_undo.rend(); ++it) {
      if (it->second.has_value()) {
        impl_->bindings[it->first] = std::move(*it->second);
      } else {
        impl_->bindings.erase(it->first);
      }
    }

    if (impl_->stack.empty() && impl_->options.pretty) { impl_->os << '\n'; }
  }

  void
  ostream_writer::attribute(const qname& name, std::string_view value) {
    impl_->pending_attrs.push_back({name, std::string(value)});
  }

  void
  ostream_writer::characters(std::string_view text) {
    if (text.empty()) { return; }
    impl_->flush_and_close_tag();
    if (!impl_->stack.empty()) { impl_->stack.back().has_text = true; }
    escape_text(impl_->os, text, impl_->options.charset);
  }

  void
  ostream_writer::namespace_declaration(std::string_view prefix,
                                        std::string_view uri) {
    if (impl_->stack.empty() || !impl_->tag_pending) {
      throw std::logic_error(
          "ostream_writer: namespace_declaration outside a start tag");
    }

    std::string prefix_str(prefix);

    auto it = impl_->bindings.find(prefix_str);
    std::optional<std::string> prev = it != impl_->bindings.end()
                                          ? std::optional(it->second)
                                          : std::nullopt;
    impl_->stack.back().ns_undo.emplace_back(prefix_str, std::move(prev));
    impl_->bindings[prefix_str] = std::string(uri);

    impl_->pending_ns_decls.push_back({std::move(prefix_str), std::string(uri)});
  }

  bool
  ostream_writer::in_scope(std::string_view prefix,
                           std::string_view uri) const {
    auto it = impl_->bindings.find(std::string(prefix));
    if (it == impl_->bindings.end()) { return prefix.empty() && uri.empty(); }
    return it->second == uri;
  }

  std::optional<std::string>
  ostream_writer::prefix_for(std::string_view uri, bool for_attribute) const {
    return impl_->prefix_for(uri, for_attribute);
  }

} // namespace rxml
