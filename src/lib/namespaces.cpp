#include <rxml/errors.hpp>
#include <rxml/namespaces.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace rxml {

  namespace {

    const std::string global_scope = "/";

    // A scope step without a prefix matches any step with the same local
    // name; a prefixed scope step must match exactly.
    bool
    scope_matches(const path_expression& scope,
                  const std::vector<path_segment>& segments) {
      const auto& steps = scope.segments();
      if (steps.size() > segments.size()) { return false; }
      return std::equal(
          steps.begin(), steps.end(), segments.begin(),
          [](const path_segment& step, const path_segment& seg) {
            return step.local_name == seg.local_name &&
                   (step.prefix.empty() || step.prefix == seg.prefix);
          });
    }

  } // namespace

  namespace_table::namespace_table()
      : namespace_table(std::vector<namespace_binding>{}) {}

  namespace_table::namespace_table(
      const std::vector<namespace_binding>& bindings) {
    bool xml_found = false;

    for (auto binding : bindings) {
      if (binding.prefix == "xmlns") {
        spdlog::error("namespace prefix 'xmlns' is illegal, binding to '{}' "
                      "removed",
                      binding.uri);
        continue;
      }
      if (binding.prefix == "xml") {
        spdlog::warn("namespace prefix 'xml' is predefined");
        if (binding.uri != xml_namespace_uri) {
          spdlog::warn("non-standard URI '{}' for prefix 'xml' replaced",
                       binding.uri);
          binding.uri = xml_namespace_uri;
        }
      }

      auto scope = parse_path(binding.scope);
      if (binding.prefix == "xml" && scope.segments().empty()) {
        xml_found = true;
      }
      entries_.push_back({std::move(scope), std::move(binding)});
    }

    if (!xml_found) {
      entries_.push_back({path_expression{},
                          namespace_binding{global_scope, "xml",
                                            xml_namespace_uri}});
    }
  }

  prefix_map
  namespace_table::resolve(const std::vector<path_segment>& segments) const {
    prefix_map result;
    for (const auto& e : entries_) {
      if (scope_matches(e.scope, segments)) {
        result[e.binding.prefix] = e.binding.uri;
      }
    }
    result["xml"] = xml_namespace_uri;
    return result;
  }

  std::vector<namespace_binding>
  namespace_table::bindings() const {
    std::vector<namespace_binding> out;
    out.reserve(entries_.size());
    for (const auto& e : entries_) {
      out.push_back(e.binding);
    }
    return out;
  }

  qname
  qualify(const std::string& prefix, const std::string& local,
          const prefix_map& namespaces, name_kind kind) {
    if (prefix.empty()) {
      if (kind == name_kind::attribute) { return qname{local}; }
      auto it = namespaces.find(prefix);
      if (it == namespaces.end() || it->second.empty()) {
        return qname{local};
      }
      return qname{it->second, local};
    }

    auto it = namespaces.find(prefix);
    if (it == namespaces.end()) {
      throw unknown_namespace_error("unknown namespace prefix '" + prefix +
                                    "' in name '" + prefix + ':' + local +
                                    "'");
    }
    return qname{it->second, local};
  }

  resolved_path
  resolved_path::parent() const {
    resolved_path out;
    out.elements = elements;
    if (!out.elements.empty()) { out.elements.pop_back(); }
    out.namespaces = namespaces;
    std::string base = text;
    if (attribute) { base = base.substr(0, base.rfind("/@")); }
    auto slash = base.rfind('/');
    out.text = slash == std::string::npos || slash == 0
                   ? std::string("/")
                   : base.substr(0, slash);
    return out;
  }

  resolved_path
  resolve_path(const path_expression& path, const namespace_table& table) {
    resolved_path out;
    out.text = path.str();
    out.namespaces = table.resolve(path.segments());

    try {
      for (const auto& seg : path.segments()) {
        out.elements.push_back(
            qualify(seg.prefix, seg.local_name, out.namespaces));
      }
      if (path.attribute()) {
        out.attribute = qualify(path.attribute()->prefix,
                                path.attribute()->local_name, out.namespaces,
                                name_kind::attribute);
      }
    } catch (const unknown_namespace_error& e) {
      throw unknown_namespace_error(std::string(e.what()) + " of path '" +
                                    out.text + "'");
    }
    return out;
  }

  resolved_path
  resolve_path(std::string_view path, const namespace_table& table) {
    return resolve_path(parse_path(path), table);
  }

} // namespace rxml
