#include <rxml/run_metadata.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

namespace rxml {

  namespace {

    const std::string metadata_ns = "http://rxml.dev/metadata";

    bool
    is_whitespace_only(std::string_view sv) {
      return std::all_of(sv.begin(), sv.end(), [](char c) {
        return c == ' ' || c == '\n' || c == '\r' || c == '\t';
      });
    }

    bool
    read_skip_ws(xml_reader& reader) {
      while (reader.read()) {
        if (reader.node_type() == xml_node_type::characters &&
            is_whitespace_only(reader.text()))
          continue;
        return true;
      }
      return false;
    }

    bool
    is_start(const xml_reader& reader, const char* local) {
      return reader.node_type() == xml_node_type::start_element &&
             reader.name() == qname(metadata_ns, local);
    }

    bool
    is_end(const xml_reader& reader, const char* local) {
      return reader.node_type() == xml_node_type::end_element &&
             reader.name() == qname(metadata_ns, local);
    }

    std::string
    required_attribute(const xml_reader& reader, const char* name) {
      auto value = reader.attribute_value(qname(name));
      if (value.empty()) {
        throw std::runtime_error("run_metadata::load: <" +
                                 reader.name().local_name() +
                                 "> requires attribute '" + name +
                                 "' (line " + std::to_string(reader.line()) +
                                 ")");
      }
      return std::string(value);
    }

    // Leaves the reader on the end tag of an empty entry element.
    void
    close_entry(xml_reader& reader, const char* local) {
      if (!read_skip_ws(reader) || !is_end(reader, local)) {
        throw std::runtime_error("run_metadata::load: <" + std::string(local) +
                                 "> must be empty");
      }
    }

    void
    load_side(xml_reader& reader, const char* side,
              std::vector<namespace_binding>& namespaces,
              std::set<std::string>& required,
              std::set<std::string>& nonempty) {
      while (read_skip_ws(reader)) {
        if (is_end(reader, side)) { return; }

        if (is_start(reader, "namespace")) {
          namespace_binding binding;
          auto scope = reader.attribute_value(qname("scope"));
          if (!scope.empty()) { binding.scope = std::string(scope); }
          binding.prefix = std::string(reader.attribute_value(qname("prefix")));
          binding.uri = required_attribute(reader, "uri");
          namespaces.push_back(std::move(binding));
          close_entry(reader, "namespace");
        } else if (is_start(reader, "required")) {
          required.insert(required_attribute(reader, "path"));
          close_entry(reader, "required");
        } else if (is_start(reader, "nonempty")) {
          nonempty.insert(required_attribute(reader, "path"));
          close_entry(reader, "nonempty");
        } else {
          throw std::runtime_error(
              "run_metadata::load: unexpected content inside <" +
              std::string(side) + "> at line " +
              std::to_string(reader.line()));
        }
      }
      throw std::runtime_error("run_metadata::load: unterminated <" +
                               std::string(side) + ">");
    }

  } // namespace

  run_metadata
  run_metadata::load(xml_reader& reader) {
    if (!read_skip_ws(reader) || !is_start(reader, "metadata")) {
      throw std::runtime_error("run_metadata::load: expected <metadata> root "
                               "element in namespace " +
                               metadata_ns);
    }

    run_metadata result;
    auto encoding = reader.attribute_value(qname("encoding"));
    if (!encoding.empty()) { result.output_encoding = std::string(encoding); }

    while (read_skip_ws(reader)) {
      if (is_end(reader, "metadata")) { break; }

      if (is_start(reader, "input")) {
        load_side(reader, "input", result.input_namespaces,
                  result.input_required, result.input_nonempty);
      } else if (is_start(reader, "output")) {
        load_side(reader, "output", result.output_namespaces,
                  result.output_required, result.output_nonempty);
      } else {
        throw std::runtime_error(
            "run_metadata::load: unexpected content inside <metadata> at "
            "line " +
            std::to_string(reader.line()));
      }
    }

    spdlog::info("metadata: {} input and {} output namespace bindings, "
                 "{} required and {} non-empty input paths, encoding {}",
                 result.input_namespaces.size(),
                 result.output_namespaces.size(), result.input_required.size(),
                 result.input_nonempty.size(), result.output_encoding);
    return result;
  }

  void
  run_metadata::merge(const run_metadata& overrides) {
    input_required.insert(overrides.input_required.begin(),
                          overrides.input_required.end());
    input_nonempty.insert(overrides.input_nonempty.begin(),
                          overrides.input_nonempty.end());
    output_required.insert(overrides.output_required.begin(),
                           overrides.output_required.end());
    output_nonempty.insert(overrides.output_nonempty.begin(),
                           overrides.output_nonempty.end());
    input_namespaces.insert(input_namespaces.end(),
                            overrides.input_namespaces.begin(),
                            overrides.input_namespaces.end());
    output_namespaces.insert(output_namespaces.end(),
                             overrides.output_namespaces.begin(),
                             overrides.output_namespaces.end());
    if (overrides.output_encoding != run_metadata{}.output_encoding) {
      output_encoding = overrides.output_encoding;
    }
  }

} // namespace rxml
