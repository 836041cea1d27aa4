#pragma once

#include <rxml/namespaces.hpp>
#include <rxml/xml_reader.hpp>

#include <set>
#include <string>
#include <vector>

namespace rxml {

  // Everything a mapping needs besides its rules.
  struct run_metadata {
    std::set<std::string> input_required;
    std::set<std::string> input_nonempty;
    std::set<std::string> output_required;
    std::set<std::string> output_nonempty;
    std::vector<namespace_binding> input_namespaces;
    std::vector<namespace_binding> output_namespaces;
    std::string output_encoding = "utf-8";

    // Reads a <metadata> document in namespace http://rxml.dev/metadata.
    static run_metadata
    load(xml_reader& reader);

    // Unions the path sets, appends the bindings and takes a non-default
    // encoding from `overrides`.
    void
    merge(const run_metadata& overrides);
  };

} // namespace rxml
