#pragma once

#include <rxml/element.hpp>
#include <rxml/namespaces.hpp>

#include <set>
#include <string>

namespace rxml {

  // Throws required_path_error for the first path in `required` that does
  // not exist below `root`, then for the first path in `nonempty` that
  // reads as "". `filename` only decorates the message.
  void
  check_required(const element* root, const std::set<std::string>& required,
                 const std::set<std::string>& nonempty,
                 const namespace_table& namespaces,
                 const std::string& filename = {});

} // namespace rxml
