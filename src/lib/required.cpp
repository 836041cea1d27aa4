#include <rxml/accessors.hpp>
#include <rxml/errors.hpp>
#include <rxml/required.hpp>

namespace rxml {

  void
  check_required(const element* root, const std::set<std::string>& required,
                 const std::set<std::string>& nonempty,
                 const namespace_table& namespaces,
                 const std::string& filename) {
    std::string suffix;
    if (!filename.empty()) { suffix = " in XML file '" + filename + "'"; }

    for (const auto& path : required) {
      if (!path_exists(root, resolve_path(path, namespaces))) {
        throw required_path_error("path " + path + " does not exist" + suffix,
                                  path, filename);
      }
    }

    for (const auto& path : nonempty) {
      if (read_source(root, resolve_path(path, namespaces)).empty()) {
        throw required_path_error(
            "path " + path + " is empty" + suffix + "; must contain value",
            path, filename);
      }
    }
  }

} // namespace rxml
