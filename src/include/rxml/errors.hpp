#pragma once

#include <stdexcept>
#include <string>

namespace rxml {

  // Base of every error raised by the mapping engine.
  class error : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
  };

  // A rule is declared in a shape the engine cannot execute. Raised before
  // any rule runs.
  class definition_error : public error {
  public:
    using error::error;
  };

  class missing_destination_error : public definition_error {
  public:
    using definition_error::definition_error;
  };

  class destination_count_error : public definition_error {
  public:
    using definition_error::definition_error;
  };

  class foreach_arity_error : public definition_error {
  public:
    using definition_error::definition_error;
  };

  class foreach_nesting_error : public definition_error {
  public:
    using definition_error::definition_error;
  };

  class duplicate_rule_error : public definition_error {
  public:
    using definition_error::definition_error;
  };

  // A path cannot be parsed, resolved or applied.
  class path_error : public error {
  public:
    using error::error;
  };

  class path_syntax_error : public path_error {
  public:
    using path_error::path_error;
  };

  class unknown_namespace_error : public path_error {
  public:
    using path_error::path_error;
  };

  // An element was requested where the path names an attribute, or the
  // other way round.
  class path_kind_error : public path_error {
  public:
    using path_error::path_error;
  };

  // A required path is missing or a non-empty path is empty.
  class required_path_error : public error {
    std::string path_;
    std::string filename_;

  public:
    required_path_error(const std::string& what, std::string path,
                        std::string filename)
        : error(what), path_(std::move(path)), filename_(std::move(filename)) {}

    const std::string&
    path() const {
      return path_;
    }

    const std::string&
    filename() const {
      return filename_;
    }
  };

} // namespace rxml
