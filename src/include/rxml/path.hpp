#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rxml {

  // One step of a path as written, before namespace resolution.
  struct path_segment {
    std::string prefix;
    std::string local_name;

    bool
    operator==(const path_segment&) const = default;
  };

  // Parsed form of `/p:elem1/elem2[@p:attr]`: child steps only, at most one
  // trailing attribute.
  class path_expression {
    std::vector<path_segment> segments_;
    std::optional<path_segment> attribute_;

  public:
    path_expression() = default;

    path_expression(std::vector<path_segment> segments,
                    std::optional<path_segment> attribute)
        : segments_(std::move(segments)), attribute_(std::move(attribute)) {}

    const std::vector<path_segment>&
    segments() const {
      return segments_;
    }

    const std::optional<path_segment>&
    attribute() const {
      return attribute_;
    }

    bool
    names_attribute() const {
      return attribute_.has_value();
    }

    bool
    empty() const {
      return segments_.empty() && !attribute_;
    }

    // True if this path's element steps are a proper leading subsequence
    // of `other`'s element steps. Attributes do not take part.
    bool
    is_strict_prefix_of(const path_expression& other) const;

    // Element steps of this path are a leading subsequence of `segments`.
    bool
    is_prefix_of(const std::vector<path_segment>& segments) const;

    // The path without its last element step and without any attribute.
    path_expression
    parent() const;

    std::string
    str() const;

    bool
    operator==(const path_expression&) const = default;
  };

  // Throws path_syntax_error on more than one '@', a segment with more than
  // one ':', or an empty name.
  path_expression
  parse_path(std::string_view text);

} // namespace rxml
